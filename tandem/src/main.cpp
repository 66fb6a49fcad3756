#include "chess.hpp"
#include "options.hpp"
#include "search/search_algo.hpp"
#include "search/search_registry.hpp"
#include "time/uci_time.hpp"
#include "uci/output.hpp"
#include "uci/protocol.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace {

void send_id() {
    tandem::uci::send("id name Tandem");
    tandem::uci::send("id author Tandem developers");
    // Advertise configurable options
    for (const std::string &line : tandem::uciOptionLines()) tandem::uci::send(line);
}

std::string trim(const std::string &in) {
    const auto first = in.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = in.find_last_not_of(" \t\r\n");
    return in.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    for (char &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::unique_ptr<tandem::SearchAlgo> make_engine(tandem::Options &options, const tandem::TimeHandler *time_handler) {
    const std::string name = options.get("engine", std::string(tandem::searchRegistry().front().name));
    auto search = tandem::makeSearch(name, options, time_handler);
    if (search) return search;
    tandem::uci::infoString("warning unknown engine '" + name + "', using " +
                            std::string(tandem::searchRegistry().front().name));
    return tandem::searchRegistry().front().make(options, time_handler);
}

// A running search is asked to stop and then joined; it still prints its bestmove.
void stop_search(std::jthread &search_thread) {
    if (!search_thread.joinable()) return;
    search_thread.request_stop();
    search_thread.join();
}

} // namespace

int main(int argc, char **argv) {
    tandem::Options options;

    // Parse command-line options: --option key=value or -o key=value
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto set_kv = [&](const std::string &kv) {
            auto pos = kv.find('=');
            if (pos == std::string::npos) {
                options.set(kv, "");
            } else {
                options.set(kv.substr(0, pos), kv.substr(pos + 1));
            }
        };
        if (arg == "--option" || arg == "-o") {
            if (i + 1 < argc) {
                set_kv(argv[++i]);
            }
        } else if (arg.rfind("--option=", 0) == 0) {
            set_kv(arg.substr(std::string("--option=").size()));
        } else if (arg.rfind("-o=", 0) == 0) {
            set_kv(arg.substr(3));
        }
    }
    tandem::uci::setDebug(options.getBool("debug", false));

    // UCI time handler obeys go movetime/wtime/btime, etc.
    tandem::UciTimeHandler time_handler(static_cast<unsigned long long>(options.getInt("moveoverhead", 50)));
    std::unique_ptr<tandem::SearchAlgo> search = make_engine(options, &time_handler);
    std::atomic<bool> searching{false};
    std::jthread search_thread; // background search thread

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string raw;
    while (std::getline(std::cin, raw)) {
        const std::string line = trim(raw);
        if (line.empty()) continue;
        tandem::uci::debug("recv '" + line + "'");

        if (line == "uci") {
            send_id();
            tandem::uci::send("uciok");
        } else if (line == "isready") {
            tandem::uci::send("readyok");
        } else if (line.rfind("setoption", 0) == 0) {
            std::string name;
            std::string value;
            if (!tandem::uci::parseSetOption(line, name, value)) {
                tandem::uci::infoString("error malformed setoption");
                continue;
            }
            options.set(name, value);
            tandem::uci::setDebug(options.getBool("debug", false));
            time_handler.setMoveOverhead(static_cast<unsigned long long>(options.getInt("moveoverhead", 50)));
            if (lower(name) == "engine") {
                stop_search(search_thread);
                search = make_engine(options, &time_handler);
            }
        } else if (line == "ucinewgame") {
            stop_search(search_thread);
            search->onNewGame();
        } else if (line.rfind("position", 0) == 0) {
            stop_search(search_thread);
            if (tandem::Status st = search->handlePosition(line); !st) {
                tandem::uci::infoString("error " + st.message);
            }
        } else if (line.rfind("go", 0) == 0) {
            stop_search(search_thread);
            tandem::Limits limits;
            if (tandem::Status st = tandem::uci::parseGo(line, limits); !st) {
                tandem::uci::infoString("error " + st.message);
                tandem::uci::send("bestmove 0000");
                continue;
            }
            searching.store(true);
            // Run search on a separate thread so main loop remains responsive
            tandem::SearchAlgo *algo = search.get();
            search_thread = std::jthread([algo, limits, &searching](std::stop_token st) {
                const std::string best = algo->go(limits, st);
                tandem::uci::send("bestmove " + best);
                searching.store(false);
            });
        } else if (line == "stop") {
            // Outside a search the answer is the deterministic default move.
            const bool was_searching = searching.load();
            stop_search(search_thread);
            if (!was_searching) tandem::uci::send("bestmove " + search->bestMoveNow());
        } else if (line == "quit") {
            stop_search(search_thread);
            search->onQuit();
            break;
        } else if (line == "options") {
            // Non-standard debug helper: print all options as key=value (keys are stored lowercase)
            options.forEach([](const std::string &k, const std::string &v) {
                tandem::uci::send(k + '=' + v);
            });
        } else if (line == "print") {
            // helper for debugging
            std::ostringstream oss;
            oss << search->getBoard();
            tandem::uci::send(oss.str());
            tandem::uci::send("Fen: " + search->getBoard().getFen());
        } else {
            tandem::uci::debug("ignored '" + line + "'");
        }
    }

    stop_search(search_thread);
    return 0;
}
