#include "chess.hpp"
#include "bridge/uci_bridge.hpp"
#include "uci/protocol.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "Usage: tandem_bridge [--engine-cmd CMD] [--fen FEN] [--moves 'm1 m2 ...'] [--side white|black]\n";
    std::cerr << "                     [--depth N] [--rollouts N] [--movetime MS] [--new-game]\n";
    std::cerr << "                     [--selfplay] [--max-plies N] [--debug]\n";
    std::cerr << "                     [--handshake-timeout MS] [--ready-timeout MS]\n";
    std::cerr << "Example: tandem_bridge --engine-cmd ./tandem --depth 6 --rollouts 150\n";
}

std::optional<int> parseInt(const std::string &text) {
    int out = 0;
    const char *first = text.data();
    const char *last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return out;
}

const char *reasonName(chess::GameResultReason reason) {
    switch (reason) {
    case chess::GameResultReason::CHECKMATE: return "checkmate";
    case chess::GameResultReason::STALEMATE: return "stalemate";
    case chess::GameResultReason::INSUFFICIENT_MATERIAL: return "insufficient_material";
    case chess::GameResultReason::FIFTY_MOVE_RULE: return "fifty_move_rule";
    case chess::GameResultReason::THREEFOLD_REPETITION: return "threefold_repetition";
    case chess::GameResultReason::NONE: return "none";
    }
    return "none";
}

void emit(const tandem_bridge::json &j) {
    std::cout << j.dump() << '\n' << std::flush;
}

// Streams one request. Returns the bestmove text, or nullopt after an error event.
std::optional<std::string> runRequest(tandem_bridge::UciBridge &bridge, const tandem_bridge::GoRequest &request,
                                      const std::string &side, bool print_done) {
    std::optional<std::string> best;
    bool failed = false;
    for (const tandem_bridge::BridgeEvent &event : bridge.streamGo(request)) {
        switch (event.type) {
        case tandem_bridge::EventType::BestMove: {
            best = event.move();
            tandem_bridge::json j = event.toJson();
            if (!side.empty()) j["side"] = side;
            emit(j);
            break;
        }
        case tandem_bridge::EventType::Error:
            failed = true;
            emit(event.toJson());
            break;
        case tandem_bridge::EventType::Done:
            if (print_done) emit(event.toJson());
            break;
        case tandem_bridge::EventType::Info:
            emit(event.toJson());
            break;
        }
    }
    if (failed) return std::nullopt;
    return best;
}

int selfplay(tandem_bridge::UciBridge &bridge, tandem_bridge::GoRequest request, int max_plies) {
    chess::Board board;
    tandem::uci::PositionCommand base;
    base.startpos = request.fen.empty();
    base.fen = request.fen;
    base.moves = request.moves;
    if (tandem::Status st = tandem::uci::buildBoard(base, board); !st) {
        emit(tandem_bridge::BridgeEvent::error(st.message).toJson());
        return 1;
    }

    for (int ply = 0; ply < max_plies; ++ply) {
        const auto [reason, result] = board.isGameOver();
        if (reason != chess::GameResultReason::NONE) {
            emit(tandem_bridge::json{{"type", "gameover"}, {"reason", reasonName(reason)}});
            break;
        }

        request.new_game = ply == 0;
        const std::string side = board.sideToMove() == chess::Color::WHITE ? "white" : "black";
        request.side = side;
        const auto best = runRequest(bridge, request, side, false);
        if (!best) return 1;

        const auto move = tandem::uci::findLegalMove(board, *best);
        if (!move) {
            emit(tandem_bridge::BridgeEvent::error("illegal move from engine: " + *best).toJson());
            return 1;
        }
        board.makeMove(*move);
        request.moves.push_back(*best);
    }
    emit(tandem_bridge::BridgeEvent::done().toJson());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    tandem_bridge::BridgeConfig config;
    tandem_bridge::GoRequest request;
    bool self_play = false;
    int max_plies = 200;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        auto next_int = [&]() -> std::optional<int> {
            const auto v = next();
            return v ? parseInt(*v) : std::nullopt;
        };

        if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else if (arg == "--selfplay") {
            self_play = true;
        } else if (arg == "--new-game") {
            request.new_game = true;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--engine-cmd") {
            const auto v = next();
            if (!v) { usage(); return 2; }
            config.command = *v;
        } else if (arg == "--fen") {
            const auto v = next();
            if (!v) { usage(); return 2; }
            request.fen = *v;
        } else if (arg == "--moves") {
            const auto v = next();
            if (!v) { usage(); return 2; }
            request.moves = tandem::uci::split(*v);
        } else if (arg == "--side") {
            const auto v = next();
            if (!v) { usage(); return 2; }
            request.side = *v;
        } else if (arg == "--depth" || arg == "--rollouts" || arg == "--movetime" || arg == "--max-plies" ||
                   arg == "--handshake-timeout" || arg == "--ready-timeout") {
            const auto v = next_int();
            if (!v) {
                std::cerr << "Error: " << arg << " needs an integer\n";
                return 2;
            }
            if (arg == "--depth") request.depth = *v;
            else if (arg == "--rollouts") request.rollouts = *v;
            else if (arg == "--movetime") request.movetime_ms = *v;
            else if (arg == "--max-plies") max_plies = *v;
            else if (arg == "--handshake-timeout") config.handshake_timeout = std::chrono::milliseconds(*v);
            else config.ready_timeout = std::chrono::milliseconds(*v);
        } else {
            std::cerr << "Error: unknown argument " << arg << '\n';
            usage();
            return 2;
        }
    }

    try {
        tandem_bridge::UciBridge bridge(config);
        if (self_play) return selfplay(bridge, request, max_plies);

        const std::string side = request.side.value_or("");
        return runRequest(bridge, request, side, true) ? 0 : 1;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 2;
    }
}
