#include "bridge/uci_bridge.hpp"
#include "uci/protocol.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace tandem_bridge;
using std::chrono::milliseconds;

namespace {

// Answers the handshake and readiness probe, ignores everything else.
constexpr const char *kQuietWorker =
    "while read line; do case \"$line\" in uci) echo uciok;; isready) echo readyok;; quit) exit 0;; esac; done";

// Completes the handshake but never answers isready.
constexpr const char *kNeverReadyWorker =
    "while read line; do case \"$line\" in uci) echo uciok;; quit) exit 0;; esac; done";

// Prints a line and exits as soon as a search starts.
constexpr const char *kCrashingWorker =
    "while read line; do case \"$line\" in uci) echo uciok;; isready) echo readyok;; go*) echo boom; exit 3;; esac; done";

// Answers every go with an illegal move.
constexpr const char *kLyingWorker =
    "while read line; do case \"$line\" in uci) echo uciok;; isready) echo readyok;; "
    "go*) echo 'info depth 1 score cp 5 pv e2e5'; echo 'bestmove e2e5';; quit) exit 0;; esac; done";

// Prints a line, lingers, then exits while the bridge may still be sending stops.
constexpr const char *kSlowCrashingWorker =
    "while read line; do case \"$line\" in uci) echo uciok;; isready) echo readyok;; "
    "go*) echo boom; sleep 0.2; exit 3;; esac; done";

// Ignores isready on its first run only; the marker file tells the runs apart.
std::string firstRunDeafWorker(const std::filesystem::path &marker) {
    const std::string m = "'" + marker.string() + "'";
    return "if [ -e " + m + " ]; then ready=1; else touch " + m + "; ready=0; fi; "
           "while read line; do case \"$line\" in uci) echo uciok;; "
           "isready) [ $ready = 1 ] && echo readyok;; go*) echo 'bestmove e2e4';; quit) exit 0;; esac; done";
}

BridgeConfig fastConfig(const std::string &command) {
    BridgeConfig config;
    config.command = command;
    config.handshake_timeout = milliseconds(1000);
    config.ready_timeout = milliseconds(300);
    config.ready_poll_slice = milliseconds(50);
    config.drain_timeout = milliseconds(50);
    config.drain_poll_slice = milliseconds(25);
    config.search_poll_slice = milliseconds(25);
    return config;
}

GoRequest depthRequest(int depth) {
    GoRequest request;
    request.depth = depth;
    return request;
}

std::vector<BridgeEvent> collect(UciBridge &bridge, GoRequest request, const CancelToken *cancel = nullptr) {
    std::vector<BridgeEvent> events;
    for (BridgeEvent &event : bridge.streamGo(std::move(request), cancel)) events.push_back(event);
    return events;
}

long countSent(const UciBridge &bridge, const std::string &command) {
    const auto sent = bridge.sentCommands();
    return std::count(sent.begin(), sent.end(), command);
}

} // namespace

TEST(BridgeRequest, Commands) {
    GoRequest request;
    request.moves = {"e2e4", "e7e5"};
    request.depth = 6;
    request.rollouts = 150;
    EXPECT_EQ(UciBridge::positionCommand(request), "position startpos moves e2e4 e7e5");
    EXPECT_EQ(UciBridge::goCommand(request), "go depth 6 rollouts 150");

    GoRequest timed;
    timed.fen = "6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1";
    timed.movetime_ms = 250;
    EXPECT_EQ(UciBridge::positionCommand(timed), "position fen 6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");
    EXPECT_EQ(UciBridge::goCommand(timed), "go movetime 250");
}

TEST(BridgeRequest, Validation) {
    EXPECT_TRUE(UciBridge::validate(depthRequest(3)));

    EXPECT_FALSE(UciBridge::validate(GoRequest{}));
    EXPECT_FALSE(UciBridge::validate(depthRequest(0)));

    GoRequest bad_time;
    bad_time.movetime_ms = 0;
    EXPECT_FALSE(UciBridge::validate(bad_time));

    GoRequest bad_side = depthRequest(2);
    bad_side.side = "purple";
    EXPECT_FALSE(UciBridge::validate(bad_side));

    GoRequest bad_fen = depthRequest(2);
    bad_fen.fen = "not a fen";
    EXPECT_FALSE(UciBridge::validate(bad_fen));

    GoRequest bad_move = depthRequest(2);
    bad_move.moves = {"e2e4", "zz99"};
    EXPECT_FALSE(UciBridge::validate(bad_move));

    GoRequest illegal = depthRequest(2);
    illegal.moves = {"e2e4", "e2e4"};
    EXPECT_FALSE(UciBridge::validate(illegal));
}

TEST(UciBridge, InvalidRequestNeedsNoWorker) {
    UciBridge bridge(fastConfig("exit 1"));
    const auto events = collect(bridge, GoRequest{});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::Error);
    EXPECT_TRUE(bridge.sentCommands().empty());
}

TEST(UciBridge, RealWorkerSearch) {
    UciBridge bridge(fastConfig(TANDEM_WORKER_PATH));
    GoRequest request = depthRequest(3);
    request.rollouts = 32;
    request.new_game = true;
    request.moves = {"e2e4"};
    request.side = "black";

    const auto events = collect(bridge, request);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.back().type, EventType::Done);
    const BridgeEvent &best = events[events.size() - 2];
    ASSERT_EQ(best.type, EventType::BestMove);

    chess::Board board;
    board.makeMove(chess::uci::uciToMove(board, "e2e4"));
    EXPECT_TRUE(tandem::uci::findLegalMove(board, best.move()).has_value()) << best.move();

    const bool saw_depth = std::any_of(events.begin(), events.end(), [](const BridgeEvent &e) {
        return e.type == EventType::Info && e.payload.contains("depth");
    });
    EXPECT_TRUE(saw_depth);
    EXPECT_EQ(countSent(bridge, "ucinewgame"), 1);
    EXPECT_EQ(bridge.restartCount(), 0);
    EXPECT_FALSE(bridge.searchActive());

    // The same worker serves a second request.
    const auto again = collect(bridge, depthRequest(2));
    EXPECT_EQ(again.back().type, EventType::Done);
    EXPECT_EQ(bridge.restartCount(), 0);
}

TEST(UciBridge, SideMismatchIsReported) {
    UciBridge bridge(fastConfig(TANDEM_WORKER_PATH));
    GoRequest request = depthRequest(1);
    request.side = "black";

    const auto events = collect(bridge, request);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type, EventType::Info);
    EXPECT_NE(events.front().payload.value("string", std::string()).find("side mismatch"), std::string::npos);
    EXPECT_EQ(events.back().type, EventType::Done);
}

TEST(UciBridge, CancelEndsStream) {
    UciBridge bridge(fastConfig(TANDEM_WORKER_PATH));
    CancelToken cancel;
    GoRequest request;
    request.movetime_ms = 5000;

    std::thread canceller([&] {
        std::this_thread::sleep_for(milliseconds(200));
        cancel.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    const auto events = collect(bridge, request, &cancel);
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(3000));
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Done);
    EXPECT_GE(countSent(bridge, "stop"), 1);

    // The worker is still usable afterwards.
    const auto next = collect(bridge, depthRequest(1));
    ASSERT_GE(next.size(), 2u);
    EXPECT_EQ(next[next.size() - 2].type, EventType::BestMove);
}

TEST(UciBridge, UnresponsiveWorkerIsRestartedOnce) {
    BridgeConfig config = fastConfig(kNeverReadyWorker);
    UciBridge bridge(config);
    ASSERT_TRUE(bridge.ensureStarted());

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(bridge.isReady());
    const auto spent = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    EXPECT_EQ(bridge.restartCount(), 1);
    EXPECT_GE(spent.count(), 550);
    EXPECT_LE(spent.count(), 1500);
}

TEST(UciBridge, UnresponsiveWorkerFailsRequest) {
    UciBridge bridge(fastConfig(kNeverReadyWorker));
    const auto events = collect(bridge, depthRequest(2));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::Error);
    EXPECT_EQ(countSent(bridge, "go depth 2"), 0);
}

TEST(UciBridge, StopIsThrottled) {
    BridgeConfig config = fastConfig(kQuietWorker);
    config.stop_throttle = milliseconds(1000);
    UciBridge bridge(config);
    ASSERT_TRUE(bridge.ensureStarted());

    bridge.abortCurrentSearch();
    bridge.abortCurrentSearch();
    EXPECT_EQ(countSent(bridge, "stop"), 1);

    std::this_thread::sleep_for(milliseconds(1100));
    bridge.abortCurrentSearch();
    EXPECT_EQ(countSent(bridge, "stop"), 2);
}

TEST(UciBridge, CrashDuringSearch) {
    UciBridge bridge(fastConfig(kCrashingWorker));
    const auto events = collect(bridge, depthRequest(2));
    ASSERT_FALSE(events.empty());
    const BridgeEvent &last = events.back();
    ASSERT_EQ(last.type, EventType::Error);
    EXPECT_NE(last.message().find("boom"), std::string::npos) << last.message();
    EXPECT_NE(last.message().find("terminated"), std::string::npos);
}

TEST(UciBridge, IllegalBestMoveIsAnError) {
    UciBridge bridge(fastConfig(kLyingWorker));
    const auto events = collect(bridge, depthRequest(2));
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0].type, EventType::Info);
    EXPECT_EQ(events.back().type, EventType::Error);
    EXPECT_NE(events.back().message().find("e2e5"), std::string::npos);
}

TEST(UciBridge, SilentWorkerFailsHandshake) {
    BridgeConfig config = fastConfig("cat > /dev/null");
    config.handshake_timeout = milliseconds(200);
    UciBridge bridge(config);

    const tandem::Status st = bridge.ensureStarted();
    EXPECT_FALSE(st);
    EXPECT_NE(st.message.find("handshake"), std::string::npos);
    EXPECT_EQ(bridge.restartCount(), 1);
}

TEST(UciBridge, RestartedWorkerGetsPositionAgain) {
    const auto marker = std::filesystem::temp_directory_path() / ("tandem_ready_" + std::to_string(::getpid()));
    std::filesystem::remove(marker);

    UciBridge bridge(fastConfig(firstRunDeafWorker(marker)));
    const auto events = collect(bridge, depthRequest(2));
    std::filesystem::remove(marker);

    EXPECT_EQ(bridge.restartCount(), 1);
    EXPECT_EQ(countSent(bridge, "position startpos"), 2);
    EXPECT_EQ(countSent(bridge, "go depth 2"), 1);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[events.size() - 2].type, EventType::BestMove);
    EXPECT_EQ(events[events.size() - 2].move(), "e2e4");
    EXPECT_EQ(events.back().type, EventType::Done);
}

TEST(UciBridge, CrashWhileStopsAreSent) {
    BridgeConfig config = fastConfig(kSlowCrashingWorker);
    config.stop_throttle = milliseconds(0);
    UciBridge bridge(config);
    ASSERT_TRUE(bridge.ensureStarted());

    std::atomic<bool> done{false};
    std::thread stopper([&] {
        while (!done.load()) {
            if (bridge.searchActive()) bridge.abortCurrentSearch();
            std::this_thread::sleep_for(milliseconds(5));
        }
    });
    const auto events = collect(bridge, depthRequest(2));
    done.store(true);
    stopper.join();

    ASSERT_FALSE(events.empty());
    const BridgeEvent &last = events.back();
    ASSERT_EQ(last.type, EventType::Error);
    EXPECT_NE(last.message().find("exit code 3"), std::string::npos) << last.message();
    EXPECT_NE(last.message().find("boom"), std::string::npos) << last.message();
}
