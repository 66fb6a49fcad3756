#include "search/tandem_search.hpp"
#include "search/search_registry.hpp"
#include "time/uci_time.hpp"
#include "uci/protocol.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace tandem;

namespace {

std::string goDepth(SearchAlgo &search, int depth, int rollouts = 0) {
    Limits limits;
    limits.depth = depth;
    limits.rollouts = rollouts;
    return search.go(limits, std::stop_token{});
}

} // namespace

TEST(TandemSearch, IncrementalPositions) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);

    ASSERT_TRUE(search.handlePosition("position startpos moves e2e4"));
    ASSERT_TRUE(search.handlePosition("position startpos moves e2e4 e7e5"));
    EXPECT_EQ(search.getBoard().getFen(), "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 0 2");

    // Not an extension of the previous move list: rebuilt from scratch.
    ASSERT_TRUE(search.handlePosition("position startpos moves d2d4"));
    EXPECT_EQ(search.getBoard().sideToMove(), chess::Color::BLACK);
}

TEST(TandemSearch, RejectedPositionKeepsBoard) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);

    ASSERT_TRUE(search.handlePosition("position startpos moves e2e4"));
    const std::string fen = search.getBoard().getFen();

    EXPECT_FALSE(search.handlePosition("position startpos moves e2e4 e2e4"));
    EXPECT_FALSE(search.handlePosition("position fen 8/8/8/8/8/8/8/8 w - - 0 1"));
    EXPECT_EQ(search.getBoard().getFen(), fen);
}

TEST(TandemSearch, GoReturnsLegalMove) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);
    ASSERT_TRUE(search.handlePosition("position startpos"));

    const std::string move = goDepth(search, 3, 64);
    EXPECT_TRUE(uci::findLegalMove(search.getBoard(), move).has_value()) << move;
}

TEST(TandemSearch, MateAndStalemate) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);

    ASSERT_TRUE(search.handlePosition("position fen 6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1"));
    EXPECT_EQ(goDepth(search, 4, 100), "a1a8");

    ASSERT_TRUE(search.handlePosition("position fen 7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    EXPECT_EQ(goDepth(search, 4), "0000");
    EXPECT_EQ(search.bestMoveNow(), "0000");
}

TEST(TandemSearch, MovetimeIsHonoured) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);
    ASSERT_TRUE(search.handlePosition("position startpos moves e2e4 e7e5 g1f3 b8c6"));

    Limits limits;
    limits.movetime_ms = 150;
    const auto started = std::chrono::steady_clock::now();
    const std::string move = search.go(limits, std::stop_token{});
    const auto spent = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(uci::findLegalMove(search.getBoard(), move).has_value());
    // SafetyMargin defaults to 20ms
    EXPECT_LE(spent, std::chrono::milliseconds(150 + 20));
}

TEST(TandemSearch, StopEndsInfiniteSearch) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);
    ASSERT_TRUE(search.handlePosition("position startpos"));

    std::string move;
    std::jthread worker([&](std::stop_token st) {
        Limits limits;
        limits.infinite = true;
        move = search.go(limits, st);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    worker.request_stop();
    worker.join();
    EXPECT_TRUE(uci::findLegalMove(search.getBoard(), move).has_value()) << move;
}

TEST(TandemSearch, InfiniteMateWaitsForStop) {
    Options options;
    UciTimeHandler time_handler;
    TandemSearch search(options, &time_handler, true);
    ASSERT_TRUE(search.handlePosition("position fen 6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1"));

    std::atomic<int> answers{0};
    std::string move;
    std::jthread worker([&](std::stop_token st) {
        Limits limits;
        limits.infinite = true;
        move = search.go(limits, st);
        answers.fetch_add(1);
    });
    // The mate is found at depth 1, well inside this window.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(answers.load(), 0);

    worker.request_stop();
    worker.join();
    EXPECT_EQ(answers.load(), 1);
    EXPECT_EQ(move, "a1a8");
}

TEST(SearchRegistry, KnownAndUnknownEngines) {
    Options options;
    UciTimeHandler time_handler;
    EXPECT_EQ(searchRegistry().front().name, "hybrid");
    EXPECT_NE(makeSearch("hybrid", options, &time_handler), nullptr);
    EXPECT_NE(makeSearch("ab", options, &time_handler), nullptr);
    EXPECT_EQ(makeSearch("nope", options, &time_handler), nullptr);
    EXPECT_NE(makeSearch("AB", options, &time_handler), nullptr);
    EXPECT_NE(makeSearch("Hybrid", options, &time_handler), nullptr);

    auto ab = makeSearch("ab", options, &time_handler);
    ASSERT_TRUE(ab->handlePosition("position startpos"));
    EXPECT_TRUE(uci::findLegalMove(ab->getBoard(), goDepth(*ab, 2)).has_value());
}

TEST(SearchRegistry, AdvertisedSeedMatchesRefiner) {
    const std::vector<std::string> lines = uciOptionLines();
    const auto seed = std::find_if(lines.begin(), lines.end(),
                                   [](const std::string &l) { return l.rfind("option name Seed ", 0) == 0; });
    ASSERT_NE(seed, lines.end());
    EXPECT_NE(seed->find(" default " + std::to_string(RefinerConfig{}.seed) + " "), std::string::npos) << *seed;

    const auto engine = std::find_if(lines.begin(), lines.end(),
                                     [](const std::string &l) { return l.rfind("option name Engine ", 0) == 0; });
    ASSERT_NE(engine, lines.end());
    EXPECT_NE(engine->find("var hybrid var ab"), std::string::npos);
}
