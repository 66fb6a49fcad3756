#include "search/scheduler.hpp"
#include "search/move_order.hpp"
#include "eval/evaluator.hpp"
#include "score.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <vector>

using namespace tandem;
using std::chrono::milliseconds;

namespace {

struct Collected {
    std::vector<int> depths;
    int refine_events = 0;
    int finished_events = 0;
    ScheduleOutcome outcome;
};

Collected runToEnd(SearchScheduler &scheduler, chess::Board &board, const ScheduleLimits &limits,
                   std::stop_token stop = {}) {
    Collected c;
    for (SearchEvent &event : scheduler.run(board, limits, stop)) {
        switch (event.kind) {
        case SearchEvent::Kind::Depth: c.depths.push_back(event.depth.depth); break;
        case SearchEvent::Kind::Refine: ++c.refine_events; break;
        case SearchEvent::Kind::Finished:
            ++c.finished_events;
            c.outcome = event.outcome;
            break;
        }
    }
    return c;
}

bool isLegal(const chess::Board &board, chess::Move move) {
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    return std::find(moves.begin(), moves.end(), move) != moves.end();
}

} // namespace

TEST(SchedulerPrediction, UsesRatioOfLastTwoDepths) {
    SchedulerConfig config;
    EXPECT_EQ(SearchScheduler::predictNextDepth({}, config), milliseconds(0));
    EXPECT_EQ(SearchScheduler::predictNextDepth({milliseconds(10)}, config), milliseconds(30));
    EXPECT_EQ(SearchScheduler::predictNextDepth({milliseconds(10), milliseconds(40)}, config), milliseconds(160));
    // Ratio clamped to [2, 8]
    EXPECT_EQ(SearchScheduler::predictNextDepth({milliseconds(10), milliseconds(11)}, config), milliseconds(22));
    EXPECT_EQ(SearchScheduler::predictNextDepth({milliseconds(1), milliseconds(100)}, config), milliseconds(800));
    // A zero duration before the last one counts as maximal growth.
    EXPECT_EQ(SearchScheduler::predictNextDepth({milliseconds(0), milliseconds(5)}, config), milliseconds(40));
}

TEST(Scheduler, DepthAndRolloutsWithoutBudget) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board;
    const std::string fen = board.getFen();

    ScheduleLimits limits;
    limits.max_depth = 3;
    limits.rollouts = 64;
    const Collected c = runToEnd(scheduler, board, limits);

    EXPECT_EQ(c.depths, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(c.refine_events, 2);
    EXPECT_EQ(c.finished_events, 1);
    EXPECT_EQ(c.outcome.rollouts, 64);
    EXPECT_EQ(c.outcome.source, MoveSource::Refiner);
    EXPECT_TRUE(isLegal(board, c.outcome.best_move));
    ASSERT_TRUE(c.outcome.last_depth.has_value());
    EXPECT_EQ(c.outcome.last_depth->depth, 3);
    EXPECT_EQ(board.getFen(), fen);
}

TEST(Scheduler, SearcherOnlyWhenNoRollouts) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board;

    ScheduleLimits limits;
    limits.max_depth = 2;
    const Collected c = runToEnd(scheduler, board, limits);

    EXPECT_EQ(c.refine_events, 0);
    EXPECT_EQ(c.outcome.source, MoveSource::Searcher);
    EXPECT_EQ(c.outcome.best_move, c.outcome.last_depth->best_move);
}

TEST(Scheduler, MateSkipsRefinerAndStopsDeepening) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");

    ScheduleLimits limits;
    limits.max_depth = 6;
    limits.rollouts = 100;
    const Collected c = runToEnd(scheduler, board, limits);

    EXPECT_EQ(c.depths, (std::vector<int>{1}));
    EXPECT_EQ(c.refine_events, 0);
    EXPECT_EQ(c.outcome.rollouts, 0);
    EXPECT_EQ(c.outcome.source, MoveSource::Searcher);
    EXPECT_EQ(chess::uci::moveToUci(c.outcome.best_move), "a1a8");
}

TEST(Scheduler, SingleLegalMoveSkipsRefiner) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    // The white king covers g7 and h7, so Kg8 is the only move.
    chess::Board board("7k/8/6K1/8/8/8/8/R7 b - - 0 1");
    chess::Movelist legal;
    chess::movegen::legalmoves(legal, board);
    ASSERT_EQ(legal.size(), 1);

    ScheduleLimits limits;
    limits.max_depth = 2;
    limits.rollouts = 50;
    const Collected c = runToEnd(scheduler, board, limits);
    EXPECT_EQ(c.refine_events, 0);
    EXPECT_EQ(c.outcome.best_move, legal[0]);
}

TEST(Scheduler, RespectsTimeBudget) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board("r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 4 4");

    ScheduleLimits limits;
    limits.max_depth = MAX_PLY - 1;
    limits.budget = milliseconds(200);
    const auto started = std::chrono::steady_clock::now();
    const Collected c = runToEnd(scheduler, board, limits);
    const auto spent = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    EXPECT_LE(spent, *limits.budget + scheduler.config().safety_margin);
    EXPECT_FALSE(c.depths.empty());
    EXPECT_LT(c.depths.back(), MAX_PLY - 1);
    EXPECT_TRUE(isLegal(board, c.outcome.best_move));
    EXPECT_NE(c.outcome.source, MoveSource::None);
}

TEST(Scheduler, HardLimitDoesNotExtendBudget) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board("r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 4 4");

    ScheduleLimits limits;
    limits.max_depth = MAX_PLY - 1;
    limits.budget = milliseconds(150);
    limits.hard_limit = milliseconds(600);
    const auto started = std::chrono::steady_clock::now();
    const Collected c = runToEnd(scheduler, board, limits);
    const auto spent = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    EXPECT_LE(spent, *limits.budget + scheduler.config().safety_margin);
    EXPECT_TRUE(isLegal(board, c.outcome.best_move));
}

TEST(Scheduler, SmallerHardLimitShortensBudget) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board board;

    ScheduleLimits limits;
    limits.max_depth = MAX_PLY - 1;
    limits.budget = milliseconds(2000);
    limits.hard_limit = milliseconds(100);
    const auto started = std::chrono::steady_clock::now();
    const Collected c = runToEnd(scheduler, board, limits);
    const auto spent = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    EXPECT_LE(spent, *limits.hard_limit + scheduler.config().safety_margin);
    EXPECT_TRUE(isLegal(board, c.outcome.best_move));
}

TEST(Scheduler, StoppedBeforeStartFallsBack) {
    SearchSession session;
    Evaluator eval;
    SchedulerConfig config;
    SearchScheduler scheduler(session, eval, SearchConfig{}, RefinerConfig{}, config);
    chess::Board board("r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 4 4");

    std::stop_source source;
    source.request_stop();
    ScheduleLimits limits;
    limits.max_depth = MAX_PLY - 1;
    limits.rollouts = 100;
    const Collected c = runToEnd(scheduler, board, limits, source.get_token());

    EXPECT_EQ(c.refine_events, 0);
    EXPECT_EQ(c.finished_events, 1);
    EXPECT_TRUE(isLegal(board, c.outcome.best_move));
    EXPECT_NE(c.outcome.source, MoveSource::Refiner);
}

TEST(Scheduler, NoLegalMovesHasNoMove) {
    SearchSession session;
    Evaluator eval;
    SearchScheduler scheduler(session, eval);
    chess::Board stalemate("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");

    ScheduleLimits limits;
    limits.max_depth = 3;
    limits.rollouts = 10;
    const Collected c = runToEnd(scheduler, stalemate, limits);
    EXPECT_TRUE(c.depths.empty());
    EXPECT_EQ(c.outcome.best_move, chess::Move::NO_MOVE);
    EXPECT_EQ(c.outcome.source, MoveSource::None);
    EXPECT_STREQ(toString(c.outcome.source), "none");
}

TEST(DefaultMove, PrefersCaptures) {
    // e4 pawn can take d5; the rest of the moves are quiet
    chess::Board board("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
    EXPECT_EQ(chess::uci::moveToUci(defaultMove(board)), "e4d5");
}

TEST(DefaultMove, QuietPositionsUseMoveText) {
    chess::Board board("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    const chess::Move move = defaultMove(board);
    // Checks come before quiet moves; a1a8 is the only checking move.
    EXPECT_EQ(chess::uci::moveToUci(move), "a1a8");

    chess::Board stalemate("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    EXPECT_EQ(defaultMove(stalemate), chess::Move::NO_MOVE);
}
