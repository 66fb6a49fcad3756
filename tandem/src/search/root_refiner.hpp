#pragma once

#include "chess.hpp"
#include "../eval/evaluator.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <stop_token>
#include <vector>

namespace tandem {

struct RefinerConfig {
    double c_puct = 1.4;
    int rollout_plies = 8;
    int batch_size = 32;
    double value_scale = 400.0;   // centipawns mapped through tanh(cp / value_scale)
    double hint_bonus = 2.0;      // prior logit added to the searcher's best move
    double rollout_temperature = 1.0;
    std::uint64_t seed = 0x7A6D3E11ULL;
};

struct RootStat {
    chess::Move move;
    double prior = 0.0;
    int visits = 0;
    double total = 0.0;

    double mean() const { return visits == 0 ? 0.0 : total / visits; }
};

struct RefineLimits {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    int max_rollouts = 0; // 0 => bounded by the deadline only
};

struct RefinerProgress {
    int rollouts = 0;
    chess::Move best_move = chess::Move(chess::Move::NO_MOVE);
    double best_mean = 0.0;
    int best_visits = 0;
};

// Monte-Carlo refinement restricted to the root: every root move keeps visit
// statistics, children are chosen by PUCT and valued by short rollouts.
class RootRefiner {
public:
    explicit RootRefiner(const Evaluator &evaluator, RefinerConfig config = {});

    // Prepares statistics for the root position. hint is the searcher's best move (may be NO_MOVE).
    void reset(chess::Board &board, chess::Move hint);

    // Runs up to one batch of rollouts. Returns the number performed; 0 means the
    // limits are exhausted or nothing can be refined.
    int runBatch(chess::Board &board, const RefineLimits &limits, std::stop_token stop = {});

    // reset + runBatch until exhausted.
    std::optional<chess::Move> refine(chess::Board &board, chess::Move hint, const RefineLimits &limits,
                                      std::stop_token stop = {});

    // Visited move with the highest mean value; nullopt when nothing was visited.
    std::optional<chess::Move> best() const;

    RefinerProgress progress() const;
    const std::vector<RootStat> &stats() const { return stats_; }
    int rollouts() const { return rollouts_; }

private:
    std::size_t select() const;
    double rollout(chess::Board &board);
    double squash(int centipawns) const;
    double moveHeuristic(chess::Board &board, chess::Move move, bool with_check) const;

    const Evaluator &evaluator_;
    RefinerConfig config_;
    std::mt19937_64 rng_;
    std::vector<RootStat> stats_;
    double root_value_ = 0.0;
    int rollouts_ = 0;
};

} // namespace tandem
