#include "root_refiner.hpp"
#include "move_order.hpp"
#include "../score.hpp"

#include <algorithm>
#include <cmath>

namespace tandem {

RootRefiner::RootRefiner(const Evaluator &evaluator, RefinerConfig config)
    : evaluator_(evaluator), config_(config), rng_(config.seed) {}

double RootRefiner::squash(int centipawns) const {
    if (centipawns >= MATE_BOUND) return 1.0;
    if (centipawns <= -MATE_BOUND) return -1.0;
    return std::tanh(static_cast<double>(centipawns) / config_.value_scale);
}

double RootRefiner::moveHeuristic(chess::Board &board, chess::Move move, bool with_check) const {
    double h = 0.0;
    if (board.isCapture(move)) h += 1.0 + victimValue(board, move) / 300.0;
    if (move.typeOf() == chess::Move::PROMOTION) h += 1.5;
    if (with_check && givesCheck(board, move)) h += 1.0;
    return h;
}

void RootRefiner::reset(chess::Board &board, chess::Move hint) {
    stats_.clear();
    rollouts_ = 0;
    rng_.seed(config_.seed);

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty()) return;

    std::vector<double> logits;
    logits.reserve(moves.size());
    for (const auto &move : moves) {
        double h = moveHeuristic(board, move, true);
        if (hint != chess::Move::NO_MOVE && move == hint) h += config_.hint_bonus;
        logits.push_back(h);
        stats_.push_back(RootStat{move, 0.0, 0, 0.0});
    }

    const double top = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (double &l : logits) {
        l = std::exp(l - top);
        sum += l;
    }
    for (std::size_t i = 0; i < stats_.size(); ++i) stats_[i].prior = logits[i] / sum;

    // Unvisited moves start at the root's own value.
    root_value_ = squash(evaluator_.staticScore(board));
}

std::size_t RootRefiner::select() const {
    int total = 0;
    for (const auto &s : stats_) total += s.visits;
    const double sqrt_total = std::sqrt(static_cast<double>(total) + 1.0);

    std::size_t best = 0;
    double best_score = -1e18;
    for (std::size_t i = 0; i < stats_.size(); ++i) {
        const RootStat &s = stats_[i];
        const double q = s.visits == 0 ? root_value_ : s.mean();
        const double u = config_.c_puct * s.prior * sqrt_total / (1.0 + s.visits);
        if (q + u > best_score) {
            best_score = q + u;
            best = i;
        }
    }
    return best;
}

// Plays heuristic moves from the position and returns the value for the side
// to move at entry. The board is restored before returning.
double RootRefiner::rollout(chess::Board &board) {
    std::vector<chess::Move> played;
    played.reserve(config_.rollout_plies);

    double value = 0.0;
    for (;;) {
        chess::Movelist moves;
        chess::movegen::legalmoves(moves, board);
        if (moves.empty()) {
            value = board.inCheck() ? -1.0 : 0.0;
            break;
        }
        if (board.isRepetition(1) || board.isHalfMoveDraw() || board.isInsufficientMaterial()) {
            value = 0.0;
            break;
        }

        bool quiet = !board.inCheck();
        std::vector<double> weights;
        weights.reserve(moves.size());
        for (const auto &move : moves) {
            const double h = moveHeuristic(board, move, false);
            if (h > 0.0) quiet = false;
            weights.push_back(std::exp(h / config_.rollout_temperature));
        }
        if (static_cast<int>(played.size()) >= config_.rollout_plies || (quiet && !played.empty())) {
            value = squash(evaluator_.staticScore(board));
            break;
        }

        std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
        const chess::Move move = moves[static_cast<int>(pick(rng_))];
        board.makeMove(move);
        played.push_back(move);
    }

    for (auto it = played.rbegin(); it != played.rend(); ++it) board.unmakeMove(*it);
    // value is from the side to move at the leaf, flip once per ply back to entry
    return (played.size() % 2 == 0) ? value : -value;
}

int RootRefiner::runBatch(chess::Board &board, const RefineLimits &limits, std::stop_token stop) {
    if (stats_.empty()) return 0;

    int done = 0;
    while (done < config_.batch_size) {
        if (limits.max_rollouts > 0 && rollouts_ >= limits.max_rollouts) break;
        if (limits.max_rollouts == 0 && limits.deadline == std::chrono::steady_clock::time_point::max()) break;
        if (stop.stop_requested() || std::chrono::steady_clock::now() >= limits.deadline) break;

        RootStat &stat = stats_[select()];
        board.makeMove(stat.move);
        // rollout() answers for the opponent; negate for the root mover
        const double value = -rollout(board);
        board.unmakeMove(stat.move);

        stat.visits += 1;
        stat.total += value;
        ++rollouts_;
        ++done;
    }
    return done;
}

std::optional<chess::Move> RootRefiner::refine(chess::Board &board, chess::Move hint, const RefineLimits &limits,
                                               std::stop_token stop) {
    reset(board, hint);
    while (runBatch(board, limits, stop) > 0) {
    }
    return best();
}

std::optional<chess::Move> RootRefiner::best() const {
    const RootStat *best = nullptr;
    for (const auto &s : stats_) {
        if (s.visits == 0) continue;
        if (best == nullptr || s.mean() > best->mean() || (s.mean() == best->mean() && s.visits > best->visits)) {
            best = &s;
        }
    }
    if (best == nullptr) return std::nullopt;
    return best->move;
}

RefinerProgress RootRefiner::progress() const {
    RefinerProgress p;
    p.rollouts = rollouts_;
    for (const auto &s : stats_) {
        if (s.visits == 0) continue;
        if (p.best_visits == 0 || s.mean() > p.best_mean) {
            p.best_move = s.move;
            p.best_mean = s.mean();
            p.best_visits = s.visits;
        }
    }
    return p;
}

} // namespace tandem
