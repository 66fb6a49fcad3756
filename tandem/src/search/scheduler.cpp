#include "scheduler.hpp"
#include "move_order.hpp"
#include "../score.hpp"
#include "../uci/output.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace tandem {

using std::chrono::milliseconds;

const char *toString(MoveSource source) {
    switch (source) {
    case MoveSource::Searcher: return "searcher";
    case MoveSource::Refiner: return "refiner";
    case MoveSource::Fallback: return "fallback";
    case MoveSource::None: return "none";
    }
    return "none";
}

SearchScheduler::SearchScheduler(SearchSession &session, const Evaluator &evaluator, SearchConfig search_config,
                                 RefinerConfig refiner_config, SchedulerConfig config)
    : searcher_(session, evaluator, search_config),
      refiner_(evaluator, refiner_config),
      config_(config) {}

milliseconds SearchScheduler::predictNextDepth(const std::vector<milliseconds> &durations,
                                               const SchedulerConfig &config) {
    if (durations.empty()) return milliseconds{0};
    const double last = static_cast<double>(durations.back().count());
    double growth = config.single_sample_growth;
    if (durations.size() >= 2) {
        const double prev = static_cast<double>(durations[durations.size() - 2].count());
        growth = prev <= 0.0 ? config.max_growth : last / prev;
        growth = std::clamp(growth, config.min_growth, config.max_growth);
    }
    return milliseconds{static_cast<long long>(last * growth + 0.5)};
}

cppcoro::generator<SearchEvent> SearchScheduler::run(chess::Board &board, ScheduleLimits limits,
                                                     std::stop_token stop) {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    chess::Movelist legal;
    chess::movegen::legalmoves(legal, board);

    // One absolute deadline for both phases. A hard limit only ever shortens the budget.
    std::optional<milliseconds> budget = limits.budget;
    if (budget && limits.hard_limit) budget = std::min(*budget, *limits.hard_limit);
    std::optional<clock::time_point> deadline;
    milliseconds reserve{0};
    if (budget) {
        deadline = start + std::max(*budget - config_.safety_margin, milliseconds{0});
        if (config_.refine) reserve = *budget * config_.refine_reserve_percent / 100;
    }

    ScheduleOutcome outcome;
    std::vector<milliseconds> durations;

    if (!legal.empty()) {
        searcher_.setDeadline(deadline ? *deadline : clock::time_point::max());
        searcher_.setStopToken(stop);

        for (DepthResult &result : searcher_.iterate(board, limits.max_depth)) {
            durations.push_back(result.elapsed);
            outcome.last_depth = result;
            uci::debug("iter depth=" + std::to_string(result.depth));

            SearchEvent event;
            event.kind = SearchEvent::Kind::Depth;
            event.depth = result;
            co_yield event;

            if (is_mate_score(result.score) && std::abs(mate_distance(result.score)) <= result.depth) break;
            if (budget) {
                const auto elapsed = std::chrono::duration_cast<milliseconds>(clock::now() - start);
                const milliseconds predicted = predictNextDepth(durations, config_);
                if (elapsed + predicted + reserve > *budget) {
                    uci::debug("gate depth=" + std::to_string(result.depth + 1) + " predicted=" +
                               std::to_string(predicted.count()) + "ms");
                    break;
                }
            }
        }
    }

    const bool searcher_mates = outcome.last_depth && outcome.last_depth->score >= MATE_BOUND;
    const bool refine_allowed = config_.refine && legal.size() > 1 && !searcher_mates && !stop.stop_requested();

    std::optional<chess::Move> refined;
    if (refine_allowed) {
        RefineLimits refine_limits;
        refine_limits.max_rollouts = limits.rollouts;
        if (deadline) refine_limits.deadline = *deadline;

        const bool has_allowance = deadline ? clock::now() < *deadline : limits.rollouts > 0;
        if (has_allowance) {
            const chess::Move hint = outcome.last_depth ? outcome.last_depth->best_move
                                                        : chess::Move(chess::Move::NO_MOVE);
            refiner_.reset(board, hint);
            while (refiner_.runBatch(board, refine_limits, stop) > 0) {
                SearchEvent event;
                event.kind = SearchEvent::Kind::Refine;
                event.refine = refiner_.progress();
                co_yield event;
            }
            outcome.rollouts = refiner_.rollouts();
            refined = refiner_.best();
        }
    }

    if (refined) {
        outcome.best_move = *refined;
        outcome.source = MoveSource::Refiner;
    } else if (outcome.last_depth && outcome.last_depth->best_move != chess::Move::NO_MOVE) {
        outcome.best_move = outcome.last_depth->best_move;
        outcome.source = MoveSource::Searcher;
    } else if (!legal.empty()) {
        outcome.best_move = defaultMove(board);
        outcome.source = MoveSource::Fallback;
    }
    outcome.elapsed = std::chrono::duration_cast<milliseconds>(clock::now() - start);

    SearchEvent finished;
    finished.kind = SearchEvent::Kind::Finished;
    finished.outcome = outcome;
    co_yield finished;
}

} // namespace tandem
