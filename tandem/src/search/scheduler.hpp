#pragma once

#include "chess.hpp"
#include "alpha_beta.hpp"
#include "root_refiner.hpp"
#include "search_session.hpp"
#include "../eval/evaluator.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <vector>

// cppcoro headers must be included at global scope
#include <cppcoro/generator.hpp>

namespace tandem {

struct ScheduleLimits {
    int max_depth = AlphaBetaSearcher::DEFAULT_DEPTH;
    int rollouts = 0;                                    // refiner allowance without a time budget
    std::optional<std::chrono::milliseconds> budget;     // planning budget B
    std::optional<std::chrono::milliseconds> hard_limit; // caps the budget when it is smaller
};

struct SchedulerConfig {
    std::chrono::milliseconds safety_margin{20};
    int refine_reserve_percent = 15;
    double single_sample_growth = 3.0;
    double min_growth = 2.0;
    double max_growth = 8.0;
    bool refine = true;
};

enum class MoveSource { Searcher, Refiner, Fallback, None };

const char *toString(MoveSource source);

struct ScheduleOutcome {
    chess::Move best_move = chess::Move(chess::Move::NO_MOVE);
    MoveSource source = MoveSource::None;
    std::optional<DepthResult> last_depth;
    int rollouts = 0;
    std::chrono::milliseconds elapsed{0};
};

struct SearchEvent {
    enum class Kind { Depth, Refine, Finished };

    Kind kind = Kind::Finished;
    DepthResult depth;       // Kind::Depth
    RefinerProgress refine;  // Kind::Refine
    ScheduleOutcome outcome; // Kind::Finished
};

// Splits one request's time between the alpha-beta searcher and the root refiner.
class SearchScheduler {
public:
    SearchScheduler(SearchSession &session, const Evaluator &evaluator, SearchConfig search_config = {},
                    RefinerConfig refiner_config = {}, SchedulerConfig config = {});

    // Yields a Depth event per completed depth, a Refine event per rollout batch
    // and exactly one Finished event last. The board is restored on completion.
    cppcoro::generator<SearchEvent> run(chess::Board &board, ScheduleLimits limits, std::stop_token stop);

    // Expected duration of the next depth given the durations of the completed ones.
    static std::chrono::milliseconds predictNextDepth(const std::vector<std::chrono::milliseconds> &durations,
                                                      const SchedulerConfig &config);

    const SchedulerConfig &config() const { return config_; }

private:
    AlphaBetaSearcher searcher_;
    RootRefiner refiner_;
    SchedulerConfig config_;
};

} // namespace tandem
