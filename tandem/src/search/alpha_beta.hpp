#pragma once

#include "chess.hpp"
#include "search_session.hpp"
#include "../eval/evaluator.hpp"
#include "../score.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <stop_token>
#include <vector>

// cppcoro headers must be included at global scope
#include <cppcoro/generator.hpp>

namespace tandem {

// Switches for every forward-pruning step. Defaults are the playing configuration.
struct SearchConfig {
    bool null_move = true;
    bool futility = true;
    bool move_count_pruning = true;
    bool late_move_reductions = true;
    bool delta_pruning = true;
    bool quiescence_checks = true;
    bool aspiration = true;
    bool tt_cutoffs = true;

    // Full-width search: no forward pruning, no reductions, no TT cutoffs.
    static SearchConfig exhaustive() {
        SearchConfig c;
        c.null_move = false;
        c.futility = false;
        c.move_count_pruning = false;
        c.late_move_reductions = false;
        c.delta_pruning = false;
        c.aspiration = false;
        c.tt_cutoffs = false;
        return c;
    }
};

struct DepthResult {
    int depth = 0;
    int seldepth = 0;
    int score = 0;
    chess::Move best_move = chess::Move(chess::Move::NO_MOVE);
    std::vector<chess::Move> pv;
    std::uint64_t nodes = 0;              // since the start of the search
    std::chrono::milliseconds elapsed{0}; // spent on this depth alone
};

class AlphaBetaSearcher {
public:
    using clock = std::chrono::steady_clock;

    static constexpr int DEFAULT_DEPTH = 8;
    static constexpr int POLL_INTERVAL = 1024;

    static constexpr int NMP_MIN_DEPTH = 3;
    static constexpr int NMP_REDUCTION = 2;
    static constexpr int NMP_MATERIAL_GUARD = 1000;
    static constexpr int FUTILITY_MARGIN = 200;
    static constexpr int MCP_MIN_DEPTH = 3;
    static constexpr int MCP_START_INDEX = 6;
    static constexpr int LMR_MIN_DEPTH = 3;
    static constexpr int LMR_MIN_INDEX = 2;
    static constexpr int LMR_BASE_REDUCTION = 1;
    static constexpr int Q_DELTA_MARGIN = 150;
    static constexpr int Q_CHECK_PLIES = 1;
    static constexpr int ASPIRATION_WINDOW = 24;
    static constexpr int ASPIRATION_MAX_WINDOW = 2048;

    AlphaBetaSearcher(SearchSession &session, const Evaluator &evaluator, SearchConfig config = {})
        : session_(session), evaluator_(evaluator), config_(config) {}

    void setDeadline(clock::time_point deadline) { deadline_ = deadline; }
    void setStopToken(std::stop_token stop) { stop_token_ = std::move(stop); }

    // Iterative deepening from depth 1 up to max_depth. Each completed depth is
    // yielded; a depth interrupted by the deadline or stop ends the sequence.
    cppcoro::generator<DepthResult> iterate(chess::Board &board, int max_depth);

    // One depth with an aspiration window around previous_score. nullopt if aborted.
    std::optional<DepthResult> searchDepth(chess::Board &board, int depth, int previous_score);

    // Follows TT best moves from the position, at most max_length plies.
    std::vector<chess::Move> principalVariation(const chess::Board &board, int max_length) const;

    std::uint64_t nodes() const { return nodes_; }
    bool aborted() const { return aborted_; }
    const SearchConfig &config() const { return config_; }

private:
    struct RootResult {
        int score;
        chess::Move best_move;
    };

    RootResult negamax_root(chess::Board &board, int depth, int alpha, int beta);
    int negamax(chess::Board &board, int depth, int alpha, int beta, int ply, bool is_pv, bool null_allowed);
    int quiescence(chess::Board &board, int alpha, int beta, int ply, int qply);
    std::optional<int> null_move_cutoff(chess::Board &board, int depth, int beta, int ply);

    bool poll_stop();
    void report_pruning_failure(const char *step, const std::exception &e) const;

    SearchSession &session_;
    const Evaluator &evaluator_;
    SearchConfig config_;

    clock::time_point deadline_ = clock::time_point::max();
    std::stop_token stop_token_;

    std::uint64_t nodes_ = 0;
    int seldepth_ = 0;
    bool aborted_ = false;
};

} // namespace tandem
