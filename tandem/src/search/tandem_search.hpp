#pragma once

#include "search_algo.hpp"
#include "scheduler.hpp"
#include "search_session.hpp"
#include "../eval/evaluator.hpp"
#include "../uci/protocol.hpp"

#include <string>
#include <vector>

namespace tandem {

// Alpha-beta search followed by root refinement, driven by SearchScheduler.
// With refine disabled it is a plain iterative-deepening alpha-beta engine.
class TandemSearch : public SearchAlgo {
public:
    TandemSearch(tandem::Options &options, const tandem::TimeHandler *time_handler, bool refine);

    Status handlePosition(const std::string &command) override;
    void onNewGame() override;
    void onQuit() override {}
    chess::Board &getBoard() override { return board_; }

    std::string go(const Limits &limits, std::stop_token stop) override;
    std::string bestMoveNow() override;

    // Hash size and refiner seed are read from the options before every search.
    void applyOptions();

private:
    // Lets consecutive "position ... moves" commands of one game replay only the new moves.
    struct PositionCache {
        bool has_base = false;
        bool base_is_startpos = false;
        std::string base_fen;
        std::vector<std::string> moves;
    };

    ScheduleLimits scheduleLimits(const Limits &limits) const;
    void printDepth(const DepthResult &result, std::chrono::steady_clock::time_point started) const;

    chess::Board board_;
    PositionCache cache_;
    SearchSession session_;
    Evaluator evaluator_;
    bool refine_;
};

} // namespace tandem
