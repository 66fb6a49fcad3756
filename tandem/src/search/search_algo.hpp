#pragma once

#include "chess.hpp"
#include "../options.hpp"
#include "../status.hpp"
#include "../time/time_handler.hpp"

#include <stop_token>
#include <string>
#include <vector>

namespace tandem {

struct Limits {
    bool infinite = false;
    unsigned long long movetime_ms = 0;
    unsigned long long wtime_ms = 0;
    unsigned long long btime_ms = 0;
    unsigned long long winc_ms = 0;
    unsigned long long binc_ms = 0;
    int movestogo = 0;
    int depth = 0;    // 0 => not specified
    int rollouts = 0; // refiner rollout allowance when no time budget applies
};

class SearchAlgo {
public:
    virtual ~SearchAlgo() = default;
    explicit SearchAlgo(tandem::Options &options, const tandem::TimeHandler *time_handler)
        : options_(options), time_handler_(time_handler) {}

    // Engine state management
    virtual Status handlePosition(const std::string &command) = 0; // full "position ..." line
    virtual void onNewGame() = 0;                                   // reset board and search tables
    virtual void onQuit() = 0;
    virtual chess::Board &getBoard() = 0;

    // Search API operating on internal board. Returns the move text to print after "bestmove".
    virtual std::string go(const Limits &limits, std::stop_token stop) = 0;

    // Move to answer with when asked for a bestmove outside of a search.
    virtual std::string bestMoveNow() = 0;

protected:
    tandem::Options &options_;
    // Not owned; lifetime managed by caller
    const tandem::TimeHandler *time_handler_;
};

} // namespace tandem
