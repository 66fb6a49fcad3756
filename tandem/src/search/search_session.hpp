#pragma once

#include "tt.hpp"
#include "move_order.hpp"

#include <cstddef>

namespace tandem {

// Tables that live for one game. Reset by ucinewgame.
struct SearchSession {
    explicit SearchSession(std::size_t hash_mb = 16) : tt(hash_mb) {}

    void newGame() {
        tt.clear();
        killers.clear();
        history.clear();
    }

    // Only the TT ages between searches; killers and history live for the whole game.
    void newSearch() { tt.newSearch(); }

    TranspositionTable tt;
    KillerTable killers;
    HistoryTable history;
};

} // namespace tandem
