#pragma once

#include "chess.hpp"
#include "../score.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace tandem {

// Two quiet cutoff moves per ply, most recent first.
class KillerTable {
public:
    void record(int ply, chess::Move move) {
        if (ply < 0 || ply > MAX_PLY) return;
        auto &slot = slots_[ply];
        if (slot[0] == move) return;
        slot[1] = slot[0];
        slot[0] = move;
    }

    // 0 = primary killer, 1 = secondary, -1 = not a killer at this ply
    int rank(int ply, chess::Move move) const {
        if (ply < 0 || ply > MAX_PLY || move == chess::Move::NO_MOVE) return -1;
        if (slots_[ply][0] == move) return 0;
        if (slots_[ply][1] == move) return 1;
        return -1;
    }

    void clear() {
        for (auto &slot : slots_) slot.fill(chess::Move(chess::Move::NO_MOVE));
    }

private:
    std::array<std::array<chess::Move, 2>, MAX_PLY + 1> slots_{};
};

// Quiet-move history keyed by (side to move, destination square). Saturates instead of decaying.
class HistoryTable {
public:
    static constexpr std::int32_t LIMIT = 1 << 28;

    void reward(chess::Color side, chess::Square to, int depth) {
        std::int32_t &v = table_[side == chess::Color::WHITE ? 0 : 1][to.index()];
        v = std::min<std::int32_t>(LIMIT, v + depth * depth);
    }

    std::int32_t score(chess::Color side, chess::Square to) const {
        return table_[side == chess::Color::WHITE ? 0 : 1][to.index()];
    }

    void clear() {
        for (auto &row : table_) row.fill(0);
    }

private:
    std::array<std::array<std::int32_t, 64>, 2> table_{};
};

struct ScoredMove {
    chess::Move move;
    std::int64_t key;
};

namespace ordering {

constexpr std::int64_t TT_MOVE = 10'000'000;
constexpr std::int64_t CAPTURE = 2'000'000;
constexpr std::int64_t PROMOTION = 1'900'000;
constexpr std::int64_t KILLER_PRIMARY = 1'500'000;
constexpr std::int64_t KILLER_SECONDARY = 1'400'000;
constexpr std::int64_t CHECK = 1'000'000;
// History sits below CHECK because it is capped at HistoryTable::LIMIT scaled down.
constexpr std::int64_t HISTORY_SCALE_SHIFT = 9;

} // namespace ordering

bool isNoisy(const chess::Board &board, chess::Move move);

// Value of the captured piece (en passant counts as a pawn).
int victimValue(const chess::Board &board, chess::Move move);

// MVV-LVA key: most valuable victim first, least valuable attacker breaks ties.
int mvvLva(const chess::Board &board, chess::Move move);

// Makes and unmakes the move to find out whether it gives check.
bool givesCheck(chess::Board &board, chess::Move move);

// Orders moves: TT move, captures by MVV-LVA, promotions, killers, checks, history, rest.
std::vector<ScoredMove> orderMoves(chess::Board &board, const chess::Movelist &moves, chess::Move ttMove,
                                   int ply, const KillerTable &killers, const HistoryTable &history);

// Deterministic choice used when no search result exists: captures first, then
// checks, then MVV-LVA, then the smallest move text. NO_MOVE when there are no legal moves.
chess::Move defaultMove(const chess::Board &board);

} // namespace tandem
