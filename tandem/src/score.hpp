#pragma once

#include <algorithm>

namespace tandem {

constexpr int MAX_PLY = 64;
constexpr int INF_SCORE = 60000;
constexpr int MATE_SCORE = 30000;
// Any score at or beyond this magnitude encodes a forced mate.
constexpr int MATE_BOUND = MATE_SCORE - MAX_PLY;

constexpr int mated_in(int ply) { return -MATE_SCORE + ply; }
constexpr int mate_in(int ply) { return MATE_SCORE - ply; }

constexpr bool is_mate_score(int score) { return score >= MATE_BOUND || score <= -MATE_BOUND; }

// Plies until mate for a mate score (positive: we mate, negative: we get mated).
constexpr int mate_distance(int score) {
    return score > 0 ? MATE_SCORE - score : -(MATE_SCORE + score);
}

constexpr int clamp_score(int score) { return std::clamp(score, -INF_SCORE + 1, INF_SCORE - 1); }

} // namespace tandem
