#pragma once

#include "chess.hpp"

#include <optional>

namespace tandem {

// Hand-written static evaluation. All scores are centipawns from the side to move.
class Evaluator {
public:
    static constexpr int PAWN_VALUE = 100;
    static constexpr int KNIGHT_VALUE = 320;
    static constexpr int BISHOP_VALUE = 330;
    static constexpr int ROOK_VALUE = 500;
    static constexpr int QUEEN_VALUE = 900;

    static constexpr int BISHOP_PAIR_BONUS = 30;
    static constexpr int TEMPO_BONUS = 10;
    static constexpr int MAX_PHASE = 24;

    // Terminal check followed by the static score.
    int evaluate(const chess::Board &board) const;

    // Score of a finished game (checkmate: -MATE_SCORE, any draw: 0), nullopt while play goes on.
    std::optional<int> terminalScore(const chess::Board &board) const;

    // Material, piece-square tables, king placement tapered by phase, bishop pair,
    // passed pawns, tempo. Does not look at legal moves.
    int staticScore(const chess::Board &board) const;

    static int pieceValue(chess::PieceType type);

    // Knights, bishops, rooks and queens of both colors, in centipawns.
    static int nonPawnMaterial(const chess::Board &board);

    // 0 (bare kings and pawns) .. MAX_PHASE (all minor and major pieces on the board)
    static int phase(const chess::Board &board);
};

} // namespace tandem
