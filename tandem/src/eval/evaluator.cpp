#include "evaluator.hpp"
#include "../score.hpp"

#include <array>

namespace tandem {

namespace {

// Tables are laid out rank 1 first (a1 = index 0) from white's point of view.
// Black squares are mirrored with index ^ 56.
constexpr std::array<int, 64> PAWN_TABLE = {
      0,   0,   0,   0,   0,   0,   0,   0,
      5,  10,  10, -20, -20,  10,  10,   5,
      5,  -5, -10,   0,   0, -10,  -5,   5,
      0,   0,   0,  20,  20,   0,   0,   0,
      5,   5,  10,  25,  25,  10,   5,   5,
     10,  10,  20,  30,  30,  20,  10,  10,
     50,  50,  50,  50,  50,  50,  50,  50,
      0,   0,   0,   0,   0,   0,   0,   0,
};

constexpr std::array<int, 64> KNIGHT_TABLE = {
    -50, -40, -30, -30, -30, -30, -40, -50,
    -40, -20,   0,   5,   5,   0, -20, -40,
    -30,   5,  10,  15,  15,  10,   5, -30,
    -30,   0,  15,  20,  20,  15,   0, -30,
    -30,   5,  15,  20,  20,  15,   5, -30,
    -30,   0,  10,  15,  15,  10,   0, -30,
    -40, -20,   0,   0,   0,   0, -20, -40,
    -50, -40, -30, -30, -30, -30, -40, -50,
};

constexpr std::array<int, 64> BISHOP_TABLE = {
    -20, -10, -10, -10, -10, -10, -10, -20,
    -10,   5,   0,   0,   0,   0,   5, -10,
    -10,  10,  10,  10,  10,  10,  10, -10,
    -10,   0,  10,  10,  10,  10,   0, -10,
    -10,   5,   5,  10,  10,   5,   5, -10,
    -10,   0,   5,  10,  10,   5,   0, -10,
    -10,   0,   0,   0,   0,   0,   0, -10,
    -20, -10, -10, -10, -10, -10, -10, -20,
};

constexpr std::array<int, 64> ROOK_TABLE = {
      0,   0,   0,   5,   5,   0,   0,   0,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
      5,  10,  10,  10,  10,  10,  10,   5,
      0,   0,   0,   0,   0,   0,   0,   0,
};

constexpr std::array<int, 64> QUEEN_TABLE = {
    -20, -10, -10,  -5,  -5, -10, -10, -20,
    -10,   0,   5,   0,   0,   0,   0, -10,
    -10,   5,   5,   5,   5,   5,   0, -10,
      0,   0,   5,   5,   5,   5,   0,  -5,
     -5,   0,   5,   5,   5,   5,   0,  -5,
    -10,   0,   5,   5,   5,   5,   0, -10,
    -10,   0,   0,   0,   0,   0,   0, -10,
    -20, -10, -10,  -5,  -5, -10, -10, -20,
};

constexpr std::array<int, 64> KING_MG_TABLE = {
     20,  30,  10,   0,   0,  10,  30,  20,
     20,  20,   0,   0,   0,   0,  20,  20,
    -10, -20, -20, -20, -20, -20, -20, -10,
    -20, -30, -30, -40, -40, -30, -30, -20,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
};

constexpr std::array<int, 64> KING_EG_TABLE = {
    -50, -30, -30, -30, -30, -30, -30, -50,
    -30, -30,   0,   0,   0,   0, -30, -30,
    -30, -10,  20,  30,  30,  20, -10, -30,
    -30, -10,  30,  40,  40,  30, -10, -30,
    -30, -10,  30,  40,  40,  30, -10, -30,
    -30, -10,  20,  30,  30,  20, -10, -30,
    -30, -20, -10,   0,   0, -10, -20, -30,
    -50, -40, -30, -20, -20, -30, -40, -50,
};

// Indexed by rank counted from the pawn's own side (0 = first rank).
constexpr std::array<int, 8> PASSED_PAWN_BONUS = {0, 5, 10, 20, 35, 60, 100, 0};

constexpr std::array<int, 6> PHASE_WEIGHT = {0, 1, 1, 2, 4, 0}; // P N B R Q K

const std::array<int, 64> &tableFor(chess::PieceType type) {
    if (type == chess::PieceType::PAWN) return PAWN_TABLE;
    if (type == chess::PieceType::KNIGHT) return KNIGHT_TABLE;
    if (type == chess::PieceType::BISHOP) return BISHOP_TABLE;
    if (type == chess::PieceType::ROOK) return ROOK_TABLE;
    return QUEEN_TABLE;
}

int relativeIndex(int square, chess::Color color) {
    return color == chess::Color::WHITE ? square : (square ^ 56);
}

bool isPassed(int square, chess::Color color, const std::array<int, 16> &enemyPawns, int enemyCount) {
    const int file = square & 7;
    const int rank = square >> 3;
    for (int i = 0; i < enemyCount; ++i) {
        const int ef = enemyPawns[i] & 7;
        const int er = enemyPawns[i] >> 3;
        if (ef < file - 1 || ef > file + 1) continue;
        if (color == chess::Color::WHITE ? er > rank : er < rank) return false;
    }
    return true;
}

int passedPawnScore(const chess::Board &board, chess::Color color) {
    std::array<int, 16> enemy{};
    int enemyCount = 0;
    auto theirs = board.pieces(chess::PieceType::PAWN, ~color);
    while (theirs && enemyCount < 16) {
        enemy[enemyCount++] = static_cast<int>(theirs.pop());
    }

    int score = 0;
    auto ours = board.pieces(chess::PieceType::PAWN, color);
    while (ours) {
        const int sq = static_cast<int>(ours.pop());
        if (!isPassed(sq, color, enemy, enemyCount)) continue;
        score += PASSED_PAWN_BONUS[relativeIndex(sq, color) >> 3];
    }
    return score;
}

} // namespace

int Evaluator::pieceValue(chess::PieceType type) {
    if (type == chess::PieceType::PAWN) return PAWN_VALUE;
    if (type == chess::PieceType::KNIGHT) return KNIGHT_VALUE;
    if (type == chess::PieceType::BISHOP) return BISHOP_VALUE;
    if (type == chess::PieceType::ROOK) return ROOK_VALUE;
    if (type == chess::PieceType::QUEEN) return QUEEN_VALUE;
    return 0;
}

int Evaluator::nonPawnMaterial(const chess::Board &board) {
    int total = 0;
    for (const auto color : {chess::Color::WHITE, chess::Color::BLACK}) {
        total += board.pieces(chess::PieceType::KNIGHT, color).count() * KNIGHT_VALUE;
        total += board.pieces(chess::PieceType::BISHOP, color).count() * BISHOP_VALUE;
        total += board.pieces(chess::PieceType::ROOK, color).count() * ROOK_VALUE;
        total += board.pieces(chess::PieceType::QUEEN, color).count() * QUEEN_VALUE;
    }
    return total;
}

int Evaluator::phase(const chess::Board &board) {
    int phase = 0;
    auto bb = board.occ();
    while (bb) {
        const chess::Square sq(static_cast<int>(bb.pop()));
        const auto piece = board.at(sq);
        if (piece == chess::Piece::NONE) continue;
        phase += PHASE_WEIGHT[static_cast<int>(piece.type())];
    }
    return std::min(phase, MAX_PHASE);
}

std::optional<int> Evaluator::terminalScore(const chess::Board &board) const {
    const auto [reason, result] = board.isGameOver();
    if (reason == chess::GameResultReason::NONE) return std::nullopt;
    if (reason == chess::GameResultReason::CHECKMATE) return -MATE_SCORE;
    return 0;
}

int Evaluator::staticScore(const chess::Board &board) const {
    int common = 0; // white minus black
    int king_mg = 0;
    int king_eg = 0;

    auto bb = board.occ();
    while (bb) {
        const int idx = static_cast<int>(bb.pop());
        const auto piece = board.at(chess::Square(idx));
        if (piece == chess::Piece::NONE) continue;

        const chess::PieceType type = piece.type();
        const chess::Color color = piece.color();
        const int sign = color == chess::Color::WHITE ? 1 : -1;
        const int rel = relativeIndex(idx, color);

        if (type == chess::PieceType::KING) {
            king_mg += sign * KING_MG_TABLE[rel];
            king_eg += sign * KING_EG_TABLE[rel];
            continue;
        }
        common += sign * (pieceValue(type) + tableFor(type)[rel]);
    }

    for (const auto color : {chess::Color::WHITE, chess::Color::BLACK}) {
        const int sign = color == chess::Color::WHITE ? 1 : -1;
        if (board.pieces(chess::PieceType::BISHOP, color).count() >= 2) common += sign * BISHOP_PAIR_BONUS;
        common += sign * passedPawnScore(board, color);
    }

    const int ph = phase(board);
    const int king = (king_mg * ph + king_eg * (MAX_PHASE - ph)) / MAX_PHASE;

    const int white_view = common + king;
    const int score = board.sideToMove() == chess::Color::WHITE ? white_view : -white_view;
    return score + TEMPO_BONUS;
}

int Evaluator::evaluate(const chess::Board &board) const {
    if (auto terminal = terminalScore(board)) return *terminal;
    return staticScore(board);
}

} // namespace tandem
