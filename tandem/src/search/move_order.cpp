#include "move_order.hpp"
#include "../eval/evaluator.hpp"

#include <algorithm>
#include <string>
#include <tuple>

namespace tandem {

bool isNoisy(const chess::Board &board, chess::Move move) {
    return board.isCapture(move) || move.typeOf() == chess::Move::PROMOTION;
}

int victimValue(const chess::Board &board, chess::Move move) {
    if (move.typeOf() == chess::Move::ENPASSANT) return Evaluator::PAWN_VALUE;
    if (move.typeOf() == chess::Move::CASTLING) return 0;
    const auto victim = board.at(move.to());
    if (victim == chess::Piece::NONE) return 0;
    return Evaluator::pieceValue(victim.type());
}

int mvvLva(const chess::Board &board, chess::Move move) {
    if (!board.isCapture(move)) return 0;
    const auto attacker = board.at(move.from());
    const int attacker_value = attacker == chess::Piece::NONE ? 0 : Evaluator::pieceValue(attacker.type());
    return 10000 + victimValue(board, move) * 10 - attacker_value / 10;
}

bool givesCheck(chess::Board &board, chess::Move move) {
    board.makeMove(move);
    const bool check = board.inCheck();
    board.unmakeMove(move);
    return check;
}

std::vector<ScoredMove> orderMoves(chess::Board &board, const chess::Movelist &moves, chess::Move ttMove,
                                   int ply, const KillerTable &killers, const HistoryTable &history) {
    std::vector<ScoredMove> out;
    out.reserve(moves.size());
    const chess::Color us = board.sideToMove();

    for (const auto &move : moves) {
        std::int64_t key = 0;
        if (ttMove != chess::Move::NO_MOVE && move == ttMove) {
            key = ordering::TT_MOVE;
        } else if (board.isCapture(move)) {
            key = ordering::CAPTURE + mvvLva(board, move);
        } else if (move.typeOf() == chess::Move::PROMOTION) {
            key = ordering::PROMOTION + Evaluator::pieceValue(move.promotionType());
        } else if (const int k = killers.rank(ply, move); k >= 0) {
            key = k == 0 ? ordering::KILLER_PRIMARY : ordering::KILLER_SECONDARY;
        } else if (givesCheck(board, move)) {
            key = ordering::CHECK;
        } else {
            key = history.score(us, move.to()) >> ordering::HISTORY_SCALE_SHIFT;
        }
        out.push_back(ScoredMove{move, key});
    }

    std::stable_sort(out.begin(), out.end(), [](const ScoredMove &a, const ScoredMove &b) {
        return a.key > b.key;
    });
    return out;
}

chess::Move defaultMove(const chess::Board &board) {
    chess::Board scratch = board;
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, scratch);
    if (moves.empty()) return chess::Move(chess::Move::NO_MOVE);

    // (capture, check, mvv-lva) descending, then move text ascending
    auto rank = [&](chess::Move m) {
        return std::make_tuple(scratch.isCapture(m) ? 1 : 0, givesCheck(scratch, m) ? 1 : 0, mvvLva(scratch, m));
    };

    chess::Move best = moves[0];
    auto best_rank = rank(best);
    std::string best_text = chess::uci::moveToUci(best);
    for (int i = 1; i < moves.size(); ++i) {
        const chess::Move m = moves[i];
        const auto r = rank(m);
        const std::string text = chess::uci::moveToUci(m);
        if (r > best_rank || (r == best_rank && text < best_text)) {
            best = m;
            best_rank = r;
            best_text = text;
        }
    }
    return best;
}

} // namespace tandem
