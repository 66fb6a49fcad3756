#include "alpha_beta.hpp"
#include "../uci/output.hpp"

#include <algorithm>
#include <string>

namespace tandem {

bool AlphaBetaSearcher::poll_stop() {
    if (aborted_) return true;
    if ((nodes_ & (POLL_INTERVAL - 1)) != 0) return false;
    if (stop_token_.stop_requested() || clock::now() >= deadline_) aborted_ = true;
    return aborted_;
}

void AlphaBetaSearcher::report_pruning_failure(const char *step, const std::exception &e) const {
    std::string text = "error pruning=";
    text += step;
    text += " what=";
    text += e.what();
    uci::infoString(text);
}

cppcoro::generator<DepthResult> AlphaBetaSearcher::iterate(chess::Board &board, int max_depth) {
    session_.newSearch();
    nodes_ = 0;
    aborted_ = false;

    const int limit = std::clamp(max_depth, 1, MAX_PLY - 1);
    int previous = 0;
    for (int depth = 1; depth <= limit; ++depth) {
        std::optional<DepthResult> result = searchDepth(board, depth, previous);
        if (!result) co_return;
        previous = result->score;
        const bool terminal = result->best_move == chess::Move::NO_MOVE;
        co_yield *result;
        if (terminal) co_return;
    }
}

std::optional<DepthResult> AlphaBetaSearcher::searchDepth(chess::Board &board, int depth, int previous_score) {
    const auto started = clock::now();
    seldepth_ = 0;

    int window = ASPIRATION_WINDOW;
    int alpha = -INF_SCORE;
    int beta = INF_SCORE;
    if (config_.aspiration && depth > 1 && !is_mate_score(previous_score)) {
        alpha = previous_score - window;
        beta = previous_score + window;
    }

    RootResult root{0, chess::Move(chess::Move::NO_MOVE)};
    for (;;) {
        root = negamax_root(board, depth, alpha, beta);
        if (aborted_) return std::nullopt;

        const bool fail_low = root.score <= alpha && alpha > -INF_SCORE;
        const bool fail_high = root.score >= beta && beta < INF_SCORE;
        if (!fail_low && !fail_high) break;

        if (window >= ASPIRATION_MAX_WINDOW) {
            alpha = -INF_SCORE;
            beta = INF_SCORE;
            continue;
        }
        // Widen and re-centre on the score that broke the window.
        window = std::min(window * 2, ASPIRATION_MAX_WINDOW);
        alpha = std::max(-INF_SCORE, root.score - window);
        beta = std::min(INF_SCORE, root.score + window);
    }

    DepthResult result;
    result.depth = depth;
    result.seldepth = std::max(seldepth_, depth);
    result.score = root.score;
    result.best_move = root.best_move;
    if (root.best_move != chess::Move::NO_MOVE) {
        result.pv = principalVariation(board, depth);
        if (result.pv.empty() || result.pv.front() != root.best_move) result.pv.assign(1, root.best_move);
    }
    result.nodes = nodes_;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
    return result;
}

AlphaBetaSearcher::RootResult AlphaBetaSearcher::negamax_root(chess::Board &board, int depth, int alpha, int beta) {
    ++nodes_;
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty()) return {board.inCheck() ? mated_in(0) : 0, chess::Move(chess::Move::NO_MOVE)};

    const std::uint64_t key = board.hash();
    const auto entry = session_.tt.probe(key, 0);
    const chess::Move tt_move = entry ? entry->bestMove() : chess::Move(chess::Move::NO_MOVE);
    const auto ordered = orderMoves(board, moves, tt_move, 0, session_.killers, session_.history);

    const int original_alpha = alpha;
    int best_score = -INF_SCORE;
    chess::Move best_move = chess::Move::NO_MOVE;
    int index = 0;

    for (const auto &sm : ordered) {
        board.makeMove(sm.move);
        int score;
        if (index == 0) {
            score = -negamax(board, depth - 1, -beta, -alpha, 1, true, true);
        } else {
            score = -negamax(board, depth - 1, -alpha - 1, -alpha, 1, false, true);
            if (!aborted_ && score > alpha && score < beta) {
                score = -negamax(board, depth - 1, -beta, -alpha, 1, true, true);
            }
        }
        board.unmakeMove(sm.move);
        if (aborted_) return {0, chess::Move(chess::Move::NO_MOVE)};
        ++index;

        if (score > best_score) {
            best_score = score;
            best_move = sm.move;
            if (score > alpha) {
                alpha = score;
                if (alpha >= beta) break;
            }
        }
    }

    const Bound bound = best_score <= original_alpha ? Bound::UPPER
                      : best_score >= beta           ? Bound::LOWER
                                                     : Bound::EXACT;
    session_.tt.store(key, depth, best_score, bound, best_move, 0);
    return {best_score, best_move};
}

std::optional<int> AlphaBetaSearcher::null_move_cutoff(chess::Board &board, int depth, int beta, int ply) {
    bool made = false;
    try {
        board.makeNullMove();
        made = true;
        const int score = -negamax(board, depth - 1 - NMP_REDUCTION, -beta, -beta + 1, ply + 1, false, false);
        board.unmakeNullMove();
        made = false;
        if (!aborted_ && score >= beta) return beta;
    } catch (const std::exception &e) {
        if (made) board.unmakeNullMove();
        report_pruning_failure("null-move", e);
    }
    return std::nullopt;
}

int AlphaBetaSearcher::negamax(chess::Board &board, int depth, int alpha, int beta, int ply, bool is_pv,
                               bool null_allowed) {
    alpha = std::max(alpha, -INF_SCORE);
    beta = std::min(beta, INF_SCORE);
    if (poll_stop()) return 0;
    ++nodes_;
    seldepth_ = std::max(seldepth_, ply);

    if (ply >= MAX_PLY) return evaluator_.staticScore(board);

    const std::uint64_t key = board.hash();
    const auto entry = session_.tt.probe(key, ply);
    if (entry && config_.tt_cutoffs && entry->depth >= depth) {
        if (entry->bound == Bound::EXACT) return entry->score;
        if (entry->bound == Bound::UPPER && entry->score <= alpha) return entry->score;
        if (entry->bound == Bound::LOWER && entry->score >= beta) return entry->score;
    }

    if (board.isRepetition(1)) return 0;
    if (board.isHalfMoveDraw()) {
        return board.getHalfMoveDrawType().first == chess::GameResultReason::CHECKMATE ? mated_in(ply) : 0;
    }

    const bool in_check = board.inCheck();
    const int requested_depth = depth;
    if (in_check) ++depth;
    if (depth <= 0) return quiescence(board, alpha, beta, ply, 0);

    if (config_.null_move && null_allowed && !in_check && depth >= NMP_MIN_DEPTH && beta < MATE_BOUND &&
        Evaluator::nonPawnMaterial(board) > NMP_MATERIAL_GUARD) {
        if (const auto cutoff = null_move_cutoff(board, depth, beta, ply)) return *cutoff;
        if (aborted_) return 0;
    }

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty()) return in_check ? mated_in(ply) : 0;

    const chess::Move tt_move = entry ? entry->bestMove() : chess::Move(chess::Move::NO_MOVE);
    const auto ordered = orderMoves(board, moves, tt_move, ply, session_.killers, session_.history);

    // Frontier futility needs the parent's static score.
    std::optional<int> futility_base;
    if (config_.futility && depth == 1 && !in_check && !is_pv) {
        try {
            futility_base = evaluator_.staticScore(board) + FUTILITY_MARGIN;
        } catch (const std::exception &e) {
            report_pruning_failure("futility", e);
        }
    }
    const bool count_pruning = config_.move_count_pruning && depth >= MCP_MIN_DEPTH && !in_check && !is_pv;

    const chess::Color us = board.sideToMove();
    const int original_alpha = alpha;
    int best_score = -INF_SCORE;
    chess::Move best_move = chess::Move::NO_MOVE;
    int move_index = 0;

    for (const auto &sm : ordered) {
        const chess::Move move = sm.move;
        const bool noisy = isNoisy(board, move);
        board.makeMove(move);
        const bool check = board.inCheck();
        const bool quiet = !noisy && !check;

        if (quiet && move_index > 0 && alpha > -MATE_BOUND) {
            if (futility_base && *futility_base <= alpha) {
                board.unmakeMove(move);
                best_score = std::max(best_score, *futility_base);
                ++move_index;
                continue;
            }
            if (count_pruning && move_index >= MCP_START_INDEX) {
                board.unmakeMove(move);
                best_score = std::max(best_score, alpha);
                ++move_index;
                continue;
            }
        }

        int score = 0;
        bool full_depth = true;
        if (config_.late_move_reductions && quiet && !is_pv && !in_check && depth >= LMR_MIN_DEPTH &&
            move_index >= LMR_MIN_INDEX) {
            const int reduction = LMR_BASE_REDUCTION + (move_index >= 4 ? 1 : 0);
            const int reduced = std::max(1, depth - 1 - reduction);
            score = -negamax(board, reduced, -alpha - 1, -alpha, ply + 1, false, true);
            full_depth = !aborted_ && score > alpha;
        }
        if (full_depth && !aborted_) {
            if (move_index == 0) {
                score = -negamax(board, depth - 1, -beta, -alpha, ply + 1, is_pv, true);
            } else {
                score = -negamax(board, depth - 1, -alpha - 1, -alpha, ply + 1, false, true);
                if (!aborted_ && score > alpha && score < beta) {
                    score = -negamax(board, depth - 1, -beta, -alpha, ply + 1, is_pv, true);
                }
            }
        }
        board.unmakeMove(move);
        if (aborted_) return 0;
        ++move_index;

        if (score > best_score) {
            best_score = score;
            best_move = move;
            if (score > alpha) {
                alpha = score;
                if (alpha >= beta) {
                    if (!noisy) {
                        session_.killers.record(ply, move);
                        session_.history.reward(us, move.to(), depth);
                    }
                    break;
                }
            }
        }
    }

    const Bound bound = best_score <= original_alpha ? Bound::UPPER
                      : best_score >= beta           ? Bound::LOWER
                                                     : Bound::EXACT;
    session_.tt.store(key, requested_depth, best_score, bound, best_move, ply);
    return best_score;
}

int AlphaBetaSearcher::quiescence(chess::Board &board, int alpha, int beta, int ply, int qply) {
    if (poll_stop()) return 0;
    ++nodes_;
    seldepth_ = std::max(seldepth_, ply);

    if (board.isRepetition(1) || board.isInsufficientMaterial()) return 0;

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (moves.empty()) return board.inCheck() ? mated_in(ply) : 0;
    if (board.isHalfMoveDraw()) return 0;

    const int stand_pat = evaluator_.staticScore(board);
    if (ply >= MAX_PLY) return stand_pat;
    if (stand_pat >= beta) return beta;
    if (stand_pat > alpha) alpha = stand_pat;

    const bool with_checks = config_.quiescence_checks && qply < Q_CHECK_PLIES;
    std::vector<ScoredMove> candidates;
    for (const auto &move : moves) {
        if (isNoisy(board, move)) {
            const int promo = move.typeOf() == chess::Move::PROMOTION ? Evaluator::pieceValue(move.promotionType()) : 0;
            candidates.push_back(ScoredMove{move, mvvLva(board, move) + promo});
        } else if (with_checks && givesCheck(board, move)) {
            candidates.push_back(ScoredMove{move, 0});
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ScoredMove &a, const ScoredMove &b) { return a.key > b.key; });

    for (const auto &sm : candidates) {
        const chess::Move move = sm.move;
        if (config_.delta_pruning && board.isCapture(move) && move.typeOf() != chess::Move::PROMOTION &&
            stand_pat + victimValue(board, move) + Q_DELTA_MARGIN <= alpha) {
            continue;
        }
        board.makeMove(move);
        const int score = -quiescence(board, -beta, -alpha, ply + 1, qply + 1);
        board.unmakeMove(move);
        if (aborted_) return 0;

        if (score >= beta) return beta;
        if (score > alpha) alpha = score;
    }
    return alpha;
}

std::vector<chess::Move> AlphaBetaSearcher::principalVariation(const chess::Board &root, int max_length) const {
    chess::Board board = root;
    std::vector<chess::Move> pv;
    std::vector<std::uint64_t> seen{board.hash()};

    while (static_cast<int>(pv.size()) < max_length) {
        const auto entry = session_.tt.probe(board.hash());
        if (!entry) break;
        const chess::Move move = entry->bestMove();
        if (move == chess::Move::NO_MOVE) break;

        chess::Movelist legal;
        chess::movegen::legalmoves(legal, board);
        if (std::find(legal.begin(), legal.end(), move) == legal.end()) break;

        board.makeMove(move);
        pv.push_back(move);
        if (std::find(seen.begin(), seen.end(), board.hash()) != seen.end()) break;
        seen.push_back(board.hash());
    }
    return pv;
}

} // namespace tandem
