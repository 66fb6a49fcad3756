#pragma once

#include "chess.hpp"
#include "../status.hpp"
#include "../search/search_algo.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::uci {

std::vector<std::string> split(const std::string &line);

struct PositionCommand {
    bool startpos = true;
    std::string fen; // six fields when !startpos
    std::vector<std::string> moves;
};

// position [startpos | fen <6 fields>] [moves <m>...]
// Checks syntax and FEN shape only; move legality is checked by applyMoves.
Status parsePosition(const std::string &line, PositionCommand &out);

// go [depth N] [rollouts N] [movetime ms] [wtime/btime/winc/binc/movestogo N] [infinite]
Status parseGo(const std::string &line, Limits &out);

// Placement, side, castling, en passant and counters; one king each, no pawns on
// the back ranks, side not to move not in check.
Status validateFen(const std::string &fen);

// from-square, to-square, optional promotion letter (q r b n).
bool isMoveText(std::string_view text);

// Matches the text against the legal moves of the position.
std::optional<chess::Move> findLegalMove(const chess::Board &board, std::string_view text);

// Plays the moves in order. Stops at the first illegal one and reports it; the
// board is then left part way, so callers work on a copy.
Status applyMoves(chess::Board &board, const std::vector<std::string> &moves, std::size_t from = 0);

// Base position plus all moves, or the first problem found.
Status buildBoard(const PositionCommand &command, chess::Board &out);

// "setoption name <id> [value <x>]" into name and value.
bool parseSetOption(const std::string &line, std::string &name, std::string &value);

} // namespace tandem::uci
