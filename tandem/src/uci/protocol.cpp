#include "protocol.hpp"
#include "../score.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace tandem::uci {

namespace {

bool parseCount(const std::string &text, long long &out) {
    if (text.empty()) return false;
    const char *first = text.data();
    const char *last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last && out >= 0;
}

Status validatePlacement(const std::string &placement) {
    int rank_count = 0;
    int white_kings = 0;
    int black_kings = 0;
    std::size_t pos = 0;
    while (pos <= placement.size()) {
        const std::size_t slash = placement.find('/', pos);
        const std::string rank = placement.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        ++rank_count;
        if (rank_count > 8) return Status::error("too many ranks");

        int files = 0;
        for (char c : rank) {
            if (c >= '1' && c <= '8') {
                files += c - '0';
                continue;
            }
            if (std::string_view("pnbrqkPNBRQK").find(c) == std::string_view::npos) {
                return Status::error(std::string("bad piece '") + c + "'");
            }
            // rank_count 1 is the eighth rank
            if ((c == 'p' || c == 'P') && (rank_count == 1 || rank_count == 8)) {
                return Status::error("pawn on back rank");
            }
            if (c == 'K') ++white_kings;
            if (c == 'k') ++black_kings;
            ++files;
        }
        if (files != 8) return Status::error("rank " + std::to_string(9 - rank_count) + " does not have 8 files");
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    if (rank_count != 8) return Status::error("expected 8 ranks");
    if (white_kings != 1 || black_kings != 1) return Status::error("each side needs exactly one king");
    return Status::success();
}

Status validateCastling(const std::string &castling) {
    if (castling == "-") return Status::success();
    if (castling.size() > 4) return Status::error("bad castling field");
    for (char c : castling) {
        if (std::string_view("KQkq").find(c) == std::string_view::npos) return Status::error("bad castling field");
        if (std::count(castling.begin(), castling.end(), c) > 1) return Status::error("bad castling field");
    }
    return Status::success();
}

} // namespace

std::vector<std::string> split(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

bool isMoveText(std::string_view text) {
    if (text.size() != 4 && text.size() != 5) return false;
    auto file = [](char c) { return c >= 'a' && c <= 'h'; };
    auto rank = [](char c) { return c >= '1' && c <= '8'; };
    if (!file(text[0]) || !rank(text[1]) || !file(text[2]) || !rank(text[3])) return false;
    return text.size() == 4 || std::string_view("qrbn").find(text[4]) != std::string_view::npos;
}

Status validateFen(const std::string &fen) {
    const std::vector<std::string> fields = split(fen);
    if (fields.size() != 6) return Status::error("fen needs 6 fields");

    if (Status placement = validatePlacement(fields[0]); !placement) return placement;
    if (fields[1] != "w" && fields[1] != "b") return Status::error("bad side to move");
    if (Status castling = validateCastling(fields[2]); !castling) return castling;

    const std::string &ep = fields[3];
    if (ep != "-") {
        const bool ok = ep.size() == 2 && ep[0] >= 'a' && ep[0] <= 'h' &&
                        ((fields[1] == "w" && ep[1] == '6') || (fields[1] == "b" && ep[1] == '3'));
        if (!ok) return Status::error("bad en passant square");
    }

    long long halfmove = 0;
    long long fullmove = 0;
    if (!parseCount(fields[4], halfmove)) return Status::error("bad halfmove clock");
    if (!parseCount(fields[5], fullmove) || fullmove < 1) return Status::error("bad fullmove number");

    // The side that just moved cannot have left its king in check.
    chess::Board board(fen);
    board.makeNullMove();
    const bool opponent_in_check = board.inCheck();
    board.unmakeNullMove();
    if (opponent_in_check) return Status::error("side not to move is in check");
    return Status::success();
}

Status parsePosition(const std::string &line, PositionCommand &out) {
    const std::vector<std::string> tokens = split(line);
    if (tokens.empty() || tokens[0] != "position") return Status::error("not a position command");
    if (tokens.size() < 2) return Status::error("position needs startpos or fen");

    PositionCommand cmd;
    std::size_t idx = 1;
    if (tokens[idx] == "startpos") {
        cmd.startpos = true;
        ++idx;
    } else if (tokens[idx] == "fen") {
        cmd.startpos = false;
        ++idx;
        int fields = 0;
        while (idx < tokens.size() && tokens[idx] != "moves" && fields < 6) {
            if (!cmd.fen.empty()) cmd.fen.push_back(' ');
            cmd.fen += tokens[idx++];
            ++fields;
        }
        if (fields != 6) return Status::error("fen needs 6 fields");
        if (Status fen_ok = validateFen(cmd.fen); !fen_ok) return Status::error("bad fen: " + fen_ok.message);
    } else {
        return Status::error("unknown position syntax '" + tokens[idx] + "'");
    }

    if (idx < tokens.size()) {
        if (tokens[idx] != "moves") return Status::error("unexpected token '" + tokens[idx] + "'");
        ++idx;
        for (; idx < tokens.size(); ++idx) {
            if (!isMoveText(tokens[idx])) return Status::error("bad move text '" + tokens[idx] + "'");
            cmd.moves.push_back(tokens[idx]);
        }
    }

    out = std::move(cmd);
    return Status::success();
}

Status parseGo(const std::string &line, Limits &out) {
    const std::vector<std::string> tokens = split(line);
    if (tokens.empty() || tokens[0] != "go") return Status::error("not a go command");

    Limits limits;
    auto is_keyword = [](const std::string &s) {
        return s == "searchmoves" || s == "ponder" || s == "wtime" || s == "btime" || s == "winc" ||
               s == "binc" || s == "movestogo" || s == "depth" || s == "nodes" || s == "mate" ||
               s == "movetime" || s == "infinite" || s == "rollouts";
    };

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const std::string &t = tokens[i];
        long long value = 0;
        auto read_number = [&]() -> bool {
            if (i + 1 >= tokens.size()) return false;
            return parseCount(tokens[++i], value);
        };

        if (t == "infinite") {
            limits.infinite = true;
        } else if (t == "ponder") {
            // pondering is not supported, searched like a normal go
        } else if (t == "searchmoves") {
            while (i + 1 < tokens.size() && !is_keyword(tokens[i + 1])) ++i;
        } else if (!is_keyword(t)) {
            return Status::error("unknown go token '" + t + "'");
        } else if (!read_number()) {
            return Status::error("bad number for " + t);
        } else if (t == "depth") {
            if (value < 1) return Status::error("depth must be at least 1");
            limits.depth = static_cast<int>(std::min<long long>(value, MAX_PLY - 1));
        } else if (t == "rollouts") {
            limits.rollouts = static_cast<int>(std::min<long long>(value, 10'000'000));
        } else if (t == "movetime") {
            limits.movetime_ms = static_cast<unsigned long long>(value);
        } else if (t == "wtime") {
            limits.wtime_ms = static_cast<unsigned long long>(value);
        } else if (t == "btime") {
            limits.btime_ms = static_cast<unsigned long long>(value);
        } else if (t == "winc") {
            limits.winc_ms = static_cast<unsigned long long>(value);
        } else if (t == "binc") {
            limits.binc_ms = static_cast<unsigned long long>(value);
        } else if (t == "movestogo") {
            limits.movestogo = static_cast<int>(std::min<long long>(value, 1000));
        }
        // nodes and mate take a number and are otherwise ignored
    }

    out = limits;
    return Status::success();
}

std::optional<chess::Move> findLegalMove(const chess::Board &board, std::string_view text) {
    if (!isMoveText(text)) return std::nullopt;
    chess::Movelist legal;
    chess::movegen::legalmoves(legal, board);
    for (const auto &m : legal) {
        if (chess::uci::moveToUci(m) == text) return m;
    }
    return std::nullopt;
}

Status applyMoves(chess::Board &board, const std::vector<std::string> &moves, std::size_t from) {
    for (std::size_t i = from; i < moves.size(); ++i) {
        const auto move = findLegalMove(board, moves[i]);
        if (!move) return Status::error("illegal move '" + moves[i] + "' at index " + std::to_string(i));
        board.makeMove(*move);
    }
    return Status::success();
}

Status buildBoard(const PositionCommand &command, chess::Board &out) {
    chess::Board board;
    if (command.startpos) {
        board.setFen(chess::constants::STARTPOS);
    } else {
        if (Status fen_ok = validateFen(command.fen); !fen_ok) return fen_ok;
        board.setFen(command.fen);
    }
    if (Status applied = applyMoves(board, command.moves); !applied) return applied;
    out = std::move(board);
    return Status::success();
}

bool parseSetOption(const std::string &line, std::string &name, std::string &value) {
    const std::vector<std::string> tokens = split(line);
    std::size_t name_index = std::string::npos;
    std::size_t value_index = std::string::npos;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i] == "name" && name_index == std::string::npos) name_index = i + 1;
        if (tokens[i] == "value" && value_index == std::string::npos) value_index = i + 1;
    }
    if (name_index == std::string::npos || name_index >= tokens.size()) return false;

    name.clear();
    value.clear();
    const std::size_t name_end = value_index == std::string::npos ? tokens.size() : value_index - 1;
    for (std::size_t i = name_index; i < name_end && i < tokens.size(); ++i) {
        if (!name.empty()) name.push_back(' ');
        name += tokens[i];
    }
    if (value_index != std::string::npos) {
        for (std::size_t i = value_index; i < tokens.size(); ++i) {
            if (!value.empty()) value.push_back(' ');
            value += tokens[i];
        }
    }
    return !name.empty();
}

} // namespace tandem::uci
