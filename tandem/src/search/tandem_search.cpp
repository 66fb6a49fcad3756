#include "tandem_search.hpp"
#include "move_order.hpp"
#include "../score.hpp"
#include "../uci/output.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <sstream>

namespace tandem {

TandemSearch::TandemSearch(tandem::Options &options, const tandem::TimeHandler *time_handler, bool refine)
    : SearchAlgo(options, time_handler),
      board_(chess::constants::STARTPOS),
      session_(static_cast<std::size_t>(std::max<long long>(1, options.getInt("hash", 16)))),
      refine_(refine) {}

void TandemSearch::applyOptions() {
    const long long hash_mb = options_.getInt("hash", 16);
    if (hash_mb > 0 && static_cast<std::size_t>(hash_mb) != session_.tt.megabytes()) {
        session_.tt.resize(static_cast<std::size_t>(hash_mb));
        uci::debug("hash resized=" + std::to_string(hash_mb) + "MB");
    }
}

void TandemSearch::onNewGame() {
    applyOptions();
    session_.newGame();
    board_.setFen(chess::constants::STARTPOS);
    cache_ = PositionCache{};
}

Status TandemSearch::handlePosition(const std::string &command) {
    uci::PositionCommand parsed;
    if (Status st = uci::parsePosition(command, parsed); !st) return st;

    // Determine if we can incrementally apply only the suffix
    const bool base_matches = cache_.has_base &&
        ((parsed.startpos && cache_.base_is_startpos) ||
         (!parsed.startpos && !cache_.base_is_startpos && parsed.fen == cache_.base_fen));

    bool prefix_ok = base_matches && parsed.moves.size() >= cache_.moves.size();
    for (std::size_t i = 0; prefix_ok && i < cache_.moves.size(); ++i) {
        if (cache_.moves[i] != parsed.moves[i]) prefix_ok = false;
    }

    // Both paths build on a copy so a rejected command leaves the current position untouched.
    chess::Board next;
    if (prefix_ok) {
        next = board_;
        if (Status st = uci::applyMoves(next, parsed.moves, cache_.moves.size()); !st) return st;
    } else {
        if (Status st = uci::buildBoard(parsed, next); !st) return st;
    }

    board_ = std::move(next);
    cache_.has_base = true;
    cache_.base_is_startpos = parsed.startpos;
    cache_.base_fen = parsed.fen;
    cache_.moves = std::move(parsed.moves);
    return Status::success();
}

ScheduleLimits TandemSearch::scheduleLimits(const Limits &limits) const {
    ScheduleLimits out;
    out.rollouts = limits.rollouts;

    if (limits.infinite) {
        out.max_depth = MAX_PLY - 1;
        if (limits.depth > 0) out.max_depth = limits.depth;
        return out;
    }

    TimeHandler::TimeBudget budget{0ULL, 0ULL};
    if (time_handler_ != nullptr) budget = time_handler_->selectTimeBudget(limits, board_.sideToMove());
    const bool timed = budget.soft_ms > 0ULL;

    if (limits.depth > 0) {
        out.max_depth = limits.depth;
    } else if (timed) {
        out.max_depth = MAX_PLY - 1;
    } else {
        out.max_depth = AlphaBetaSearcher::DEFAULT_DEPTH;
    }
    if (timed) {
        out.budget = std::chrono::milliseconds(budget.soft_ms);
        out.hard_limit = std::chrono::milliseconds(budget.hard_ms);
    }
    return out;
}

void TandemSearch::printDepth(const DepthResult &result, std::chrono::steady_clock::time_point started) const {
    const auto ms = static_cast<unsigned long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    const unsigned long long nps = ms == 0 ? result.nodes : (result.nodes * 1000ULL) / ms;

    std::ostringstream oss;
    oss << "info depth " << result.depth;
    oss << " seldepth " << result.seldepth;
    oss << " nodes " << result.nodes;
    oss << " nps " << nps;
    oss << " hashfull " << session_.tt.hashfull();
    if (is_mate_score(result.score)) {
        const int plies = mate_distance(result.score);
        oss << " score mate " << (plies > 0 ? (plies + 1) / 2 : -((-plies + 1) / 2));
    } else {
        oss << " score cp " << result.score;
    }
    oss << " time " << ms;
    if (!result.pv.empty()) {
        oss << " pv";
        for (const auto &m : result.pv) oss << ' ' << chess::uci::moveToUci(m);
    }
    uci::send(oss.str());
}

std::string TandemSearch::go(const Limits &limits, std::stop_token stop) {
    applyOptions();

    SchedulerConfig config;
    config.refine = refine_;
    config.safety_margin = std::chrono::milliseconds(options_.getInt("safetymargin", 20));
    config.refine_reserve_percent = static_cast<int>(options_.getInt("refinereserve", 15));
    RefinerConfig refiner_config;
    refiner_config.seed = static_cast<std::uint64_t>(options_.getInt("seed", static_cast<long long>(refiner_config.seed)));

    SearchScheduler scheduler(session_, evaluator_, SearchConfig{}, refiner_config, config);
    const ScheduleLimits schedule = scheduleLimits(limits);
    const auto started = std::chrono::steady_clock::now();

    ScheduleOutcome outcome;
    for (const SearchEvent &event : scheduler.run(board_, schedule, stop)) {
        switch (event.kind) {
        case SearchEvent::Kind::Depth:
            printDepth(event.depth, started);
            break;
        case SearchEvent::Kind::Refine: {
            std::ostringstream oss;
            oss << "refine rollouts " << event.refine.rollouts;
            if (event.refine.best_move != chess::Move::NO_MOVE) {
                oss << " best " << chess::uci::moveToUci(event.refine.best_move) << " mean "
                    << event.refine.best_mean << " visits " << event.refine.best_visits;
            }
            uci::infoString(oss.str());
            break;
        }
        case SearchEvent::Kind::Finished:
            outcome = event.outcome;
            break;
        }
    }

    // go infinite answers only after stop, even when the search ended early on a mate
    if (limits.infinite && stop.stop_possible()) {
        std::mutex mu;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, stop, [] { return false; });
    }

    uci::debug(std::string("source=") + toString(outcome.source) + " rollouts=" + std::to_string(outcome.rollouts) +
               " elapsed=" + std::to_string(outcome.elapsed.count()) + "ms");
    if (outcome.best_move == chess::Move::NO_MOVE) return "0000";
    return chess::uci::moveToUci(outcome.best_move);
}

std::string TandemSearch::bestMoveNow() {
    const chess::Move move = defaultMove(board_);
    if (move == chess::Move::NO_MOVE) return "0000";
    return chess::uci::moveToUci(move);
}

} // namespace tandem
