#include "uci_bridge.hpp"
#include "../uci/protocol.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace tandem_bridge {

using clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {

milliseconds remainingUntil(clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<milliseconds>(deadline - clock::now());
    return std::max(left, milliseconds{0});
}

tandem::uci::PositionCommand toPositionCommand(const GoRequest &request) {
    tandem::uci::PositionCommand cmd;
    cmd.startpos = request.fen.empty();
    cmd.fen = request.fen;
    cmd.moves = request.moves;
    return cmd;
}

} // namespace

// Marks the stream as the active reader. A stream abandoned before bestmove
// stops the worker and drains its answer.
struct UciBridge::SearchActivity {
    explicit SearchActivity(UciBridge &b) : bridge(b) { bridge.search_active_.store(true); }
    ~SearchActivity() {
        bridge.search_active_.store(false);
        if (!finished) bridge.abortCurrentSearch();
    }

    UciBridge &bridge;
    bool finished = false;
};

UciBridge::UciBridge(BridgeConfig config) : config_(std::move(config)) {}

UciBridge::~UciBridge() {
    shutdown();
}

void UciBridge::dbg(const std::string &text) const {
    if (!config_.debug) return;
    std::cerr << "[bridge] " << text << '\n';
}

bool UciBridge::workerRunning() {
    std::lock_guard<std::mutex> io(io_mu_);
    return proc_ && proc_->running();
}

bool UciBridge::send(const std::string &line) {
    std::lock_guard<std::mutex> io(io_mu_);
    if (!proc_) return false;
    sent_.push_back(line);
    dbg(">> " + line);
    return proc_->writeLine(line);
}

ReadResult UciBridge::readLocked(milliseconds timeout) {
    if (!proc_) return ReadResult{ReadStatus::Closed, {}};
    ReadResult r = proc_->readLine(timeout);
    if (r.isLine()) {
        dbg("<< " + r.line);
        std::lock_guard<std::mutex> lines(lines_mu_);
        last_lines_.push_back(r.line);
        while (last_lines_.size() > config_.last_lines) last_lines_.pop_front();
    }
    return r;
}

ReadResult UciBridge::read(milliseconds timeout) {
    std::lock_guard<std::mutex> lock(read_mu_);
    return readLocked(timeout);
}

void UciBridge::discardWorkerLocked() {
    std::unique_ptr<WorkerProcess> old;
    {
        std::lock_guard<std::mutex> io(io_mu_);
        old = std::move(proc_);
    }
    if (old) {
        dbg("discarding worker pid=" + std::to_string(old->pid()));
        old->kill();
    }
}

Status UciBridge::spawnAndHandshakeLocked() {
    discardWorkerLocked();

    auto proc = std::make_unique<WorkerProcess>(config_.command);
    std::string error;
    if (!proc->start(error)) return Status::error("failed to start engine: " + error);
    dbg("spawned pid=" + std::to_string(proc->pid()) + " cmd=" + config_.command);
    {
        std::lock_guard<std::mutex> io(io_mu_);
        proc_ = std::move(proc);
    }

    if (!send("uci")) return Status::error("engine closed its input during handshake");
    const auto deadline = clock::now() + config_.handshake_timeout;
    for (;;) {
        const milliseconds left = remainingUntil(deadline);
        if (left.count() == 0) break;
        const ReadResult r = readLocked(left);
        if (r.status == ReadStatus::Closed) return Status::error("engine terminated during handshake");
        if (r.status == ReadStatus::Timeout) break;
        if (r.line == "uciok") return Status::success();
    }
    return Status::error("handshake timed out after " + std::to_string(config_.handshake_timeout.count()) + "ms");
}

Status UciBridge::ensureStartedLocked() {
    if (workerRunning()) return Status::success();

    Status first = spawnAndHandshakeLocked();
    if (first) return first;

    dbg("handshake failed (" + first.message + "), restarting once");
    restarts_.fetch_add(1);
    Status second = spawnAndHandshakeLocked();
    if (!second) {
        discardWorkerLocked();
        return Status::error("engine handshake failed after restart: " + second.message);
    }
    return second;
}

Status UciBridge::ensureStarted() {
    std::lock_guard<std::mutex> lock(read_mu_);
    return ensureStartedLocked();
}

bool UciBridge::probeReadyLocked() {
    if (!send("isready")) return false;
    const auto deadline = clock::now() + config_.ready_timeout;
    for (;;) {
        const milliseconds left = remainingUntil(deadline);
        if (left.count() == 0) return false;
        const ReadResult r = readLocked(std::min(config_.ready_poll_slice, left));
        if (r.status == ReadStatus::Closed) return false;
        if (r.status == ReadStatus::Timeout) continue;
        // Leftovers of an earlier search (info, bestmove) are skipped here.
        if (r.line == "readyok") return true;
    }
}

bool UciBridge::isReady(bool restart_on_timeout) {
    std::lock_guard<std::mutex> lock(read_mu_);
    if (Status st = ensureStartedLocked(); !st) {
        dbg("not ready: " + st.message);
        return false;
    }
    if (probeReadyLocked()) return true;
    if (!restart_on_timeout) return false;

    dbg("readiness probe timed out, restarting worker");
    restarts_.fetch_add(1);
    if (Status st = spawnAndHandshakeLocked(); !st) {
        dbg("restart failed: " + st.message);
        return false;
    }
    return probeReadyLocked();
}

void UciBridge::abortCurrentSearch() {
    if (!workerRunning()) return;
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        const auto now = clock::now();
        if (last_stop_ && now - *last_stop_ < config_.stop_throttle) {
            dbg("stop throttled");
            return;
        }
        last_stop_ = now;
    }
    if (!send("stop")) return;

    // The active stream will read the bestmove itself.
    if (search_active_.load()) {
        dbg("search stream is reading, not draining");
        return;
    }
    std::unique_lock<std::mutex> lock(read_mu_, std::try_to_lock);
    if (!lock.owns_lock()) {
        dbg("another reader holds the worker, not draining");
        return;
    }

    const auto deadline = clock::now() + config_.drain_timeout;
    for (;;) {
        const milliseconds left = remainingUntil(deadline);
        if (left.count() == 0) break;
        const ReadResult r = readLocked(std::min(config_.drain_poll_slice, left));
        if (r.status == ReadStatus::Closed) return;
        if (r.isLine() && r.line.rfind("bestmove", 0) == 0) return;
    }
    dbg("drain timed out");
}

void UciBridge::shutdown() {
    std::lock_guard<std::mutex> lock(read_mu_);
    std::unique_ptr<WorkerProcess> old;
    {
        std::lock_guard<std::mutex> io(io_mu_);
        old = std::move(proc_);
    }
    if (!old) return;
    if (old->running() && old->writeLine("quit") && !old->waitExit(milliseconds{500})) {
        dbg("worker ignored quit");
    }
    old->kill();
}

std::vector<std::string> UciBridge::sentCommands() const {
    std::lock_guard<std::mutex> io(io_mu_);
    return sent_;
}

std::vector<std::string> UciBridge::lastLines() const {
    std::lock_guard<std::mutex> lines(lines_mu_);
    return {last_lines_.begin(), last_lines_.end()};
}

std::string UciBridge::tail(std::size_t count) const {
    std::lock_guard<std::mutex> lines(lines_mu_);
    const std::size_t start = last_lines_.size() > count ? last_lines_.size() - count : 0;
    std::string out;
    for (std::size_t i = start; i < last_lines_.size(); ++i) {
        if (!out.empty()) out += " | ";
        out += last_lines_[i];
    }
    return out;
}

std::string UciBridge::positionCommand(const GoRequest &request) {
    std::string cmd = request.fen.empty() ? "position startpos" : "position fen " + request.fen;
    if (!request.moves.empty()) {
        cmd += " moves";
        for (const auto &m : request.moves) cmd += " " + m;
    }
    return cmd;
}

std::string UciBridge::goCommand(const GoRequest &request) {
    std::string cmd = "go";
    if (request.depth) cmd += " depth " + std::to_string(*request.depth);
    if (request.rollouts) cmd += " rollouts " + std::to_string(*request.rollouts);
    if (request.movetime_ms) cmd += " movetime " + std::to_string(*request.movetime_ms);
    return cmd;
}

Status UciBridge::validate(const GoRequest &request) {
    if (!request.depth && !request.movetime_ms) return Status::error("missing depth or movetime");
    if (request.depth && *request.depth < 1) return Status::error("depth must be at least 1");
    if (request.movetime_ms && *request.movetime_ms < 1) return Status::error("movetime must be positive");
    if (request.rollouts && *request.rollouts < 0) return Status::error("rollouts must not be negative");
    if (request.side && *request.side != "white" && *request.side != "black") {
        return Status::error("side must be white or black");
    }
    if (!request.fen.empty()) {
        if (Status st = tandem::uci::validateFen(request.fen); !st) return Status::error("invalid fen: " + st.message);
    }
    for (const auto &m : request.moves) {
        if (!tandem::uci::isMoveText(m)) return Status::error("invalid move text '" + m + "'");
    }
    chess::Board board;
    if (Status st = tandem::uci::buildBoard(toPositionCommand(request), board); !st) return st;
    return Status::success();
}

cppcoro::generator<BridgeEvent> UciBridge::streamGo(GoRequest request, const CancelToken *cancel) {
    if (Status st = validate(request); !st) {
        co_yield BridgeEvent::error(st.message);
        co_return;
    }
    chess::Board board;
    if (Status st = tandem::uci::buildBoard(toPositionCommand(request), board); !st) {
        co_yield BridgeEvent::error(st.message);
        co_return;
    }
    if (request.side) {
        const bool white = board.sideToMove() == chess::Color::WHITE;
        if ((*request.side == "white") != white) {
            co_yield BridgeEvent::info(json{{"string", "warning side mismatch: request says " + *request.side +
                                                           ", position has " + (white ? "white" : "black") +
                                                           " to move"}});
        }
    }

    if (Status st = ensureStarted(); !st) {
        co_yield BridgeEvent::error(st.message);
        co_return;
    }

    abortCurrentSearch();
    const int restarts_before = restarts_.load();
    if (request.new_game && !send("ucinewgame")) {
        co_yield BridgeEvent::error("failed to send ucinewgame to engine");
        co_return;
    }
    if (!send(positionCommand(request))) {
        co_yield BridgeEvent::error("failed to send position to engine");
        co_return;
    }
    if (!isReady(true)) {
        co_yield BridgeEvent::error("engine not ready");
        co_return;
    }
    // A restarted worker lost the position.
    if (restarts_.load() != restarts_before) {
        if (!send(positionCommand(request)) || !isReady(false)) {
            co_yield BridgeEvent::error("engine not ready after restart");
            co_return;
        }
    }
    if (!send(goCommand(request))) {
        co_yield BridgeEvent::error("failed to send go to engine");
        co_return;
    }

    SearchActivity activity(*this);
    for (;;) {
        if (cancel != nullptr && cancel->cancelled()) {
            activity.finished = true;
            search_active_.store(false);
            abortCurrentSearch();
            co_yield BridgeEvent::done();
            co_return;
        }

        const ReadResult r = read(config_.search_poll_slice);
        if (r.status == ReadStatus::Timeout) continue;
        if (r.status == ReadStatus::Closed) {
            activity.finished = true;
            std::optional<int> code;
            {
                std::lock_guard<std::mutex> lock(read_mu_);
                {
                    std::lock_guard<std::mutex> io(io_mu_);
                    if (proc_) code = proc_->waitExit(milliseconds{200});
                }
                discardWorkerLocked();
            }
            std::string message = "engine terminated unexpectedly";
            if (code) message += " (exit code " + std::to_string(*code) + ")";
            const std::string last = tail(config_.error_tail);
            if (!last.empty()) message += "; last output: " + last;
            co_yield BridgeEvent::error(message);
            co_return;
        }

        const std::string &line = r.line;
        if (line.rfind("bestmove", 0) == 0) {
            activity.finished = true;
            search_active_.store(false);
            std::istringstream iss(line);
            std::string keyword;
            std::string move;
            iss >> keyword >> move;
            if (move.empty()) move = "0000";
            if (move != "0000" && !tandem::uci::findLegalMove(board, move)) {
                co_yield BridgeEvent::error("illegal move from engine: " + move);
                co_return;
            }
            co_yield BridgeEvent::bestMove(move);
            co_yield BridgeEvent::done();
            co_return;
        }
        if (line.rfind("info", 0) == 0) {
            if (auto info = parseInfoLine(line)) co_yield BridgeEvent::info(*info);
        }
    }
}

} // namespace tandem_bridge
