#pragma once

#include "bridge_event.hpp"
#include "worker_process.hpp"
#include "../status.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// cppcoro headers must be included at global scope
#include <cppcoro/generator.hpp>

namespace tandem_bridge {

using tandem::Status;

struct BridgeConfig {
    std::string command = "tandem";
    std::chrono::milliseconds handshake_timeout{3000};
    std::chrono::milliseconds ready_timeout{2000};
    std::chrono::milliseconds ready_poll_slice{250};
    std::chrono::milliseconds stop_throttle{100};
    std::chrono::milliseconds drain_timeout{800};
    std::chrono::milliseconds drain_poll_slice{100};
    std::chrono::milliseconds search_poll_slice{100};
    std::size_t last_lines = 50;
    std::size_t error_tail = 5;
    bool debug = false;
};

// One move request. Either depth or movetime must be present.
struct GoRequest {
    std::string fen; // empty => start position
    std::vector<std::string> moves;
    std::optional<int> depth;
    std::optional<int> rollouts;
    std::optional<int> movetime_ms;
    std::optional<std::string> side; // "white"/"black", checked against the FEN
    bool new_game = false;
};

// Set from any thread; the request stream checks it after every read.
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void reset() { cancelled_.store(false, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// Supervises one engine worker process speaking the UCI dialect. Every read of
// the worker's output happens under read_mu_; writes and the process handle are
// guarded by io_mu_ (always taken after read_mu_ when both are needed).
class UciBridge {
public:
    explicit UciBridge(BridgeConfig config);
    ~UciBridge();

    UciBridge(const UciBridge &) = delete;
    UciBridge &operator=(const UciBridge &) = delete;

    // Starts the worker and completes the uci/uciok handshake, restarting once.
    Status ensureStarted();

    // isready/readyok probe bounded by ready_timeout; on expiry the worker is
    // restarted once and probed again.
    bool isReady(bool restart_on_timeout = true);

    // Best-effort stop. Repeats within stop_throttle are dropped. Drains to the
    // next bestmove only when nobody else is reading.
    void abortCurrentSearch();

    // Runs one request: preflight stop, [ucinewgame], position, isready, go, then
    // streams info events until bestmove. Always ends with done or error.
    cppcoro::generator<BridgeEvent> streamGo(GoRequest request, const CancelToken *cancel = nullptr);

    void shutdown();

    int restartCount() const { return restarts_.load(); }
    bool searchActive() const { return search_active_.load(); }
    std::vector<std::string> sentCommands() const;
    std::vector<std::string> lastLines() const;

    static std::string positionCommand(const GoRequest &request);
    static std::string goCommand(const GoRequest &request);
    // Rejects malformed requests before anything is sent to the worker.
    static Status validate(const GoRequest &request);

private:
    struct SearchActivity;

    Status ensureStartedLocked();
    Status spawnAndHandshakeLocked();
    bool probeReadyLocked();
    void discardWorkerLocked();

    bool send(const std::string &line);
    ReadResult readLocked(std::chrono::milliseconds timeout);
    ReadResult read(std::chrono::milliseconds timeout);
    bool workerRunning();
    std::string tail(std::size_t count) const;
    void dbg(const std::string &text) const;

    BridgeConfig config_;
    std::unique_ptr<WorkerProcess> proc_;

    std::mutex read_mu_;
    mutable std::mutex io_mu_;
    std::mutex stop_mu_;
    mutable std::mutex lines_mu_;

    std::atomic<bool> search_active_{false};
    std::atomic<int> restarts_{0};
    std::optional<std::chrono::steady_clock::time_point> last_stop_;
    std::deque<std::string> last_lines_;
    std::vector<std::string> sent_;
};

} // namespace tandem_bridge
