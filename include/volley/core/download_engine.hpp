// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/error.hpp>
#include <volley/core/events.hpp>
#include <volley/core/completion_queue.hpp>
#include <volley/core/progress_aggregator.hpp>
#include <volley/core/segment.hpp>
#include <volley/core/transfer_control.hpp>
#include <volley/core/transport.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace volley::core {

// Overall download state
enum class DownloadState : std::uint8_t {
    idle,        // Not started
    probing,     // HEAD request in flight
    downloading, // Workers running
    paused,      // Paused by user
    merging,     // Concatenating part files
    completed,   // All done
    failed,      // Failed with error
    cancelled    // Cancelled by user
};

// What to download and where. Immutable once the transfer starts.
struct TransferRequest {
    std::string url;
    std::string destination_dir{"."};
    std::uint32_t segment_count{DEFAULT_SEGMENTS};
};

// Per-engine tunables, defaults from config.hpp
struct DownloadConfig {
    std::uint32_t max_segments{MAX_SEGMENTS};
    std::uint64_t min_segment_size{MIN_SEGMENT_SIZE};
    std::chrono::seconds probe_timeout{PROBE_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds pause_poll{PAUSE_POLL_INTERVAL};
    std::uint64_t bandwidth_limit{0};  // Accepted and logged, not enforced
};

// Coordinates one transfer: probe, split, parallel range workers, progress
// emission, then merge or cleanup. Part files never outlive run().
class DownloadEngine {
public:
    DownloadEngine(std::string id, TransferRequest request, Transport& transport,
                   DownloadConfig config = {});
    ~DownloadEngine();

    // Non-copyable, non-movable (workers hold references into the engine)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    // Set event handlers. Must be called before start()/run().
    void handlers(EventHandlers handlers) noexcept { handlers_ = std::move(handlers); }

    // Run the whole transfer on the calling thread. A second call returns
    // failed without doing anything.
    [[nodiscard]] TransferOutcome run() noexcept;

    // Run the transfer on a background thread
    [[nodiscard]] std::error_code start() noexcept;

    // Block until the transfer has an outcome. Returns not_started for a
    // transfer that was never started.
    [[nodiscard]] std::expected<TransferOutcome, std::error_code> wait() noexcept;

    // Idempotent; no-ops once the transfer is over
    void pause() noexcept;
    void resume() noexcept;
    void cancel() noexcept;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const TransferRequest& request() const noexcept { return request_; }
    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool finished() const noexcept;

    // Set once run() returns
    [[nodiscard]] std::optional<TransferOutcome> outcome() const noexcept;
    [[nodiscard]] std::error_code error() const noexcept;
    [[nodiscard]] std::string failure_reason() const;

    // Known after the probe
    [[nodiscard]] std::string destination() const;
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t segment_count() const noexcept { return segment_count_.load(std::memory_order_acquire); }

private:
    [[nodiscard]] TransferOutcome execute_guarded() noexcept;
    [[nodiscard]] TransferOutcome execute();
    [[nodiscard]] TransferOutcome monitor(std::uint64_t total, std::chrono::steady_clock::time_point started);
    [[nodiscard]] TransferOutcome finish_cancelled();
    [[nodiscard]] TransferOutcome finish_failed(std::error_code ec, std::string reason, std::string status);
    [[nodiscard]] TransferOutcome finish_completed();
    void settle(TransferOutcome outcome, std::error_code ec, std::string reason);

    // Signal cancel, join every worker, delete every part file
    void stop_workers() noexcept;

    void emit_progress(std::uint64_t transferred, std::uint64_t total, std::uint64_t rate_bps);
    void emit_status(std::string message);
    void emit_completed();

    std::string id_;
    TransferRequest request_;
    Transport& transport_;
    DownloadConfig config_;
    EventHandlers handlers_;

    TransferControl control_;
    CompletionQueue completions_;
    std::unique_ptr<ProgressAggregator> aggregator_;
    std::vector<std::unique_ptr<Segment>> segments_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<bool> started_{false};
    std::atomic<std::uint64_t> total_size_{0};
    std::atomic<std::uint32_t> segment_count_{0};

    std::string destination_;
    std::optional<TransferOutcome> outcome_;
    std::error_code error_;
    std::string failure_reason_;
    mutable std::mutex mutex_;  // Protects destination_, outcome_, error_, failure_reason_
    std::condition_variable settled_;  // Signalled once outcome_ is set

    std::jthread thread_;
    std::mutex wait_mutex_;  // Protects thread_
};

// Registry of transfers keyed by "download_<n>"
class DownloadManager {
public:
    explicit DownloadManager(Transport& transport, DownloadConfig config = {}) noexcept;
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Register a new transfer; it does not start until start(id)
    [[nodiscard]] std::expected<std::string, std::error_code>
    create(TransferRequest request, EventHandlers handlers = {});

    [[nodiscard]] std::error_code start(const std::string& id) noexcept;

    // No-ops for unknown ids
    void pause(const std::string& id) noexcept;
    void resume(const std::string& id) noexcept;
    void cancel(const std::string& id) noexcept;

    // Block until the transfer is over; not_started if start(id) was never called
    [[nodiscard]] std::expected<TransferOutcome, std::error_code> wait(const std::string& id) noexcept;

    // Forget a finished transfer (running transfers are kept)
    void remove(const std::string& id) noexcept;

    [[nodiscard]] std::expected<DownloadState, std::error_code> state(const std::string& id) const noexcept;

    // All transfer ids in creation order
    [[nodiscard]] std::vector<std::string> transfers() const;

private:
    [[nodiscard]] std::shared_ptr<DownloadEngine> find(const std::string& id) const noexcept;

    Transport& transport_;
    DownloadConfig config_;
    std::map<std::uint32_t, std::shared_ptr<DownloadEngine>> downloads_;
    std::uint32_t next_id_{1};
    mutable std::mutex mutex_;
};

} // namespace volley::core
