// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/download_engine.hpp>
#include <volley/core/format.hpp>
#include <volley/core/log.hpp>
#include <volley/core/probe.hpp>
#include <volley/core/segment_plan.hpp>
#include <volley/core/url.hpp>
#include <volley/disk/file_writer.hpp>
#include <volley/disk/merge.hpp>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace volley::core {

namespace fs = std::filesystem;

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(std::string id, TransferRequest request, Transport& transport,
                               DownloadConfig config)
    : id_(std::move(id))
    , request_(std::move(request))
    , transport_(transport)
    , config_(config) {}

DownloadEngine::~DownloadEngine() {
    // Stop the coordinator thread first: it owns the workers and their parts
    control_.cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

TransferOutcome DownloadEngine::run() noexcept {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        log::get()->warn("{}: transfer already started", id_);
        return TransferOutcome::failed;
    }
    return execute_guarded();
}

std::error_code DownloadEngine::start() noexcept {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        return make_error_code(DownloadErrc::already_started);
    }

    std::lock_guard<std::mutex> lock(wait_mutex_);
    try {
        thread_ = std::jthread([this] { (void)execute_guarded(); });
    } catch (const std::system_error& e) {
        log::get()->error("{}: cannot spawn transfer thread: {}", id_, e.what());
        settle(TransferOutcome::failed, e.code(), "Cannot spawn transfer thread");
        return e.code();
    }
    return {};
}

std::expected<TransferOutcome, std::error_code> DownloadEngine::wait() noexcept {
    if (!started_.load(std::memory_order_acquire)) {
        return std::unexpected(make_error_code(DownloadErrc::not_started));
    }

    TransferOutcome result;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        settled_.wait(lock, [this] { return outcome_.has_value(); });
        result = *outcome_;
    }

    // The transfer thread may still be returning from execute_guarded()
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    return result;
}

void DownloadEngine::pause() noexcept {
    if (finished()) {
        return;
    }
    if (control_.pause()) {
        log::get()->info("{}: pause requested", id_);
    }
}

void DownloadEngine::resume() noexcept {
    if (finished()) {
        return;
    }
    if (control_.resume()) {
        log::get()->info("{}: resume requested", id_);
    }
}

void DownloadEngine::cancel() noexcept {
    if (finished()) {
        return;
    }
    if (control_.cancel()) {
        log::get()->info("{}: cancel requested", id_);
    }
}

bool DownloadEngine::finished() const noexcept {
    auto s = state();
    return s == DownloadState::completed
        || s == DownloadState::failed
        || s == DownloadState::cancelled;
}

std::optional<TransferOutcome> DownloadEngine::outcome() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

std::error_code DownloadEngine::error() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string DownloadEngine::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

std::string DownloadEngine::destination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destination_;
}

TransferOutcome DownloadEngine::execute_guarded() noexcept {
    try {
        return execute();
    } catch (const std::exception& e) {
        // Allocation failure or an exception thrown by an event handler
        log::get()->error("{}: transfer aborted: {}", id_, e.what());
        return finish_failed(make_error_code(DownloadErrc::aborted), e.what(),
                             std::string("Error: ") + e.what());
    }
}

TransferOutcome DownloadEngine::execute() {
    auto logger = log::get();
    const auto started = std::chrono::steady_clock::now();

    if (control_.cancelled()) {
        return finish_cancelled();
    }

    auto url = Url::parse(request_.url);
    if (!url || !url->is_http()) {
        return finish_failed(make_error_code(DownloadErrc::invalid_url),
                             "Invalid URL: " + request_.url, "Error: Invalid URL");
    }

    const std::string dest = resolve_destination(request_.destination_dir, *url);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        destination_ = dest;
    }

    // 1. Probe
    state_.store(DownloadState::probing, std::memory_order_release);
    emit_status("Checking file info...");
    logger->info("{}: probing {}", id_, request_.url);

    auto info = probe(transport_, request_.url, config_.probe_timeout,
                      [this] { return control_.cancelled(); });
    if (control_.cancelled()) {
        return finish_cancelled();
    }
    if (!info) {
        if (info.error() == DownloadErrc::size_unknown) {
            return finish_failed(info.error(), "Could not determine file size",
                                 "Error: Could not determine file size");
        }
        return finish_failed(info.error(), info.error().message(),
                             "Error: " + info.error().message());
    }

    const std::uint64_t total = info->total_size;
    total_size_.store(total, std::memory_order_release);
    logger->info("{}: {} ({}), ranges {}", id_, format_size(static_cast<double>(total)),
                 info->content_type.empty() ? "unknown type" : info->content_type,
                 info->supports_ranges ? "supported" : "not supported");

    // Same-size file at the destination means this was already fetched
    std::error_code fs_ec;
    if (fs::is_regular_file(dest, fs_ec)) {
        auto existing = fs::file_size(dest, fs_ec);
        if (!fs_ec && existing == total) {
            logger->info("{}: {} already downloaded", id_, dest);
            emit_status("File already downloaded");
            emit_progress(total, total, 0);
            return finish_completed();
        }
    }

    if (!request_.destination_dir.empty()) {
        fs::create_directories(request_.destination_dir, fs_ec);
        if (fs_ec) {
            return finish_failed(fs_ec, "Cannot create directory " + request_.destination_dir,
                                 "Error: Cannot create directory " + request_.destination_dir);
        }
    }

    // 2. Plan
    if (!info->supports_ranges) {
        emit_status("Server doesn't support multi-connection downloads, using single connection");
    }
    auto plan = plan_segments(total, request_.segment_count, info->supports_ranges,
                              config_.max_segments, config_.min_segment_size);
    const auto count = static_cast<std::uint32_t>(plan.size());
    segment_count_.store(count, std::memory_order_release);

    if (config_.bandwidth_limit > 0) {
        logger->info("{}: bandwidth limit {} is not enforced", id_,
                     format_rate(static_cast<double>(config_.bandwidth_limit)));
    }

    // 3. Spawn workers
    emit_status("Starting download with " + std::to_string(count) + " connections...");
    logger->info("{}: {} segments -> {}", id_, count, dest);

    aggregator_ = std::make_unique<ProgressAggregator>(plan.size());
    SegmentContext context{transport_, *aggregator_, control_, completions_,
                           config_.progress_interval, config_.pause_poll};
    segments_.reserve(plan.size());
    for (const auto& range : plan) {
        segments_.push_back(std::make_unique<Segment>(
            range, request_.url, disk::part_path(dest, range.index), context));
    }

    state_.store(DownloadState::downloading, std::memory_order_release);
    try {
        for (auto& seg : segments_) {
            seg->start();
        }
    } catch (const std::system_error& e) {
        return finish_failed(e.code(), "Cannot start worker threads",
                             std::string("Error: Cannot start worker threads: ") + e.what());
    }

    // 4-7. Monitor, then merge or clean up
    return monitor(total, started);
}

TransferOutcome DownloadEngine::monitor(std::uint64_t total,
                                        std::chrono::steady_clock::time_point started) {
    using clock = std::chrono::steady_clock;
    using std::chrono::milliseconds;

    auto logger = log::get();
    const std::string dest = destination();

    std::size_t reported = 0;
    std::size_t failed = 0;
    std::string first_failure;
    bool paused_seen = false;
    auto next_emit = clock::now() + config_.progress_interval;

    while (reported < segments_.size()) {
        if (control_.cancelled()) {
            return finish_cancelled();
        }

        bool paused = control_.paused();
        if (paused != paused_seen) {
            paused_seen = paused;
            state_.store(paused ? DownloadState::paused : DownloadState::downloading,
                         std::memory_order_release);
            logger->info("{}: {}", id_, paused ? "paused" : "resumed");
            emit_status(paused ? "Paused" : "Resumed");
        }

        // Never sleep past the next progress deadline
        auto wait = std::chrono::duration_cast<milliseconds>(next_emit - clock::now());
        wait = std::clamp(wait, milliseconds{0}, config_.pause_poll);

        for (auto& outcome : completions_.drain_for(wait)) {
            ++reported;
            if (outcome.success || control_.cancelled()) {
                continue;
            }
            ++failed;
            logger->warn("{}: segment {} failed: {}", id_, outcome.index, outcome.reason);
            emit_status("Segment " + std::to_string(outcome.index) + " failed: " + outcome.reason);
            if (first_failure.empty()) {
                first_failure = "Segment " + std::to_string(outcome.index) + ": " + outcome.reason;
            }
        }

        auto now = clock::now();
        if (now >= next_emit && !control_.cancelled()) {
            auto snap = aggregator_->snapshot();
            emit_progress(snap.bytes, total, snap.rate_bps);
            next_emit = now + config_.progress_interval;
        }
    }

    if (control_.cancelled()) {
        return finish_cancelled();
    }

    for (auto& seg : segments_) {
        seg->join();
    }

    if (failed > 0) {
        return finish_failed(make_error_code(DownloadErrc::segment_failed), first_failure,
                             "Download failed: " + std::to_string(failed)
                             + " segments could not be downloaded");
    }

    // Merge. A cancel from here on is ignored.
    state_.store(DownloadState::merging, std::memory_order_release);
    emit_status("Merging downloaded segments...");
    logger->info("{}: merging {} parts into {}", id_, segments_.size(), dest);

    if (auto ec = disk::merge_parts(dest, static_cast<std::uint32_t>(segments_.size()))) {
        disk::remove_file(dest);
        return finish_failed(make_error_code(DownloadErrc::merge_failed),
                             "Merging segments failed: " + ec.message(),
                             "Error: Merging segments failed: " + ec.message());
    }

    double seconds = std::chrono::duration<double>(clock::now() - started).count();
    auto average = seconds > 0.0
        ? static_cast<std::uint64_t>(static_cast<double>(total) / seconds)
        : total;

    emit_progress(total, total, average);
    emit_status("Completed");
    logger->info("{}: completed {} at {}", id_, dest, format_rate(static_cast<double>(average)));
    return finish_completed();
}

void DownloadEngine::stop_workers() noexcept {
    control_.cancel();
    for (auto& seg : segments_) {
        seg->join();
    }
    if (!segments_.empty()) {
        std::string dest;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dest = destination_;
        }
        disk::cleanup_parts(dest, static_cast<std::uint32_t>(segments_.size()));
    }
}

TransferOutcome DownloadEngine::finish_cancelled() {
    stop_workers();
    log::get()->info("{}: cancelled", id_);
    emit_status("Cancelled");
    settle(TransferOutcome::cancelled, make_error_code(DownloadErrc::cancelled), "Cancelled");
    return TransferOutcome::cancelled;
}

TransferOutcome DownloadEngine::finish_failed(std::error_code ec, std::string reason, std::string status) {
    stop_workers();
    log::get()->error("{}: {}", id_, reason);
    emit_status(std::move(status));
    settle(TransferOutcome::failed, ec, std::move(reason));
    return TransferOutcome::failed;
}

TransferOutcome DownloadEngine::finish_completed() {
    settle(TransferOutcome::completed, {}, {});
    emit_completed();
    return TransferOutcome::completed;
}

void DownloadEngine::settle(TransferOutcome outcome, std::error_code ec, std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = outcome;
        error_ = ec;
        failure_reason_ = std::move(reason);
    }
    settled_.notify_all();

    DownloadState terminal = DownloadState::completed;
    if (outcome == TransferOutcome::failed) terminal = DownloadState::failed;
    if (outcome == TransferOutcome::cancelled) terminal = DownloadState::cancelled;
    state_.store(terminal, std::memory_order_release);
}

void DownloadEngine::emit_progress(std::uint64_t transferred, std::uint64_t total, std::uint64_t rate_bps) {
    if (!handlers_.on_progress) {
        return;
    }

    ProgressEvent event;
    event.transfer_id = id_;
    event.percent = percent_of(transferred, total);
    event.rate_bps = rate_bps;
    event.rate = format_rate(static_cast<double>(rate_bps));
    event.transferred = transferred;
    event.total = total;
    event.transferred_of_total = format_transferred(transferred, total);
    handlers_.on_progress(event);
}

void DownloadEngine::emit_status(std::string message) {
    if (handlers_.on_status) {
        handlers_.on_status(StatusEvent{id_, std::move(message)});
    }
}

void DownloadEngine::emit_completed() {
    if (handlers_.on_completed) {
        handlers_.on_completed(CompletionEvent{id_});
    }
}

//=============================================================================
// DownloadManager
//=============================================================================

DownloadManager::DownloadManager(Transport& transport, DownloadConfig config) noexcept
    : transport_(transport)
    , config_(config) {}

DownloadManager::~DownloadManager() {
    std::map<std::uint32_t, std::shared_ptr<DownloadEngine>> downloads;
    {
        auto lock = std::unique_lock(mutex_);
        downloads.swap(downloads_);
    }
    for (auto& [_, engine] : downloads) {
        engine->cancel();
    }
    for (auto& [_, engine] : downloads) {
        // Never-started engines report not_started and have nothing to join
        (void)engine->wait();
    }
}

std::expected<std::string, std::error_code>
DownloadManager::create(TransferRequest request, EventHandlers handlers) {
    auto url = Url::parse(request.url);
    if (!url || !url->is_http()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto lock = std::unique_lock(mutex_);
    std::uint32_t n = next_id_++;
    std::string id = "download_" + std::to_string(n);

    auto engine = std::make_shared<DownloadEngine>(id, std::move(request), transport_, config_);
    engine->handlers(std::move(handlers));
    downloads_.emplace(n, std::move(engine));
    return id;
}

std::shared_ptr<DownloadEngine> DownloadManager::find(const std::string& id) const noexcept {
    auto lock = std::unique_lock(mutex_);
    for (const auto& [_, engine] : downloads_) {
        if (engine->id() == id) {
            return engine;
        }
    }
    return nullptr;
}

std::error_code DownloadManager::start(const std::string& id) noexcept {
    auto engine = find(id);
    if (!engine) {
        return make_error_code(DownloadErrc::unknown_transfer);
    }
    return engine->start();
}

void DownloadManager::pause(const std::string& id) noexcept {
    if (auto engine = find(id)) {
        engine->pause();
    }
}

void DownloadManager::resume(const std::string& id) noexcept {
    if (auto engine = find(id)) {
        engine->resume();
    }
}

void DownloadManager::cancel(const std::string& id) noexcept {
    if (auto engine = find(id)) {
        engine->cancel();
    }
}

std::expected<TransferOutcome, std::error_code> DownloadManager::wait(const std::string& id) noexcept {
    auto engine = find(id);
    if (!engine) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_transfer));
    }
    return engine->wait();
}

void DownloadManager::remove(const std::string& id) noexcept {
    auto lock = std::unique_lock(mutex_);
    for (auto it = downloads_.begin(); it != downloads_.end(); ++it) {
        if (it->second->id() == id) {
            if (it->second->finished()) {
                downloads_.erase(it);
            }
            return;
        }
    }
}

std::expected<DownloadState, std::error_code> DownloadManager::state(const std::string& id) const noexcept {
    auto engine = find(id);
    if (!engine) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_transfer));
    }
    return engine->state();
}

std::vector<std::string> DownloadManager::transfers() const {
    auto lock = std::unique_lock(mutex_);
    std::vector<std::string> result;
    result.reserve(downloads_.size());
    for (const auto& [_, engine] : downloads_) {
        result.push_back(engine->id());
    }
    return result;
}

} // namespace volley::core
