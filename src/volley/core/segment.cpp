// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/segment.hpp>
#include <volley/core/log.hpp>
#include <volley/disk/file_writer.hpp>

namespace volley::core {

Segment::Segment(SegmentRange range, std::string url, std::string part_path,
                 SegmentContext context) noexcept
    : range_(range)
    , url_(std::move(url))
    , part_path_(std::move(part_path))
    , ctx_(context) {}

Segment::~Segment() {
    join();
}

void Segment::start() {
    thread_ = std::jthread([this] { run(); });
}

void Segment::join() noexcept {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Segment::run() noexcept {
    state_.store(SegmentState::downloading, std::memory_order_release);

    SegmentOutcome outcome = fetch();

    state_.store(outcome.success ? SegmentState::completed : SegmentState::failed,
                 std::memory_order_release);
    ctx_.completions.push(std::move(outcome));
}

SegmentOutcome Segment::fetch() noexcept {
    using clock = std::chrono::steady_clock;

    disk::FileWriter part;
    if (auto ec = part.open(part_path_)) {
        return failure(ec, "Cannot create part file: " + ec.message());
    }

    std::error_code write_error;
    bool overrun = false;
    auto last_report = clock::now();
    std::uint64_t since_report = 0;

    RangeFetch request;
    request.url = url_;
    request.first = range_.first;
    request.last = range_.last;
    request.should_abort = [this] { return ctx_.control.cancelled(); };
    request.on_data = [&](const char* data, std::size_t size) {
        // Blocks while paused; false means cancelled
        if (!ctx_.control.wait_while_paused(ctx_.pause_poll)) {
            return false;
        }

        // A server ignoring the range sends more than asked; stop right away
        if (part.bytes_written() + size > range_.size()) {
            overrun = true;
            return false;
        }

        if (auto ec = part.write(data, size)) {
            write_error = ec;
            return false;
        }

        since_report += size;
        auto now = clock::now();
        auto elapsed = now - last_report;
        if (elapsed >= ctx_.report_interval) {
            double seconds = std::chrono::duration<double>(elapsed).count();
            auto rate = static_cast<std::uint64_t>(static_cast<double>(since_report) / seconds);
            ctx_.aggregator.report_increment(range_.index, since_report, rate);
            last_report = now;
            since_report = 0;
        }
        return true;
    };

    auto status = ctx_.transport.get_range(request);
    part.close();

    if (ctx_.control.cancelled()) {
        return failure(make_error_code(DownloadErrc::cancelled), "Cancelled");
    }
    if (overrun) {
        return failure(make_error_code(DownloadErrc::invalid_range),
                       "Server sent more than the requested " + std::to_string(range_.size()) + " bytes");
    }
    if (!status) {
        if (write_error) {
            return failure(write_error, "Write error: " + write_error.message());
        }
        return failure(status.error(), status.error().message());
    }
    if (*status != 200 && *status != 206) {
        return failure(make_error_code(DownloadErrc::bad_status),
                       "Segment download failed with status " + std::to_string(*status));
    }
    if (part.bytes_written() != range_.size()) {
        return failure(make_error_code(DownloadErrc::invalid_range),
                       "Received " + std::to_string(part.bytes_written()) + " of "
                       + std::to_string(range_.size()) + " bytes");
    }

    // Final absolute report corrects whatever the increments left unreported
    ctx_.aggregator.report_absolute(range_.index, range_.size());

    SegmentOutcome outcome;
    outcome.index = range_.index;
    outcome.success = true;
    outcome.reason = "Completed";
    return outcome;
}

SegmentOutcome Segment::failure(std::error_code ec, std::string reason) const noexcept {
    log::get()->debug("segment {} [{}-{}] failed: {}", range_.index, range_.first, range_.last, reason);

    SegmentOutcome outcome;
    outcome.index = range_.index;
    outcome.success = false;
    outcome.reason = std::move(reason);
    outcome.error = ec;
    return outcome;
}

} // namespace volley::core
