// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace volley::core {

// Terminal value of a transfer, set exactly once
enum class TransferOutcome : std::uint8_t {
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TransferOutcome outcome) noexcept {
    switch (outcome) {
        case TransferOutcome::completed: return "completed";
        case TransferOutcome::failed:    return "failed";
        case TransferOutcome::cancelled: return "cancelled";
    }
    return "unknown";
}

// Emitted about every PROGRESS_INTERVAL, plus once at 100 % on success
struct ProgressEvent {
    std::string transfer_id;
    int percent{0};                  // floor(transferred * 100 / total)
    std::uint64_t rate_bps{0};
    std::string rate;                // "1.25 MB/s"
    std::uint64_t transferred{0};
    std::uint64_t total{0};
    std::string transferred_of_total; // "5.00 MB / 10.00 MB"
};

// Phase transitions and failure reasons
struct StatusEvent {
    std::string transfer_id;
    std::string message;
};

// Emitted exactly once, only on success
struct CompletionEvent {
    std::string transfer_id;
};

// Presentation-layer hooks. All of them are invoked on the transfer's own
// thread; unset handlers are skipped.
struct EventHandlers {
    std::function<void(const ProgressEvent&)> on_progress;
    std::function<void(const StatusEvent&)> on_status;
    std::function<void(const CompletionEvent&)> on_completed;
};

} // namespace volley::core
