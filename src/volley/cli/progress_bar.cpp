// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/progress_bar.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace volley::cli {

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(const core::ProgressEvent& event) noexcept {
    if (finished_ || event.total == 0) return;

    // Build status line
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(event.percent);

    // Add percentage, padded to three columns
    line += " ";
    if (event.percent < 10) line += " ";
    if (event.percent < 100) line += " ";
    line += std::to_string(event.percent) + "%";

    line += " (" + event.transferred_of_total + ")";

    if (event.rate_bps > 0) {
        line += " @ " + event.rate;

        std::uint64_t remaining = event.total - std::min(event.transferred, event.total);
        if (remaining > 0) {
            line += " ETA: " + format_time(remaining / event.rate_bps);
        }
    }

    line_ = std::move(line);
    draw();
}

void ProgressBar::message(std::string_view text) noexcept {
    clear();
    std::cout << text << '\n';
    if (!line_.empty() && !finished_) {
        draw();
    } else {
        std::cout << std::flush;
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (!line_.empty()) {
        std::cout << std::endl;
    }
}

void ProgressBar::clear() noexcept {
    if (line_.empty()) return;
    std::cout << "\r" << std::string(line_.size() + 10, ' ') << "\r" << std::flush;
}

void ProgressBar::draw() noexcept {
    std::cout << "\r" << line_ << std::string(10, ' ') << std::flush;
}

std::string ProgressBar::render_bar(int percent) const {
    percent = std::clamp(percent, 0, 100);
    const int filled = width_ * percent / 100;
    const int empty = width_ - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += ">";
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace volley::cli
