// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/events.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace volley::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw from a progress event
    void update(const core::ProgressEvent& event) noexcept;

    // Print a message on its own line, then redraw the bar below it
    void message(std::string_view text) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(int percent) const;
    void draw() noexcept;

    std::string label_;
    std::string line_;
    bool finished_{false};
    int width_{30};
};

} // namespace volley::cli
