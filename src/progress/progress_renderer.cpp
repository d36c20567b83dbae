/**
 * @file progress_renderer.cpp
 * @brief Terminal rendering of progress bars
 */

#include "latch/ldata/progress/progress_renderer.h"

#include <latch/ldata/core/format_utils.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace latch::ldata {

namespace {

constexpr std::string_view cursor_up = "\x1b[1A";
constexpr std::string_view clear_line = "\x1b[2K\r";

}  // namespace

auto format_bar_line(const bar_line& line, std::size_t bar_width) -> std::string {
    double fraction = 0.0;
    if (line.total > 0) {
        fraction = static_cast<double>(std::min(line.consumed, line.total)) /
                   static_cast<double>(line.total);
    }

    auto filled = static_cast<std::size_t>(fraction * static_cast<double>(bar_width));

    std::ostringstream oss;
    oss << line.label << ": " << std::setw(3)
        << static_cast<int>(fraction * 100.0) << "%|"
        << std::string(filled, '#') << std::string(bar_width - filled, ' ') << "| ";

    if (line.unit == bar_unit::bytes) {
        oss << with_si_suffix(line.consumed) << "/" << with_si_suffix(line.total);
    } else {
        oss << line.consumed << "/" << line.total;
    }
    return oss.str();
}

progress_renderer::progress_renderer(std::ostream& out, std::size_t bar_width)
    : out_(out), bar_width_(bar_width) {}

void progress_renderer::clear_block() {
    for (std::size_t i = 0; i < drawn_lines_; ++i) {
        out_ << cursor_up << clear_line;
    }
    drawn_lines_ = 0;
}

void progress_renderer::draw(const std::vector<bar_line>& lines) {
    clear_block();
    for (const auto& line : lines) {
        out_ << clear_line;
        // idle slot
        if (!line.label.empty() || line.total > 0) {
            out_ << format_bar_line(line, bar_width_);
        }
        out_ << "\n";
    }
    drawn_lines_ = lines.size();
    out_.flush();
}

void progress_renderer::print_above(std::string_view message,
                                    const std::vector<bar_line>& lines) {
    clear_block();
    out_ << message << "\n";
    draw(lines);
}

void progress_renderer::finish() {
    drawn_lines_ = 0;
    out_.flush();
}

}  // namespace latch::ldata
