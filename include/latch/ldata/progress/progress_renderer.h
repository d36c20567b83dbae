/**
 * @file progress_renderer.h
 * @brief Terminal rendering of progress bars
 */

#ifndef LATCH_LDATA_PROGRESS_PROGRESS_RENDERER_H
#define LATCH_LDATA_PROGRESS_PROGRESS_RENDERER_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace latch::ldata {

/**
 * @brief Unit of the numbers shown next to a bar
 */
enum class bar_unit {
    bytes,  ///< SI-suffixed sizes ("1.50 MB/3.00 MB")
    count,  ///< Plain counts ("3/10")
};

/**
 * @brief One line to draw
 */
struct bar_line {
    std::string label;
    uint64_t consumed = 0;
    uint64_t total = 0;
    bar_unit unit = bar_unit::bytes;
};

/**
 * @brief Format one bar: "label:  45%|#########           | 4.50 MB/10.00 MB"
 */
[[nodiscard]] auto format_bar_line(const bar_line& line, std::size_t bar_width = 30)
    -> std::string;

/**
 * @brief Redraws a block of bar lines in place on an ANSI terminal
 *
 * Not thread-safe; progress_bars serializes access.
 */
class progress_renderer {
public:
    explicit progress_renderer(std::ostream& out, std::size_t bar_width = 30);

    /**
     * @brief Replace the previously drawn block with @p lines
     */
    void draw(const std::vector<bar_line>& lines);

    /**
     * @brief Print a message above the bar block, then redraw the block
     */
    void print_above(std::string_view message, const std::vector<bar_line>& lines);

    /**
     * @brief Leave the last drawn block on screen and move below it
     */
    void finish();

private:
    void clear_block();

    std::ostream& out_;
    std::size_t bar_width_;
    std::size_t drawn_lines_ = 0;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_PROGRESS_PROGRESS_RENDERER_H
