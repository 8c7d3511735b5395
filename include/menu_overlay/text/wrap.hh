/**
 * @file wrap.hh
 * @brief Shared word wrapping heuristic.
 *
 * Glyph widths are not measured. Every character is assumed to be
 * CHAR_WIDTH_RATIO times the font size wide. The layout engine and all
 * renderers call the functions in this file, so a line break decided
 * while laying out a menu is the same line break every output draws.
 *
 * @section wrap_rules Rules
 *
 * - Words are separated by whitespace; runs of whitespace collapse.
 * - A word is appended to the current line while the joined line stays
 *   within `floor(max_width / (font_size * CHAR_WIDTH_RATIO))` characters.
 * - Words longer than a line are never split; they overflow on a line of
 *   their own.
 * - Character counts are Unicode code points of the UTF-8 input.
 *
 * @code{.cpp}
 * auto lines = wrap_text("alpha beta gamma", 20.0, 120.0);
 * // {"alpha beta", "gamma"}   (max 10 chars per line)
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace menu_overlay {
    /// Assumed average glyph width as a fraction of the font size.
    inline constexpr double CHAR_WIDTH_RATIO = 0.55;

    /// Number of code points in a UTF-8 string.
    MENU_OVERLAY_EXPORT std::size_t text_length(std::string_view text);

    /**
     * @brief Check whether text would exceed a width on one line.
     *
     * @return true if `length * font_size * CHAR_WIDTH_RATIO > max_width`
     */
    MENU_OVERLAY_EXPORT bool needs_wrapping(std::string_view text, double font_size, double max_width);

    /**
     * @brief Greedy word wrap.
     *
     * @param text UTF-8 text
     * @param font_size Font size in pixels
     * @param max_width Available line width in pixels
     * @return Lines in order; empty for empty or blank input
     */
    MENU_OVERLAY_EXPORT std::vector<std::string> wrap_text(std::string_view text, double font_size,
                                                           double max_width);

    /**
     * @brief Estimate the number of lines text occupies.
     *
     * Cheaper than wrap_text() and slightly optimistic, since it ignores
     * word boundaries: `ceil(length / max_chars)`, at least 1 when no
     * character fits.
     */
    MENU_OVERLAY_EXPORT int estimate_lines(std::string_view text, double font_size, double max_width);
} // namespace menu_overlay
