/**
 * @file formats.hh
 * @brief Output canvas formats for social and print media.
 *
 * A canvas_format describes the final trim size of an output together
 * with its resolution and, for print, the bleed and safe margin. The
 * compositing canvas is the trim size grown by the bleed on every side.
 *
 * @section formats_registry Registry
 *
 * Formats are looked up by lowercase alias:
 *
 * | Alias              | Trim (px)   | DPI | Category |
 * |--------------------|-------------|-----|----------|
 * | instagram          | 1080 x 1080 | 72  | social   |
 * | story              | 1080 x 1920 | 72  | social   |
 * | facebook           | 1200 x 630  | 72  | social   |
 * | twitter            | 1200 x 675  | 72  | social   |
 * | letter-portrait    | 2550 x 3300 | 300 | print    |
 * | letter-landscape   | 3300 x 2550 | 300 | print    |
 * | half-letter        | 1650 x 2550 | 300 | print    |
 * | legal              | 2550 x 4200 | 300 | print    |
 * | a4                 | 2480 x 3508 | 300 | print    |
 *
 * Print formats carry a 38px bleed (0.125") and a 75px safe margin
 * (0.25") at 300 DPI.
 *
 * @code{.cpp}
 * const canvas_format& fmt = resolve_format("Half-Letter");
 * int w = fmt.canvas_width();  // 1726
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <string>
#include <string_view>
#include <vector>

namespace menu_overlay {
    /// Default safe margin used when a format does not define one.
    inline constexpr int DEFAULT_SAFE_MARGIN = 75;

    /// Bleed of the built-in print formats, in pixels at 300 DPI.
    inline constexpr int PRINT_BLEED = 38;

    /// Safe margin of the built-in print formats, in pixels at 300 DPI.
    inline constexpr int PRINT_SAFE_MARGIN = 75;

    enum class format_category {
        social,
        print
    };

    /**
     * @brief Target canvas geometry.
     */
    struct MENU_OVERLAY_EXPORT canvas_format {
        std::string name;         ///< Upper-case identifier, e.g. "HALF_LETTER"
        std::string label;        ///< Human readable label
        int width = 0;            ///< Trim width in pixels
        int height = 0;           ///< Trim height in pixels
        std::string aspect_ratio; ///< Informational, e.g. "11:17"
        int dpi = 72;
        format_category category = format_category::social;
        int bleed = 0;                            ///< Extra border on each side (print)
        int safe_margin = DEFAULT_SAFE_MARGIN;    ///< Inset from trim edge

        /// Width of the compositing canvas (trim + bleed on both sides).
        [[nodiscard]] int canvas_width() const { return width + 2 * bleed; }

        /// Height of the compositing canvas (trim + bleed on both sides).
        [[nodiscard]] int canvas_height() const { return height + 2 * bleed; }
    };

    /**
     * @brief Look up a built-in format by alias (case-insensitive).
     *
     * @throws std::invalid_argument if the alias is unknown; the message
     *         lists every available alias
     */
    MENU_OVERLAY_EXPORT const canvas_format& resolve_format(std::string_view name);

    /**
     * @brief Resolve several aliases at once, preserving order.
     */
    MENU_OVERLAY_EXPORT std::vector<canvas_format> resolve_formats(const std::vector<std::string>& names);

    /// All known aliases, social formats first.
    MENU_OVERLAY_EXPORT std::vector<std::string> format_names();

    /**
     * @brief Create a 300 DPI print format from inch dimensions.
     *
     * @param label Human readable label
     * @param width_inches Trim width in inches
     * @param height_inches Trim height in inches
     */
    MENU_OVERLAY_EXPORT canvas_format custom_print_format(std::string label,
                                                          double width_inches,
                                                          double height_inches);
} // namespace menu_overlay
