/**
 * @file text_layout.hh
 * @brief Positioned text runs produced by the layout engine.
 *
 * A text_layout is the hand-off between layout and rendering. Every
 * element is a single logical run of text anchored at (x, y) in the
 * pixel space of the final canvas (trim + bleed), with y as the baseline
 * of the first line and the origin at the top-left corner.
 *
 * @section text_layout_anchor Anchoring
 *
 * @code
 *   start:   x|Old Fashioned
 *   middle:   Cocktail M|enu
 *   end:               $14|x
 * @endcode
 *
 * Elements with max_width set are wrapped by the renderer with
 * wrap_text(); consecutive lines are round(font_size * 1.3) apart.
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace menu_overlay {
    /**
     * @brief Horizontal anchor of a text run.
     */
    enum class text_anchor {
        start,  ///< x is the left edge
        middle, ///< x is the center
        end     ///< x is the right edge
    };

    enum class font_weight {
        normal,
        bold
    };

    /// Distance between consecutive wrapped lines, as a multiple of font size.
    inline constexpr double LINE_HEIGHT_RATIO = 1.3;

    /**
     * @brief One positioned text run.
     */
    struct MENU_OVERLAY_EXPORT text_element {
        std::string text;
        int x = 0;                      ///< Anchor x in canvas pixels
        int y = 0;                      ///< Baseline y in canvas pixels (top-left origin)
        int font_size = 0;              ///< Pixels
        std::string font_family;
        font_weight weight = font_weight::normal;
        std::string color;              ///< CSS color string, usually #RRGGBB
        text_anchor anchor = text_anchor::start;
        std::optional<double> max_width; ///< Wrap width in pixels; unset means never wrap

        bool operator==(const text_element&) const = default;
    };

    /**
     * @brief Canvas size and its text runs in reading order.
     */
    struct MENU_OVERLAY_EXPORT text_layout {
        int width = 0;
        int height = 0;
        std::vector<text_element> elements;

        bool operator==(const text_layout&) const = default;
    };

    /// "start", "middle" or "end".
    MENU_OVERLAY_EXPORT std::string_view anchor_name(text_anchor anchor);

    /// "normal" or "bold".
    MENU_OVERLAY_EXPORT std::string_view weight_name(font_weight weight);

    /// @throws std::invalid_argument for unknown names
    MENU_OVERLAY_EXPORT text_anchor parse_anchor(std::string_view name);

    /// @throws std::invalid_argument for unknown names
    MENU_OVERLAY_EXPORT font_weight parse_weight(std::string_view name);

    /// True when the element has a wrap width and its text exceeds it.
    MENU_OVERLAY_EXPORT bool element_wraps(const text_element& element);

    /**
     * @brief Wrapped lines of an element, as every renderer draws them.
     *
     * Elements without max_width, or whose text fits, yield a single line
     * holding the text unchanged.
     */
    MENU_OVERLAY_EXPORT std::vector<std::string> element_lines(const text_element& element);

    /// Vertical distance between wrapped lines of an element, in pixels.
    MENU_OVERLAY_EXPORT int element_line_height(const text_element& element);
} // namespace menu_overlay
