/**
 * @file document_lines.hh
 * @brief Layout converted to document units for PDF style writers.
 *
 * Document writers work in points with the origin at the bottom-left
 * corner of the page. place_document_lines() does the unit and origin
 * conversion once and splits wrapped elements with wrap_text(), so an
 * exported editable document breaks lines exactly where the composited
 * preview does. Glyph measurement stays with the writer: a run carries
 * its anchor x, and anchored_x() turns the measured width into the
 * drawing position.
 *
 * @code
 *   layout (px, top-left)          page (pt, bottom-left)
 *   +-----------------+            +-----------------+
 *   |  y = 400 ---    |            |                 |
 *   |                 |     =>     |  y = H - 96 --- |
 *   +-----------------+            +-----------------+
 * @endcode
 *
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/layout/text_layout.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace menu_overlay {
    /**
     * @brief Embedded font a run is drawn with.
     */
    enum class font_role {
        heading,
        body_regular,
        body_bold
    };

    /**
     * @brief RGB color with components in [0, 1].
     */
    struct MENU_OVERLAY_EXPORT rgb_color {
        double r = 0;
        double g = 0;
        double b = 0;

        bool operator==(const rgb_color&) const = default;
    };

    /**
     * @brief One line of text in page coordinates.
     */
    struct MENU_OVERLAY_EXPORT document_run {
        std::string text;
        double x = 0;          ///< Anchor x in points
        double baseline = 0;   ///< Baseline y in points, bottom-left origin
        double font_size = 0;  ///< Points
        font_role role = font_role::body_regular;
        rgb_color color;
        text_anchor anchor = text_anchor::start;
    };

    /**
     * @brief Page size and every line to draw on it.
     */
    struct MENU_OVERLAY_EXPORT document_page {
        double width = 0;   ///< Points
        double height = 0;  ///< Points
        std::vector<document_run> runs;
    };

    /**
     * @brief Parse "#RRGGBB" or "#RGB".
     *
     * @throws std::invalid_argument for any other form
     */
    MENU_OVERLAY_EXPORT rgb_color parse_hex_color(std::string_view hex);

    /// Same as parse_hex_color(), returning std::nullopt for other forms.
    MENU_OVERLAY_EXPORT std::optional<rgb_color> try_parse_hex_color(std::string_view hex);

    /**
     * @brief Choose the embedded font for an element.
     *
     * Elements in the heading family use the heading font; others use the
     * bold or regular body font according to their weight.
     */
    MENU_OVERLAY_EXPORT font_role resolve_font_role(const text_element& element, std::string_view heading_family);

    /**
     * @brief Convert a layout to page runs.
     *
     * Style colors are opaque strings. Colors that are not hex (a CSS name
     * such as "black") are drawn black and logged as a warning.
     *
     * @param layout Layout in canvas pixels
     * @param dpi Resolution the layout was computed at
     * @param heading_family Family drawn with the heading font
     */
    MENU_OVERLAY_EXPORT document_page place_document_lines(const text_layout& layout, int dpi,
                                                           std::string_view heading_family);

    /**
     * @brief Left edge of a run once its width is known.
     *
     * @param run Run to position
     * @param text_width Width of the run's text in points, measured by the writer
     */
    MENU_OVERLAY_EXPORT double anchored_x(const document_run& run, double text_width);
} // namespace menu_overlay
