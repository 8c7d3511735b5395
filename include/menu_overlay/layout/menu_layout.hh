/**
 * @file menu_layout.hh
 * @brief Adaptive menu layout engine.
 *
 * Computes positions, sizes and colors of every text run of a menu for a
 * given canvas, optionally constrained to the clear zone detected on the
 * background image.
 *
 * @section menu_layout_zones Vertical zones
 *
 * @code
 *   +------------------------------+  <- canvas (trim + bleed)
 *   |                              |
 *   |  title zone top ------------ |  zone.top + 24pt, or 30% of trim
 *   |        TITLE / subtitle      |
 *   |        SECTION               |
 *   |  Item name ........... $14   |
 *   |  body bottom --------------- |  footer top - 8pt
 *   |  footer top ---------------- |  footer bottom - 2 x 12pt
 *   |        footer text           |
 *   |  footer bottom ------------- |  zone.bottom, or trim - safe margin
 *   +------------------------------+
 * @endcode
 *
 * @section menu_layout_sizing Sizing
 *
 * Base point sizes per role are scaled down by the smaller of two
 * factors: `sqrt(column / (0.7 * canvas width))` when the column is
 * narrow, and `available / needed` when the estimated height does not
 * fit. Each role has a floor. After a pass, any remaining overflow
 * shrinks the scale by `body_bottom / cursor` and the pass is redone, at
 * most three passes in total.
 *
 * @code{.cpp}
 * const canvas_format& fmt = resolve_format("half-letter");
 * text_layout layout = calculate_menu_layout(content, style, fmt, zone);
 * std::string svg = render_text_svg(layout);
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/geometry.hh>
#include <menu_overlay/formats.hh>
#include <menu_overlay/layout/menu_content.hh>
#include <menu_overlay/layout/text_layout.hh>
#include <optional>
#include <string>

namespace menu_overlay {
    /**
     * @brief Per-call overrides of brand defaults.
     */
    struct MENU_OVERLAY_EXPORT layout_options {
        std::optional<std::string> accent_color; ///< Replaces style_tokens::primary_color
        std::optional<std::string> heading_font; ///< Replaces style_tokens::heading_font
        std::optional<std::string> body_font;    ///< Replaces style_tokens::body_font
    };

    /// Maximum number of layout passes, including the first.
    inline constexpr int MAX_LAYOUT_ATTEMPTS = 3;

    /**
     * @brief Layout together with diagnostics of how it was produced.
     */
    struct MENU_OVERLAY_EXPORT layout_result {
        text_layout layout;
        int attempts = 1;        ///< Passes run (1..MAX_LAYOUT_ATTEMPTS)
        double scale = 1.0;      ///< Scale of the accepted pass
        bool overflow = false;   ///< Body still ends below its zone
        int body_bottom = 0;     ///< Lower bound of the body region, canvas pixels
        int cursor = 0;          ///< Final vertical cursor of the accepted pass
    };

    /**
     * @brief Lay out a menu.
     *
     * @param content Menu content
     * @param style Brand typography and colors
     * @param format Target canvas
     * @param zone Quiet area measured on the background after
     *             prepare_background(), so in canvas pixels
     * @param options Overrides of brand defaults
     * @return Layout on the (width + 2 bleed) x (height + 2 bleed) canvas
     */
    MENU_OVERLAY_EXPORT text_layout calculate_menu_layout(const menu_content& content,
                                                          const style_tokens& style,
                                                          const canvas_format& format,
                                                          const std::optional<clear_zone>& zone = std::nullopt,
                                                          const layout_options& options = {});

    /**
     * @brief Lay out a menu and report retry and overflow details.
     *
     * Residual overflow after the last pass is logged as a warning and
     * flagged in the result; the layout is still returned.
     */
    MENU_OVERLAY_EXPORT layout_result calculate_menu_layout_ex(const menu_content& content,
                                                               const style_tokens& style,
                                                               const canvas_format& format,
                                                               const std::optional<clear_zone>& zone = std::nullopt,
                                                               const layout_options& options = {});
} // namespace menu_overlay
