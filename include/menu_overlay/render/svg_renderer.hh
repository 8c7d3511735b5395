/**
 * @file svg_renderer.hh
 * @brief SVG overlay for compositing text onto a background.
 *
 * The overlay has the size of the layout canvas, so it can be composited
 * directly onto the bled background. Wrapped elements become one
 * `<tspan>` per line using the same wrap_text() as every other output.
 *
 * @code{.cpp}
 * std::string svg = render_text_svg(layout);
 * std::ofstream("overlay.svg") << svg;
 * @endcode
 *
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/layout/text_layout.hh>
#include <string>
#include <string_view>

namespace menu_overlay {
    /**
     * @brief Render a layout as a standalone SVG document.
     */
    MENU_OVERLAY_EXPORT std::string render_text_svg(const text_layout& layout);

    /**
     * @brief Generic CSS family used when a brand font is unavailable.
     *
     * @return "serif" for known serif families, "sans-serif" otherwise
     */
    MENU_OVERLAY_EXPORT std::string_view generic_family(std::string_view family);

    /// Escape the five XML special characters.
    MENU_OVERLAY_EXPORT std::string escape_xml(std::string_view text);
} // namespace menu_overlay
