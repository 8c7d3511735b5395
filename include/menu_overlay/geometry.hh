/**
 * @file geometry.hh
 * @brief Shared geometry types and unit conversion helpers.
 *
 * This file defines the rectangle that ties background analysis to text
 * layout, together with the typographic unit conversions used by every
 * component that turns point sizes into pixels (and back).
 *
 * @section geometry_units Units
 *
 * Layout works in pixels at the target DPI. Point sizes are converted
 * with a rounding conversion so that every consumer derives exactly the
 * same pixel sizes:
 *
 * @code{.cpp}
 * int title_px = pt_to_px(28.0, 300);   // 117
 * double page_pt = px_to_pt(1726, 300); // 414.24
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>

namespace menu_overlay {
    /**
     * @brief Visually quiet region of a background image.
     *
     * Pixel coordinates on the measured image. Layout expects the image
     * to be the background fitted to the canvas (see prepare_background()),
     * so the coordinates are canvas pixels. A valid zone satisfies
     * `0 <= top < bottom <= height` and `0 <= left < right <= width`.
     */
    struct MENU_OVERLAY_EXPORT clear_zone {
        int top = 0;    ///< First row of the quiet area
        int bottom = 0; ///< One past the last row of the quiet area
        int left = 0;   ///< First column of the quiet area
        int right = 0;  ///< One past the last column of the quiet area

        [[nodiscard]] int width() const { return right - left; }
        [[nodiscard]] int height() const { return bottom - top; }

        bool operator==(const clear_zone&) const = default;
    };

    /**
     * @brief Convert typographic points to pixels at a given DPI.
     *
     * Rounds half up, so results are stable across renderers.
     *
     * @param pt Size in points (1/72 inch)
     * @param dpi Target resolution
     * @return Size in whole pixels
     */
    MENU_OVERLAY_EXPORT int pt_to_px(double pt, int dpi);

    /**
     * @brief Convert pixels to typographic points at a given DPI.
     */
    MENU_OVERLAY_EXPORT double px_to_pt(double px, int dpi);

    /// Round half up, matching the rounding used for layout positions.
    MENU_OVERLAY_EXPORT int round_half_up(double value);
} // namespace menu_overlay
