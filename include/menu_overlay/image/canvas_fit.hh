/**
 * @file canvas_fit.hh
 * @brief Fitting generated backgrounds to a target canvas.
 *
 * Image providers return artwork at their own resolution. Before the
 * clear zone is measured the background is resized to the full canvas of
 * the target format (trim plus bleed on every side), so the zone, the
 * layout and the final composite share one coordinate system.
 *
 * Resizing uses "cover" semantics: the image is scaled uniformly until it
 * covers the canvas, then the overflow is cropped evenly from both sides.
 *
 * @code
 *   1024 x 1536 source            1726 x 2626 canvas (half-letter)
 *   +-------+                    +-+-------+-+
 *   |       |    scale 1.71      | |       | |  12px cropped left/right
 *   |       |       =>           | |       | |
 *   +-------+                    +-+-------+-+
 * @endcode
 *
 * Print formats additionally get crop marks at the trim corners, drawn in
 * the bleed area.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/formats.hh>
#include <menu_overlay/image/pixel_buffer.hh>

namespace menu_overlay {
    /// Longest crop mark arm, in pixels.
    inline constexpr int CROP_MARK_LENGTH = 20;

    /// Gap between a crop mark and the trim corner, in pixels.
    inline constexpr int CROP_MARK_OFFSET = 2;

    /**
     * @brief Cover-resize an image to the given size, cropping centered.
     *
     * @param image Source image, 1 or 3 channels
     * @param width Target width
     * @param height Target height
     * @return Resized image with the source channel count
     * @throws std::invalid_argument for inconsistent buffers or a
     *         non-positive target size
     */
    MENU_OVERLAY_EXPORT pixel_buffer cover_resize(const pixel_buffer& image, int width, int height);

    /**
     * @brief Resize a background to the canvas of a format.
     *
     * The result is `format.canvas_width() x format.canvas_height()`.
     */
    MENU_OVERLAY_EXPORT pixel_buffer fit_to_canvas(const pixel_buffer& image, const canvas_format& format);

    /**
     * @brief Draw black crop marks at the four trim corners.
     *
     * Arms are `min(CROP_MARK_LENGTH, bleed - CROP_MARK_OFFSET)` long; with
     * no room for an arm nothing is drawn.
     *
     * @param image Canvas-sized image, modified in place
     * @param bleed Bleed of the canvas, in pixels
     */
    MENU_OVERLAY_EXPORT void draw_crop_marks(pixel_buffer& image, int bleed);

    /**
     * @brief Prepare a generated background for measuring and compositing.
     *
     * Fits the image to the canvas and, for print formats, draws crop
     * marks. Measure the clear zone on the result, not on the source.
     */
    MENU_OVERLAY_EXPORT pixel_buffer prepare_background(const pixel_buffer& image, const canvas_format& format);
} // namespace menu_overlay
