/**
 * @file clear_zone.hh
 * @brief Detection of the quiet area of a background image.
 *
 * Generated artwork usually leaves a calm region (plain paper, a flat
 * gradient) surrounded by decoration. The detector finds that region so
 * overlay text can be placed inside it.
 *
 * @section clear_zone_algorithm Algorithm
 *
 * 1. The image is cut into horizontal bands. Each band gets a busyness
 *    score: the mean, over sampled rows, of the standard deviation of
 *    sampled brightness values along the row.
 * 2. The longest run of consecutive bands scoring below the busyness
 *    threshold becomes the vertical extent. The first run wins ties.
 * 3. Runs shorter than the minimum clear height are rejected in favour
 *    of a fixed zone covering 25% .. 80% of the image height.
 * 4. The horizontal extent is found by sweeping outward from the image
 *    center and stopping at the first column that differs too much from
 *    the center color.
 *
 * @code{.cpp}
 * pixel_buffer bg = prepare_background(load_png("background.png"), fmt);
 * clear_zone zone = measure_clear_zone(bg);
 * auto layout = calculate_menu_layout(content, style, fmt, zone);
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/geometry.hh>
#include <menu_overlay/image/pixel_buffer.hh>
#include <vector>

namespace menu_overlay {
    /**
     * @brief Tuning constants for clear zone detection.
     *
     * The two thresholds measure different things (row brightness
     * deviation vs. RGB distance from a reference color) and were tuned
     * independently against the sampling strides below.
     */
    struct MENU_OVERLAY_EXPORT detector_config {
        int band_height = 50;            ///< Height of each analysis band
        double busyness_threshold = 40;  ///< Bands scoring below this are quiet
        int min_clear_height = 300;      ///< Shorter quiet runs are rejected
        int sample_step = 50;            ///< Pixel stride inside a band, both axes
        int column_step = 10;            ///< Stride of the left/right sweep
        double margin_threshold = 75;    ///< RGB distance that ends the sweep
        double fallback_top = 0.25;      ///< Fallback zone top, fraction of height
        double fallback_bottom = 0.80;   ///< Fallback zone bottom, fraction of height
    };

    /// Score assigned to a band with no usable samples.
    inline constexpr double MAX_BUSYNESS = 255.0;

    /**
     * @brief Find the quiet region of an image using default tuning.
     *
     * @param image Decoded image, at least 3 channels
     * @return Zone in source pixel coordinates, always valid
     * @throws std::invalid_argument if the buffer is inconsistent or has
     *         fewer than 3 channels
     */
    MENU_OVERLAY_EXPORT clear_zone measure_clear_zone(const pixel_buffer& image);

    /**
     * @brief Find the quiet region of an image.
     */
    MENU_OVERLAY_EXPORT clear_zone measure_clear_zone(const pixel_buffer& image,
                                                      const detector_config& config);

    /**
     * @brief Busyness score of every full band, top to bottom.
     *
     * Exposed for diagnostics; measure_clear_zone() uses the same scores.
     */
    MENU_OVERLAY_EXPORT std::vector<double> band_busyness(const pixel_buffer& image,
                                                          const detector_config& config = {});
} // namespace menu_overlay
