/**
 * @file pixel_buffer.hh
 * @brief Decoded raster image storage and PNG codec.
 *
 * pixel_buffer holds a decoded background image as tightly packed,
 * row-major 8-bit samples. Alpha is always stripped on decode, so a
 * buffer produced by decode_png() has exactly three channels (RGB).
 *
 * @section pixel_buffer_usage Usage
 *
 * @code{.cpp}
 * pixel_buffer bg = load_png("background.png");
 * const uint8_t* p = bg.pixel(bg.width / 2, bg.height / 2);
 * int brightness = (p[0] + p[1] + p[2]) / 3;
 * @endcode
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace menu_overlay {
    /**
     * @brief Raw decoded image.
     *
     * Samples are stored row by row, `channels` bytes per pixel, with no
     * padding between rows.
     */
    struct MENU_OVERLAY_EXPORT pixel_buffer {
        int width = 0;
        int height = 0;
        int channels = 3;            ///< Samples per pixel (alpha already stripped)
        std::vector<uint8_t> data;   ///< width * height * channels bytes

        pixel_buffer() = default;

        /**
         * @brief Allocate a zero-filled buffer.
         */
        pixel_buffer(int w, int h, int c = 3);

        /// Pointer to the first sample of pixel (x, y). No bounds check.
        [[nodiscard]] const uint8_t* pixel(int x, int y) const {
            return data.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                  static_cast<std::size_t>(x)) * static_cast<std::size_t>(channels);
        }

        /// Mutable pointer to pixel (x, y). No bounds check.
        [[nodiscard]] uint8_t* pixel(int x, int y) {
            return data.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                  static_cast<std::size_t>(x)) * static_cast<std::size_t>(channels);
        }

        /// True when dimensions are positive and the sample count matches them.
        [[nodiscard]] bool is_consistent() const;
    };

    /**
     * @brief Decode PNG bytes into an RGB buffer.
     *
     * Gray and palette images are expanded to RGB; an alpha channel, if
     * present, is dropped without compositing.
     *
     * @param bytes Encoded PNG file contents
     * @return Decoded image with 3 channels
     * @throws std::runtime_error if the bytes are not a decodable PNG
     */
    MENU_OVERLAY_EXPORT pixel_buffer decode_png(std::span<const uint8_t> bytes);

    /**
     * @brief Read and decode a PNG file.
     *
     * @throws std::runtime_error if the file cannot be read or decoded
     */
    MENU_OVERLAY_EXPORT pixel_buffer load_png(const std::filesystem::path& path);

    /**
     * @brief Encode an RGB or gray buffer as PNG.
     *
     * @throws std::invalid_argument for inconsistent buffers
     * @throws std::runtime_error if encoding fails
     */
    MENU_OVERLAY_EXPORT std::vector<uint8_t> encode_png(const pixel_buffer& image);

    /**
     * @brief Encode and write a PNG file.
     */
    MENU_OVERLAY_EXPORT void save_png(const pixel_buffer& image, const std::filesystem::path& path);
} // namespace menu_overlay
