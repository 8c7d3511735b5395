//
// Created by igor on 19/10/2026.
//

#include <menu_overlay/image/canvas_fit.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace menu_overlay {

    namespace {
        // Bilinear sample of one channel at fractional source coordinates
        uint8_t sample(const pixel_buffer& src, double sx, double sy, int channel) {
            sx = std::clamp(sx, 0.0, static_cast<double>(src.width - 1));
            sy = std::clamp(sy, 0.0, static_cast<double>(src.height - 1));

            const int x1 = static_cast<int>(sx);
            const int y1 = static_cast<int>(sy);
            const int x2 = std::min(x1 + 1, src.width - 1);
            const int y2 = std::min(y1 + 1, src.height - 1);
            const double fx = sx - x1;
            const double fy = sy - y1;

            const double v = src.pixel(x1, y1)[channel] * (1 - fx) * (1 - fy) +
                             src.pixel(x2, y1)[channel] * fx * (1 - fy) +
                             src.pixel(x1, y2)[channel] * (1 - fx) * fy +
                             src.pixel(x2, y2)[channel] * fx * fy;
            return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
        }

        void set_black(pixel_buffer& image, int x, int y) {
            if (x < 0 || y < 0 || x >= image.width || y >= image.height) return;
            uint8_t* p = image.pixel(x, y);
            for (int c = 0; c < image.channels; c++) {
                p[c] = 0;
            }
        }

        void hline(pixel_buffer& image, int x0, int x1, int y) {
            for (int x = x0; x <= x1; x++) set_black(image, x, y);
        }

        void vline(pixel_buffer& image, int x, int y0, int y1) {
            for (int y = y0; y <= y1; y++) set_black(image, x, y);
        }
    } // anonymous namespace

    pixel_buffer cover_resize(const pixel_buffer& image, int width, int height) {
        THROW_IF(!image.is_consistent(), std::invalid_argument,
                 "Invalid image: buffer does not match", image.width, "x", image.height, "x", image.channels);
        THROW_IF(width <= 0 || height <= 0, std::invalid_argument,
                 "Target size must be positive:", width, "x", height);

        const double scale = std::max(static_cast<double>(width) / image.width,
                                      static_cast<double>(height) / image.height);
        const double offset_x = (image.width * scale - width) / 2.0;
        const double offset_y = (image.height * scale - height) / 2.0;

        pixel_buffer out(width, height, image.channels);
        for (int y = 0; y < height; y++) {
            const double sy = (y + offset_y + 0.5) / scale - 0.5;
            for (int x = 0; x < width; x++) {
                const double sx = (x + offset_x + 0.5) / scale - 0.5;
                uint8_t* p = out.pixel(x, y);
                for (int c = 0; c < image.channels; c++) {
                    p[c] = sample(image, sx, sy, c);
                }
            }
        }
        return out;
    }

    pixel_buffer fit_to_canvas(const pixel_buffer& image, const canvas_format& format) {
        spdlog::debug("fit background {}x{} to {} canvas {}x{}", image.width, image.height,
                      format.name, format.canvas_width(), format.canvas_height());
        return cover_resize(image, format.canvas_width(), format.canvas_height());
    }

    void draw_crop_marks(pixel_buffer& image, int bleed) {
        const int length = std::min(CROP_MARK_LENGTH, bleed - CROP_MARK_OFFSET);
        if (length <= 0) {
            return;
        }

        const int left = bleed;
        const int top = bleed;
        const int right = image.width - bleed;
        const int bottom = image.height - bleed;
        constexpr int gap = CROP_MARK_OFFSET;

        hline(image, left - length, left - gap, top);
        vline(image, left, top - length, top - gap);

        hline(image, right + gap, right + length, top);
        vline(image, right, top - length, top - gap);

        hline(image, left - length, left - gap, bottom);
        vline(image, left, bottom + gap, bottom + length);

        hline(image, right + gap, right + length, bottom);
        vline(image, right, bottom + gap, bottom + length);
    }

    pixel_buffer prepare_background(const pixel_buffer& image, const canvas_format& format) {
        pixel_buffer out = fit_to_canvas(image, format);
        if (format.category == format_category::print) {
            draw_crop_marks(out, format.bleed);
        }
        return out;
    }

} // namespace menu_overlay
