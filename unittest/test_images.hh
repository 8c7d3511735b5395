//
// Created by igor on 16/10/2026.
//
// Synthetic backgrounds shared by the unit tests
//

#pragma once

#include <menu_overlay/image/pixel_buffer.hh>
#include <cstdint>

namespace menu_overlay::test {

    inline void fill_rect(pixel_buffer& img, int x0, int y0, int x1, int y1,
                          uint8_t r, uint8_t g, uint8_t b) {
        for (int y = y0; y < y1; y++) {
            for (int x = x0; x < x1; x++) {
                uint8_t* p = img.pixel(x, y);
                p[0] = r;
                p[1] = g;
                p[2] = b;
            }
        }
    }

    inline pixel_buffer solid_image(int w, int h, uint8_t r = 240, uint8_t g = 235, uint8_t b = 220) {
        pixel_buffer img(w, h, 3);
        fill_rect(img, 0, 0, w, h, r, g, b);
        return img;
    }

    // Vertical stripes 50px wide alternating dark and light, over rows [y0, y1).
    // The detector samples every 50px, so each sampled row sees both shades.
    inline void stripe_rows(pixel_buffer& img, int y0, int y1) {
        for (int y = y0; y < y1; y++) {
            for (int x = 0; x < img.width; x++) {
                const uint8_t v = ((x / 50) % 2) != 0 ? 230 : 20;
                uint8_t* p = img.pixel(x, y);
                p[0] = v;
                p[1] = v;
                p[2] = v;
            }
        }
    }

    inline pixel_buffer striped_image(int w, int h) {
        pixel_buffer img(w, h, 3);
        stripe_rows(img, 0, h);
        return img;
    }

    // Uniform image with busy bands at the top and bottom
    inline pixel_buffer busy_bands_image(int w, int h, int busy_top, int busy_bottom_start) {
        pixel_buffer img = solid_image(w, h);
        stripe_rows(img, 0, busy_top);
        stripe_rows(img, busy_bottom_start, h);
        return img;
    }

    // Light gray image with saturated red borders on the left and right
    inline pixel_buffer bordered_image(int w, int h, int border) {
        pixel_buffer img = solid_image(w, h, 240, 240, 240);
        fill_rect(img, 0, 0, border, h, 250, 20, 20);
        fill_rect(img, w - border, 0, w, h, 250, 20, 20);
        return img;
    }

} // namespace menu_overlay::test
