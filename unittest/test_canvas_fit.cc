//
// Created by igor on 19/10/2026.
//
// Unit tests for fitting backgrounds to the canvas
//

#include <doctest/doctest.h>
#include <menu_overlay/image/canvas_fit.hh>
#include <menu_overlay/image/clear_zone.hh>
#include <menu_overlay/layout/menu_layout.hh>
#include "test_images.hh"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

using namespace menu_overlay;
using namespace menu_overlay::test;

namespace {
    bool is_black(const pixel_buffer& img, int x, int y) {
        const uint8_t* p = img.pixel(x, y);
        return p[0] == 0 && p[1] == 0 && p[2] == 0;
    }

    bool has_color(const pixel_buffer& img, int x, int y, uint8_t r, uint8_t g, uint8_t b) {
        const uint8_t* p = img.pixel(x, y);
        return p[0] == r && p[1] == g && p[2] == b;
    }

    const canvas_format& half_letter() {
        return resolve_format("half-letter");
    }
}

TEST_SUITE("canvas_fit") {

    TEST_CASE("fit produces the canvas size") {
        auto img = solid_image(1024, 1536);
        auto fitted = fit_to_canvas(img, half_letter());

        CHECK(fitted.width == 1726);
        CHECK(fitted.height == 2626);
        CHECK(fitted.channels == 3);
        CHECK(fitted.is_consistent());
    }

    TEST_CASE("uniform color survives resizing") {
        auto fitted = fit_to_canvas(solid_image(1024, 1536, 12, 34, 56), half_letter());

        CHECK(has_color(fitted, 0, 0, 12, 34, 56));
        CHECK(has_color(fitted, 863, 1313, 12, 34, 56));
        CHECK(has_color(fitted, 1725, 2625, 12, 34, 56));
    }

    TEST_CASE("wide image is cropped evenly on both sides") {
        // Left half red, right half blue; a square canvas keeps the middle
        auto img = solid_image(200, 100, 20, 20, 250);
        fill_rect(img, 0, 0, 100, 100, 250, 20, 20);

        auto fitted = fit_to_canvas(img, resolve_format("instagram"));
        REQUIRE(fitted.width == 1080);
        REQUIRE(fitted.height == 1080);

        CHECK(has_color(fitted, 0, 540, 250, 20, 20));
        CHECK(has_color(fitted, 1079, 540, 20, 20, 250));
    }

    TEST_CASE("gray images keep one channel") {
        pixel_buffer gray(10, 10, 1);
        std::fill(gray.data.begin(), gray.data.end(), uint8_t{90});

        auto out = cover_resize(gray, 30, 20);
        CHECK(out.channels == 1);
        CHECK(out.width == 30);
        CHECK(out.height == 20);
        CHECK(out.pixel(15, 10)[0] == 90);
    }

    TEST_CASE("invalid input is rejected") {
        CHECK_THROWS_AS(cover_resize(solid_image(10, 10), 0, 10), std::invalid_argument);
        CHECK_THROWS_AS(cover_resize(solid_image(10, 10), 10, -1), std::invalid_argument);

        pixel_buffer broken(10, 10, 3);
        broken.data.resize(5);
        CHECK_THROWS_AS(cover_resize(broken, 10, 10), std::invalid_argument);
    }

    TEST_CASE("print backgrounds get crop marks in the bleed") {
        auto prepared = prepare_background(solid_image(1024, 1536), half_letter());
        REQUIRE(prepared.width == 1726);

        // Trim corners sit at 38px bleed; arms stop 2px short of the corner
        CHECK(is_black(prepared, 28, 38));
        CHECK(is_black(prepared, 38, 28));
        CHECK_FALSE(is_black(prepared, 38, 38));
        CHECK_FALSE(is_black(prepared, 37, 38));
        CHECK(is_black(prepared, 1698, 2588));
        CHECK(is_black(prepared, 1688, 2598));
        CHECK_FALSE(is_black(prepared, 100, 100));
    }

    TEST_CASE("social backgrounds have no crop marks") {
        auto prepared = prepare_background(solid_image(512, 512), resolve_format("instagram"));
        for (const auto& [x, y] : {std::pair{0, 0}, std::pair{10, 0}, std::pair{0, 10}, std::pair{1079, 1079}}) {
            CHECK_FALSE(is_black(prepared, x, y));
        }
    }

    TEST_CASE("crop marks need room in the bleed") {
        auto img = solid_image(50, 50);
        draw_crop_marks(img, 2);
        CHECK(std::none_of(img.data.begin(), img.data.end(), [](uint8_t v) { return v == 0; }));
    }

    TEST_CASE("zone measured on a fitted background is in canvas pixels") {
        // Generators return 1024x1536; the canvas is 1726x2626
        auto prepared = prepare_background(solid_image(1024, 1536), half_letter());
        auto zone = measure_clear_zone(prepared);

        CHECK(zone.right > 1024);
        CHECK(zone.right <= prepared.width);
        CHECK(zone.bottom > 1536);
        CHECK(zone.bottom <= prepared.height);

        menu_content content;
        content.title = "Cocktail Menu";
        content.sections.push_back({"Classics", {{"Old Fashioned", "$14", std::nullopt},
                                                 {"Manhattan", "$15", std::nullopt}}});

        auto layout = calculate_menu_layout(content, style_tokens{}, half_letter(), zone);
        CHECK(layout.width == prepared.width);
        CHECK(layout.height == prepared.height);
        REQUIRE_FALSE(layout.elements.empty());
        CHECK(std::abs(2 * layout.elements.front().x - (zone.left + zone.right)) <= 1);

        // The full-width zone leaves room for prices at the right edge
        const auto prices = std::count_if(layout.elements.begin(), layout.elements.end(),
                                          [](const text_element& e) { return e.anchor == text_anchor::end; });
        CHECK(prices == 2);
        for (const auto& el : layout.elements) {
            CHECK(el.x >= zone.left);
            CHECK(el.x <= zone.right);
            CHECK(el.y <= zone.bottom);
        }
    }
}
