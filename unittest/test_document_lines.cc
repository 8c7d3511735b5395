//
// Created by igor on 16/10/2026.
//
// Unit tests for document line placement
//

#include <doctest/doctest.h>
#include <menu_overlay/render/document_lines.hh>

using namespace menu_overlay;

TEST_SUITE("document_lines") {

    TEST_CASE("parse_hex_color") {
        CHECK(parse_hex_color("#000000") == rgb_color{0, 0, 0});
        CHECK(parse_hex_color("#FFFFFF") == rgb_color{1, 1, 1});

        auto purple = parse_hex_color("#7213a5");
        CHECK(purple.r == doctest::Approx(0x72 / 255.0));
        CHECK(purple.g == doctest::Approx(0x13 / 255.0));
        CHECK(purple.b == doctest::Approx(0xA5 / 255.0));

        CHECK(parse_hex_color("#f00") == rgb_color{1, 0, 0});
        CHECK(parse_hex_color("555555").r == doctest::Approx(0x55 / 255.0));

        CHECK_THROWS_AS((void)parse_hex_color("#12345"), std::invalid_argument);
        CHECK_THROWS_AS((void)parse_hex_color("#GGGGGG"), std::invalid_argument);
        CHECK_THROWS_AS((void)parse_hex_color(""), std::invalid_argument);

        CHECK(try_parse_hex_color("#f00") == rgb_color{1, 0, 0});
        CHECK_FALSE(try_parse_hex_color("black").has_value());
        CHECK_FALSE(try_parse_hex_color("rgb(0,0,0)").has_value());
    }

    TEST_CASE("non-hex colors are drawn black") {
        text_element el;
        el.text = "Cocktail Menu";
        el.x = 100;
        el.y = 200;
        el.font_size = 40;
        el.font_family = "Georgia";
        el.color = "navy";

        text_layout layout{720, 720, {el}};
        document_page page;
        CHECK_NOTHROW(page = place_document_lines(layout, 72, "Georgia"));
        REQUIRE(page.runs.size() == 1);
        CHECK(page.runs[0].color == rgb_color{0, 0, 0});
        CHECK(page.runs[0].text == "Cocktail Menu");
    }

    TEST_CASE("font roles") {
        text_element el;
        el.font_family = "georgia";
        el.weight = font_weight::bold;
        CHECK(resolve_font_role(el, "Georgia") == font_role::heading);

        el.font_family = "Helvetica";
        CHECK(resolve_font_role(el, "Georgia") == font_role::body_bold);
        el.weight = font_weight::normal;
        CHECK(resolve_font_role(el, "Georgia") == font_role::body_regular);
    }

    TEST_CASE("page size and y flip") {
        text_layout layout;
        layout.width = 1726;
        layout.height = 2626;

        text_element title;
        title.text = "Cocktail Menu";
        title.x = 863;
        title.y = 920;
        title.font_size = 117;
        title.font_family = "Georgia";
        title.weight = font_weight::bold;
        title.color = "#7213A5";
        title.anchor = text_anchor::middle;
        layout.elements.push_back(title);

        auto page = place_document_lines(layout, 300, "Georgia");
        CHECK(page.width == doctest::Approx(414.24));
        CHECK(page.height == doctest::Approx(630.24));
        REQUIRE(page.runs.size() == 1);

        const auto& run = page.runs[0];
        CHECK(run.text == "Cocktail Menu");
        CHECK(run.x == doctest::Approx(207.12));
        CHECK(run.baseline == doctest::Approx(630.24 - 220.8));
        CHECK(run.font_size == doctest::Approx(28.08));
        CHECK(run.role == font_role::heading);
        CHECK(run.anchor == text_anchor::middle);
        CHECK(run.color.r == doctest::Approx(0x72 / 255.0));
    }

    TEST_CASE("wrapped elements become one run per line") {
        text_element el;
        el.text = "alpha beta gamma";
        el.x = 72;
        el.y = 144;
        el.font_size = 20;
        el.font_family = "Helvetica";
        el.color = "#000000";
        el.max_width = 120;

        text_layout layout{720, 720, {el}};
        auto page = place_document_lines(layout, 72, "Georgia");

        REQUIRE(page.runs.size() == 2);
        CHECK(page.runs[0].text == "alpha beta");
        CHECK(page.runs[1].text == "gamma");
        CHECK(page.runs[0].baseline == doctest::Approx(720 - 144));
        CHECK(page.runs[1].baseline == doctest::Approx(720 - 144 - 26));
        CHECK(page.runs[1].x == doctest::Approx(72));
        CHECK(page.runs[1].role == font_role::body_regular);
    }

    TEST_CASE("invalid dpi throws") {
        CHECK_THROWS_AS((void)place_document_lines(text_layout{}, 0, "Georgia"), std::invalid_argument);
    }

    TEST_CASE("anchored_x") {
        document_run run;
        run.x = 200;

        run.anchor = text_anchor::start;
        CHECK(anchored_x(run, 50) == doctest::Approx(200));
        run.anchor = text_anchor::middle;
        CHECK(anchored_x(run, 50) == doctest::Approx(175));
        run.anchor = text_anchor::end;
        CHECK(anchored_x(run, 50) == doctest::Approx(150));
    }
}
