//
// Created by igor on 16/10/2026.
//
// Unit tests for YAML content, brand and detector loaders
//

#include <doctest/doctest.h>
#include <menu_overlay/content/yaml_loader.hh>

using namespace menu_overlay;

TEST_SUITE("yaml_loader") {

    TEST_CASE("menu content") {
        const char* yaml = R"(
title: Cocktail Menu
subtitle: Friday nights
footer: Open daily from 5pm
campaign: spring-2026
tags: [cocktails, bar]
sections:
  - title: Classics
    items:
      - name: Old Fashioned
        price: "$14"
        description: Bourbon, bitters, sugar
      - name: Manhattan
        price: "$15"
  - title: Zero Proof
    items:
      - name: Nojito
)";
        auto menu = parse_menu_yaml(yaml);
        CHECK(menu.title == "Cocktail Menu");
        CHECK(menu.subtitle == "Friday nights");
        CHECK(menu.footer == "Open daily from 5pm");
        CHECK(menu.campaign == "spring-2026");
        REQUIRE(menu.tags.size() == 2);
        CHECK(menu.tags[1] == "bar");

        REQUIRE(menu.sections.size() == 2);
        CHECK(menu.sections[0].items[0].description == "Bourbon, bitters, sugar");
        CHECK(menu.sections[0].items[1].price == "$15");
        CHECK_FALSE(menu.sections[1].items[0].price.has_value());
        CHECK(menu.item_count() == 3);
        CHECK(menu.described_item_count() == 1);
    }

    TEST_CASE("menu requires title and items") {
        CHECK_THROWS_AS((void)parse_menu_yaml("sections: []\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_menu_yaml("title: Menu\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_menu_yaml("title: Menu\nsections:\n  - title: Empty\n    items: []\n"),
                        std::runtime_error);
        CHECK_THROWS_AS((void)parse_menu_yaml("title: Menu\nsections:\n  - title: A\n    items:\n      - price: $1\n"),
                        std::runtime_error);
    }

    TEST_CASE("malformed yaml throws runtime_error") {
        CHECK_THROWS_AS((void)parse_menu_yaml("title: [unclosed\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_menu_yaml("- just\n- a list\n"), std::runtime_error);
    }

    TEST_CASE("brand style") {
        const char* yaml = R"(
colors:
  primary: "#7213A5"
  dark: "#222222"
typography:
  heading: Playfair Display
  body: Lato
)";
        auto style = parse_brand_style(yaml);
        CHECK(style.primary_color == "#7213A5");
        CHECK(style.dark_color == "#222222");
        CHECK(style.description_color == DEFAULT_DESCRIPTION_COLOR);
        CHECK(style.heading_font == "Playfair Display");
        CHECK(style.body_font == "Lato");
    }

    TEST_CASE("brand description color") {
        const char* yaml = R"(
colors: {primary: "#111111", dark: "#000000", description: "#777777"}
typography: {heading: Georgia, body: Helvetica}
)";
        CHECK(parse_brand_style(yaml).description_color == "#777777");
    }

    TEST_CASE("brand requires every token") {
        CHECK_THROWS_AS((void)parse_brand_style("colors: {primary: \"#111111\"}\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_brand_style(
                            "colors: {primary: \"#111111\", dark: \"#000000\"}\ntypography: {heading: Georgia}\n"),
                        std::runtime_error);
    }

    TEST_CASE("detector settings") {
        auto config = parse_detector_config("band_height: 25\nmargin_threshold: 60\n");
        CHECK(config.band_height == 25);
        CHECK(config.margin_threshold == doctest::Approx(60));
        CHECK(config.busyness_threshold == doctest::Approx(40));
        CHECK(config.min_clear_height == 300);
        CHECK(config.fallback_bottom == doctest::Approx(0.80));

        auto defaults = parse_detector_config("");
        CHECK(defaults.band_height == 50);
        CHECK(defaults.sample_step == 50);
        CHECK(defaults.column_step == 10);
    }

    TEST_CASE("detector settings are validated") {
        CHECK_THROWS_AS((void)parse_detector_config("sample_step: 0\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_detector_config("fallback_top: 0.9\n"), std::runtime_error);
        CHECK_THROWS_AS((void)parse_detector_config("band_height: tall\n"), std::runtime_error);
    }

    TEST_CASE("missing files throw") {
        CHECK_THROWS_AS((void)load_menu_yaml("/nonexistent/menu.yaml"), std::runtime_error);
        CHECK_THROWS_AS((void)load_brand_style("/nonexistent/brand.yaml"), std::runtime_error);
        CHECK_THROWS_AS((void)load_detector_config("/nonexistent/detector.yaml"), std::runtime_error);
    }
}
