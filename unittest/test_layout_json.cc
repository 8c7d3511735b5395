//
// Created by igor on 16/10/2026.
//
// Unit tests for the JSON layout hand-off
//

#include <doctest/doctest.h>
#include <menu_overlay/render/layout_json.hh>
#include <menu_overlay/layout/menu_layout.hh>
#include <cstdio>
#include <filesystem>

using namespace menu_overlay;

namespace {
    text_layout sample_layout() {
        text_layout layout;
        layout.width = 1726;
        layout.height = 2626;

        text_element title;
        title.text = "Caf\xC3\xA9 \"Noir\"";
        title.x = 863;
        title.y = 920;
        title.font_size = 117;
        title.font_family = "Georgia";
        title.weight = font_weight::bold;
        title.color = "#7213A5";
        title.anchor = text_anchor::middle;
        title.max_width = 1500;
        layout.elements.push_back(title);

        text_element price;
        price.text = "$14";
        price.x = 1584;
        price.y = 1200;
        price.font_size = 46;
        price.font_family = "Helvetica";
        price.weight = font_weight::normal;
        price.color = "#000000";
        price.anchor = text_anchor::end;
        layout.elements.push_back(price);
        return layout;
    }
}

TEST_SUITE("layout_json") {

    TEST_CASE("field names and indentation") {
        auto json = layout_to_json(sample_layout());

        CHECK(json.find("\"width\" : 1726") != std::string::npos);
        CHECK(json.find("\"fontSize\" : 117") != std::string::npos);
        CHECK(json.find("\"fontFamily\" : \"Georgia\"") != std::string::npos);
        CHECK(json.find("\"fontWeight\" : \"bold\"") != std::string::npos);
        CHECK(json.find("\"anchor\" : \"middle\"") != std::string::npos);
        CHECK(json.find("\n  \"elements\"") != std::string::npos);
        CHECK(json.find('\t') == std::string::npos);
    }

    TEST_CASE("maxWidth is omitted when unset") {
        text_layout layout = sample_layout();
        layout.elements.erase(layout.elements.begin());
        CHECK(layout_to_json(layout).find("maxWidth") == std::string::npos);

        CHECK(layout_to_json(sample_layout()).find("maxWidth") != std::string::npos);
    }

    TEST_CASE("parsing restores every field") {
        const auto original = sample_layout();
        const auto parsed = layout_from_json(layout_to_json(original));

        CHECK(parsed == original);
        CHECK_FALSE(parsed.elements[1].max_width.has_value());
    }

    TEST_CASE("computed layout survives the hand-off") {
        menu_content content;
        content.title = "Cocktail Menu";
        content.sections.push_back({"Classics", {{"Old Fashioned", "$14", "Bourbon & bitters"}}});
        content.footer = "Open daily";

        auto layout = calculate_menu_layout(content, style_tokens{}, resolve_format("half-letter"));
        CHECK(layout_from_json(layout_to_json(layout)) == layout);
    }

    TEST_CASE("malformed documents throw") {
        CHECK_THROWS_AS((void)layout_from_json("{ not json"), std::runtime_error);
        CHECK_THROWS_AS((void)layout_from_json("[]"), std::runtime_error);
        CHECK_THROWS_AS((void)layout_from_json(R"({"width": 10, "height": 10})"), std::runtime_error);
        CHECK_THROWS_AS((void)layout_from_json(R"({"width": 10, "height": 10, "elements": {}})"),
                        std::runtime_error);
        CHECK_THROWS_AS((void)layout_from_json(
                            R"({"width": 10, "height": 10, "elements": [{"text": "x"}]})"),
                        std::runtime_error);
        CHECK_THROWS_AS((void)layout_from_json(
                            R"({"width": 10, "height": 10, "elements": [{"text": "x", "x": 1, "y": 2,
                                "fontSize": 3, "fontFamily": "A", "fontWeight": "heavy",
                                "color": "#000", "anchor": "start"}]})"),
                        std::runtime_error);
    }

    TEST_CASE("file round trip") {
        const auto path = std::filesystem::temp_directory_path() / "menu_overlay_layout_test.json";
        save_layout_json(sample_layout(), path);
        CHECK(load_layout_json(path) == sample_layout());
        std::filesystem::remove(path);

        CHECK_THROWS_AS((void)load_layout_json("/nonexistent/layout.json"), std::runtime_error);
    }
}
