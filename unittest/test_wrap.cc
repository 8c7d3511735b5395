//
// Created by igor on 16/10/2026.
//
// Unit tests for the text wrapper
//

#include <doctest/doctest.h>
#include <menu_overlay/text/wrap.hh>
#include <limits>
#include <sstream>

using namespace menu_overlay;

namespace {
    std::vector<std::string> words_of(const std::string& s) {
        std::istringstream in(s);
        std::vector<std::string> out;
        std::string w;
        while (in >> w) out.push_back(w);
        return out;
    }

    std::string join(const std::vector<std::string>& lines) {
        std::string out;
        for (const auto& l : lines) {
            if (!out.empty()) out += ' ';
            out += l;
        }
        return out;
    }
}

TEST_SUITE("wrap") {

    TEST_CASE("character width ratio") {
        CHECK(CHAR_WIDTH_RATIO == doctest::Approx(0.55));
    }

    TEST_CASE("text_length counts code points") {
        CHECK(text_length("") == 0);
        CHECK(text_length("Manhattan") == 9);
        CHECK(text_length("Caf\xC3\xA9") == 4);
        CHECK(text_length("a \xC2\xB7 b") == 5);
    }

    TEST_CASE("needs_wrapping") {
        CHECK(needs_wrapping("1234567890", 20, 109));
        CHECK_FALSE(needs_wrapping("1234567890", 20, 111));
        CHECK_FALSE(needs_wrapping("", 20, 10));
        CHECK(needs_wrapping("short", 100, 50));
    }

    TEST_CASE("wraps at word boundaries") {
        auto lines = wrap_text("alpha beta gamma", 20, 120);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "alpha beta");
        CHECK(lines[1] == "gamma");
    }

    TEST_CASE("text that fits stays on one line") {
        auto lines = wrap_text("Old Fashioned", 10, 1000);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == "Old Fashioned");
    }

    TEST_CASE("long words are never split") {
        auto lines = wrap_text("supercalifragilistic is long", 20, 55);
        REQUIRE(lines.size() == 3);
        CHECK(lines[0] == "supercalifragilistic");
        CHECK(lines[1] == "is");
        CHECK(lines[2] == "long");
    }

    TEST_CASE("empty and blank input give no lines") {
        CHECK(wrap_text("", 12, 100).empty());
        CHECK(wrap_text("   \t ", 12, 100).empty());
    }

    TEST_CASE("runs of whitespace collapse") {
        auto lines = wrap_text("  gin   and\ttonic  ", 10, 1000);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == "gin and tonic");
    }

    TEST_CASE("rejoined lines preserve every word in order") {
        const std::string text =
            "Bourbon, demerara sugar, angostura bitters and an orange twist over a large clear cube";
        for (double width : {40.0, 90.0, 150.0, 400.0, 2000.0}) {
            auto lines = wrap_text(text, 12, width);
            CHECK(words_of(join(lines)) == words_of(text));
            for (const auto& line : lines) {
                CHECK_FALSE(line.empty());
                CHECK(line.front() != ' ');
                CHECK(line.back() != ' ');
            }
        }
    }

    TEST_CASE("estimate_lines") {
        CHECK(estimate_lines("1234567890", 20, 55) == 2);
        CHECK(estimate_lines("1234567890", 20, 1000) == 1);
        CHECK(estimate_lines("1234567890", 0, 100) == 1);
        CHECK(estimate_lines("1234567890", 20, 5) == 1);
    }

    TEST_CASE("unbounded and invalid widths") {
        const double inf = std::numeric_limits<double>::infinity();
        const double nan = std::numeric_limits<double>::quiet_NaN();

        auto wide = wrap_text("alpha beta", 10, inf);
        REQUIRE(wide.size() == 1);
        CHECK(wide[0] == "alpha beta");
        CHECK(estimate_lines("1234567890", 10, inf) == 1);
        CHECK(estimate_lines("1234567890", 10, 1e300) == 1);

        // No usable width: one word per line
        auto narrow = wrap_text("alpha beta", 10, nan);
        REQUIRE(narrow.size() == 2);
        CHECK(narrow[0] == "alpha");
        CHECK(narrow[1] == "beta");
        CHECK(estimate_lines("1234567890", 10, nan) == 1);
    }
}
