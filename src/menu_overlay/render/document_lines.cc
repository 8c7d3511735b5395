//
// Created by igor on 15/10/2026.
//

#include <menu_overlay/render/document_lines.hh>
#include <menu_overlay/geometry.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace menu_overlay {

    namespace {
        int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool iequals(std::string_view a, std::string_view b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        }
    } // anonymous namespace

    std::optional<rgb_color> try_parse_hex_color(std::string_view hex) {
        if (!hex.empty() && hex.front() == '#') {
            hex.remove_prefix(1);
        }
        if (hex.size() != 6 && hex.size() != 3) {
            return std::nullopt;
        }

        int digits[6] = {};
        for (std::size_t i = 0; i < hex.size(); ++i) {
            digits[i] = hex_digit(hex[i]);
            if (digits[i] < 0) {
                return std::nullopt;
            }
        }

        auto channel = [&](std::size_t i) -> double {
            const int v = hex.size() == 3 ? digits[i] * 17 : digits[i * 2] * 16 + digits[i * 2 + 1];
            return v / 255.0;
        };
        return rgb_color{channel(0), channel(1), channel(2)};
    }

    rgb_color parse_hex_color(std::string_view hex) {
        auto color = try_parse_hex_color(hex);
        THROW_IF(!color, std::invalid_argument, "Color must be #RRGGBB or #RGB:", std::string(hex));
        return *color;
    }

    font_role resolve_font_role(const text_element& element, std::string_view heading_family) {
        if (iequals(element.font_family, heading_family)) {
            return font_role::heading;
        }
        return element.weight == font_weight::bold ? font_role::body_bold : font_role::body_regular;
    }

    document_page place_document_lines(const text_layout& layout, int dpi, std::string_view heading_family) {
        THROW_IF(dpi <= 0, std::invalid_argument, "DPI must be positive:", dpi);

        document_page page;
        page.width = px_to_pt(layout.width, dpi);
        page.height = px_to_pt(layout.height, dpi);

        for (const auto& el : layout.elements) {
            const auto lines = element_lines(el);
            const int line_height = element_line_height(el);
            const font_role role = resolve_font_role(el, heading_family);
            auto parsed = try_parse_hex_color(el.color);
            if (!parsed) {
                spdlog::warn("document lines: color \"{}\" of \"{}\" is not hex, using black", el.color, el.text);
            }
            const rgb_color color = parsed.value_or(rgb_color{});

            for (std::size_t i = 0; i < lines.size(); ++i) {
                const int y_px = el.y + static_cast<int>(i) * line_height;

                document_run run;
                run.text = lines[i];
                run.x = px_to_pt(el.x, dpi);
                run.baseline = page.height - px_to_pt(y_px, dpi);
                run.font_size = px_to_pt(el.font_size, dpi);
                run.role = role;
                run.color = color;
                run.anchor = el.anchor;
                page.runs.push_back(std::move(run));
            }
        }
        return page;
    }

    double anchored_x(const document_run& run, double text_width) {
        switch (run.anchor) {
            case text_anchor::middle:
                return run.x - text_width / 2.0;
            case text_anchor::end:
                return run.x - text_width;
            case text_anchor::start:
                break;
        }
        return run.x;
    }

} // namespace menu_overlay
