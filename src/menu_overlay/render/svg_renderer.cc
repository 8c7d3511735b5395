//
// Created by igor on 15/10/2026.
//

#include <menu_overlay/render/svg_renderer.hh>
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace menu_overlay {

    namespace {
        constexpr std::array<std::string_view, 16> SERIF_FAMILIES = {
            "baskerville", "bodoni", "caslon", "cormorant", "crimson", "didot",
            "garamond", "georgia", "libre baskerville", "lora", "merriweather",
            "palatino", "playfair", "playfair display", "times", "times new roman",
        };

        std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string style_of(const text_element& el) {
            std::ostringstream ss;
            ss << "font-family: '" << escape_xml(el.font_family) << "', " << generic_family(el.font_family)
               << "; font-size: " << el.font_size << "px"
               << "; font-weight: " << weight_name(el.weight)
               << "; fill: " << escape_xml(el.color);
            return ss.str();
        }

        void render_element(std::ostringstream& out, const text_element& el) {
            out << "<text x=\"" << el.x << "\" y=\"" << el.y << "\" text-anchor=\"" << anchor_name(el.anchor)
                << "\" style=\"" << style_of(el) << "\">";

            if (!element_wraps(el)) {
                out << escape_xml(el.text);
            } else {
                const auto lines = element_lines(el);
                const int line_height = element_line_height(el);
                for (std::size_t i = 0; i < lines.size(); ++i) {
                    out << "<tspan x=\"" << el.x << "\" dy=\"" << (i == 0 ? 0 : line_height) << "\">"
                        << escape_xml(lines[i]) << "</tspan>";
                }
            }
            out << "</text>";
        }
    } // anonymous namespace

    std::string_view generic_family(std::string_view family) {
        const std::string key = to_lower(family);
        if (std::find(SERIF_FAMILIES.begin(), SERIF_FAMILIES.end(), key) != SERIF_FAMILIES.end()) {
            return "serif";
        }
        if (key.find("serif") != std::string::npos && key.find("sans") == std::string::npos) {
            return "serif";
        }
        return "sans-serif";
    }

    std::string escape_xml(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                case '\'': out += "&apos;"; break;
                default: out += c; break;
            }
        }
        return out;
    }

    std::string render_text_svg(const text_layout& layout) {
        std::ostringstream out;
        out << "<svg width=\"" << layout.width << "\" height=\"" << layout.height
            << "\" xmlns=\"http://www.w3.org/2000/svg\">\n";
        for (const auto& el : layout.elements) {
            out << "  ";
            render_element(out, el);
            out << "\n";
        }
        out << "</svg>\n";
        return out.str();
    }

} // namespace menu_overlay
