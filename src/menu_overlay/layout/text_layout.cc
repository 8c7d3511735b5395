//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/layout/text_layout.hh>
#include <menu_overlay/text/wrap.hh>
#include <menu_overlay/geometry.hh>
#include <failsafe/failsafe.hh>

namespace menu_overlay {

std::string_view anchor_name(text_anchor anchor) {
    switch (anchor) {
        case text_anchor::start: return "start";
        case text_anchor::middle: return "middle";
        case text_anchor::end: return "end";
    }
    return "start";
}

std::string_view weight_name(font_weight weight) {
    return weight == font_weight::bold ? "bold" : "normal";
}

text_anchor parse_anchor(std::string_view name) {
    if (name == "start") return text_anchor::start;
    if (name == "middle") return text_anchor::middle;
    if (name == "end") return text_anchor::end;
    THROW_INVALID_ARG("Unknown text anchor:", std::string(name));
}

font_weight parse_weight(std::string_view name) {
    if (name == "normal") return font_weight::normal;
    if (name == "bold") return font_weight::bold;
    THROW_INVALID_ARG("Unknown font weight:", std::string(name));
}

bool element_wraps(const text_element& element) {
    return element.max_width && *element.max_width > 0 &&
           needs_wrapping(element.text, element.font_size, *element.max_width);
}

std::vector<std::string> element_lines(const text_element& element) {
    if (element_wraps(element)) {
        return wrap_text(element.text, element.font_size, *element.max_width);
    }
    return {element.text};
}

int element_line_height(const text_element& element) {
    return round_half_up(element.font_size * LINE_HEIGHT_RATIO);
}

} // namespace menu_overlay
