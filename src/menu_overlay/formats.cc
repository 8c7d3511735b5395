//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/formats.hh>
#include <menu_overlay/geometry.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace menu_overlay {

    namespace {
        canvas_format social(std::string name, std::string label, int w, int h, std::string aspect) {
            canvas_format f;
            f.name = std::move(name);
            f.label = std::move(label);
            f.width = w;
            f.height = h;
            f.aspect_ratio = std::move(aspect);
            f.dpi = 72;
            f.category = format_category::social;
            return f;
        }

        canvas_format print(std::string name, std::string label, int w, int h, std::string aspect) {
            canvas_format f;
            f.name = std::move(name);
            f.label = std::move(label);
            f.width = w;
            f.height = h;
            f.aspect_ratio = std::move(aspect);
            f.dpi = 300;
            f.category = format_category::print;
            f.bleed = PRINT_BLEED;
            f.safe_margin = PRINT_SAFE_MARGIN;
            return f;
        }

        struct registry_entry {
            std::string alias;
            canvas_format format;
        };

        // Social formats first, then print; order is the listing order
        const std::vector<registry_entry>& registry() {
            static const std::vector<registry_entry> entries = {
                {"instagram", social("INSTAGRAM_SQUARE", "Instagram Square", 1080, 1080, "1:1")},
                {"story", social("STORY", "Story (IG/FB)", 1080, 1920, "9:16")},
                {"facebook", social("FACEBOOK", "Facebook Post", 1200, 630, "16:9")},
                {"twitter", social("TWITTER", "Twitter/X Post", 1200, 675, "16:9")},
                {"letter-portrait", print("LETTER_PORTRAIT", "Letter Portrait (8.5x11)", 2550, 3300, "17:22")},
                {"letter-landscape", print("LETTER_LANDSCAPE", "Letter Landscape (11x8.5)", 3300, 2550, "22:17")},
                {"half-letter", print("HALF_LETTER", "Half Letter (5.5x8.5)", 1650, 2550, "11:17")},
                {"legal", print("LEGAL", "Legal (8.5x14)", 2550, 4200, "17:28")},
                {"a4", print("A4", "A4 (210x297mm)", 2480, 3508, "210:297")},
            };
            return entries;
        }

        std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string join_names() {
            std::string out;
            for (const auto& e : registry()) {
                if (!out.empty()) out += ", ";
                out += e.alias;
            }
            return out;
        }
    } // anonymous namespace

    const canvas_format& resolve_format(std::string_view name) {
        const std::string key = to_lower(name);
        const auto& entries = registry();
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&key](const registry_entry& e) { return e.alias == key; });
        THROW_IF(it == entries.end(), std::invalid_argument,
                 "Unknown format \"", std::string(name), "\". Available formats:", join_names());
        return it->format;
    }

    std::vector<canvas_format> resolve_formats(const std::vector<std::string>& names) {
        std::vector<canvas_format> out;
        out.reserve(names.size());
        for (const auto& n : names) {
            out.push_back(resolve_format(n));
        }
        return out;
    }

    std::vector<std::string> format_names() {
        std::vector<std::string> out;
        for (const auto& e : registry()) {
            out.push_back(e.alias);
        }
        return out;
    }

    canvas_format custom_print_format(std::string label, double width_inches, double height_inches) {
        THROW_IF(width_inches <= 0 || height_inches <= 0, std::invalid_argument,
                 "Custom format dimensions must be positive:", width_inches, "x", height_inches);

        std::ostringstream aspect;
        aspect << width_inches << ":" << height_inches;

        canvas_format f = print("CUSTOM", std::move(label),
                                round_half_up(width_inches * 300.0),
                                round_half_up(height_inches * 300.0),
                                aspect.str());
        return f;
    }

} // namespace menu_overlay
