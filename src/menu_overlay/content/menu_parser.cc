//
// Created by igor on 15/10/2026.
//

#include <menu_overlay/content/menu_parser.hh>
#include <failsafe/failsafe.hh>
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace menu_overlay {

    namespace {
        // Hyphen or em dash (U+2014), one or more
        const std::string DASH = "(?:-|\xE2\x80\x94)+";

        re2::RE2::Options quiet_options() {
            re2::RE2::Options options;
            options.set_log_errors(false);
            return options;
        }

        const re2::RE2& dash_price_pattern() {
            static const re2::RE2 re(R"((.+?)\s*)" + DASH + R"(\s*(\$[0-9.]+)\s*(?:\((.+?)\))?\s*)", quiet_options());
            return re;
        }

        const re2::RE2& space_price_pattern() {
            static const re2::RE2 re(R"((.+?)\s+(\$[0-9.]+)\s*)", quiet_options());
            return re;
        }

        const re2::RE2& dash_description_pattern() {
            static const re2::RE2 re(R"((.+?)\s*)" + DASH + R"(\s+(.+))", quiet_options());
            return re;
        }

        const re2::RE2& paren_description_pattern() {
            static const re2::RE2 re(R"((.+?)\s+\(([^)]+)\)\s*)", quiet_options());
            return re;
        }

        std::string trim(std::string_view s) {
            constexpr std::string_view ws = " \t\r\n\f\v";
            const auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) {
                return {};
            }
            const auto last = s.find_last_not_of(ws);
            return std::string(s.substr(first, last - first + 1));
        }

        std::optional<std::string> non_empty(std::string s) {
            if (s.empty()) {
                return std::nullopt;
            }
            return s;
        }

        void push_section(std::optional<menu_section>& current, menu_content& out) {
            if (current && !current->items.empty()) {
                out.sections.push_back(std::move(*current));
            }
            current.reset();
        }
    } // anonymous namespace

    std::optional<menu_item> parse_menu_item(std::string_view line) {
        const re2::StringPiece input(line.data(), line.size());
        std::string name;
        std::string price;
        std::string description;

        if (re2::RE2::FullMatch(input, dash_price_pattern(), &name, &price, &description) ||
            re2::RE2::FullMatch(input, space_price_pattern(), &name, &price)) {
            menu_item item;
            item.name = trim(name);
            item.price = price;
            item.description = non_empty(trim(description));
            return item;
        }

        if (re2::RE2::FullMatch(input, dash_description_pattern(), &name, &description) ||
            re2::RE2::FullMatch(input, paren_description_pattern(), &name, &description)) {
            menu_item item;
            item.name = trim(name);
            item.description = non_empty(trim(description));
            return item;
        }

        return std::nullopt;
    }

    menu_content parse_menu_text(std::string_view text, std::string title) {
        menu_content out;
        out.title = std::move(title);

        std::vector<std::string> lines;
        {
            std::istringstream in{std::string(text)};
            std::string raw;
            while (std::getline(in, raw)) {
                lines.push_back(trim(raw));
            }
        }

        std::optional<menu_section> current;
        for (const auto& line : lines) {
            // A blank line ends a section only once it has items
            if (line.empty()) {
                if (current && !current->items.empty()) {
                    push_section(current, out);
                }
                continue;
            }

            auto item = parse_menu_item(line);

            if (!current) {
                current.emplace();
                if (item) {
                    current->title = out.title;
                    current->items.push_back(std::move(*item));
                } else {
                    current->title = line;
                }
                continue;
            }

            if (item) {
                current->items.push_back(std::move(*item));
            } else {
                push_section(current, out);
                current.emplace();
                current->title = line;
            }
        }
        push_section(current, out);

        spdlog::debug("menu text: \"{}\" parsed into {} sections, {} items",
                      out.title, out.sections.size(), out.item_count());
        return out;
    }

    menu_content load_menu_file(const std::filesystem::path& path, std::string title) {
        std::ifstream file(path);
        THROW_IF(!file, std::runtime_error, "Menu file not found:", path.string());

        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_menu_text(ss.str(), std::move(title));
    }

} // namespace menu_overlay
