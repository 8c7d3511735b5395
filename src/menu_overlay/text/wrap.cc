//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/text/wrap.hh>
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

namespace menu_overlay {

    namespace {
        // Check if byte is a UTF-8 continuation byte (10xxxxxx)
        constexpr bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }

        bool is_space(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        std::vector<std::string_view> split_words(std::string_view text) {
            std::vector<std::string_view> words;
            std::size_t pos = 0;
            while (pos < text.size()) {
                while (pos < text.size() && is_space(text[pos])) ++pos;
                const std::size_t start = pos;
                while (pos < text.size() && !is_space(text[pos])) ++pos;
                if (pos > start) {
                    words.push_back(text.substr(start, pos - start));
                }
            }
            return words;
        }

        long max_chars_for(double font_size, double max_width) {
            const double char_width = font_size * CHAR_WIDTH_RATIO;
            if (char_width <= 0.0) {
                return 0;
            }
            // Also rejects NaN; infinite widths saturate
            const double chars = std::floor(max_width / char_width);
            if (!(chars > 0.0)) {
                return 0;
            }
            constexpr auto limit = static_cast<double>(std::numeric_limits<int>::max());
            return chars >= limit ? std::numeric_limits<int>::max() : static_cast<long>(chars);
        }
    } // anonymous namespace

    std::size_t text_length(std::string_view text) {
        std::size_t n = 0;
        for (char c : text) {
            if (!is_continuation(static_cast<unsigned char>(c))) ++n;
        }
        return n;
    }

    bool needs_wrapping(std::string_view text, double font_size, double max_width) {
        return static_cast<double>(text_length(text)) * font_size * CHAR_WIDTH_RATIO > max_width;
    }

    std::vector<std::string> wrap_text(std::string_view text, double font_size, double max_width) {
        const long max_chars = max_chars_for(font_size, max_width);

        std::vector<std::string> lines;
        std::string current;
        std::size_t current_len = 0;

        for (std::string_view word : split_words(text)) {
            const std::size_t word_len = text_length(word);
            if (current.empty()) {
                current.assign(word);
                current_len = word_len;
                continue;
            }
            if (static_cast<long>(current_len + 1 + word_len) > max_chars) {
                lines.push_back(std::move(current));
                current.assign(word);
                current_len = word_len;
            } else {
                current += ' ';
                current.append(word);
                current_len += 1 + word_len;
            }
        }
        if (!current.empty()) {
            lines.push_back(std::move(current));
        }
        return lines;
    }

    int estimate_lines(std::string_view text, double font_size, double max_width) {
        const long max_chars = max_chars_for(font_size, max_width);
        if (max_chars <= 0) {
            return 1;
        }
        const auto len = static_cast<long>(text_length(text));
        return static_cast<int>((len + max_chars - 1) / max_chars);
    }

} // namespace menu_overlay
