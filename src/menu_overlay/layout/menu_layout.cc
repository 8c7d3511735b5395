//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/layout/menu_layout.hh>
#include <menu_overlay/text/wrap.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace menu_overlay {

    namespace {
        // Padding, in points
        constexpr double INNER_PADDING_PT = 12;      // column inset from the zone edges
        constexpr double TOP_PADDING_PT = 24;        // clears logo text bleeding below the zone top
        constexpr double PRICE_PADDING_PT = 7;       // keeps prices off the right edge
        constexpr double FOOTER_LINE_PT = 12;
        constexpr double BODY_FOOTER_GAP_PT = 8;

        // Fallback title zone when no clear zone is known
        constexpr double TITLE_ZONE_FRACTION = 0.30;

        // Share of the canvas width a comfortable text column spans
        constexpr double NOMINAL_COLUMN_FRACTION = 0.7;

        // Height estimate, in points
        constexpr double TITLE_BLOCK_PT = 44;
        constexpr double SUBTITLE_BLOCK_PT = 20;
        constexpr double ITEM_PT = 20;
        constexpr double DESCRIBED_ITEM_PT = 34;
        constexpr double DESCRIPTION_GAP_PT = 5;
        constexpr double SECTION_PT = 26;

        // Name column share when a price sits on the same line
        constexpr double NAME_COLUMN_FRACTION = 0.75;

        struct role_size {
            double base;
            double floor;
        };

        constexpr role_size TITLE{28, 20};
        constexpr role_size SUBTITLE{12, 9};
        constexpr role_size SECTION_HEADER{16, 12};
        constexpr role_size ITEM_NAME{11, 8};
        constexpr role_size ITEM_DESCRIPTION{9, 7};
        constexpr role_size FOOTER{8, 6};

        constexpr const char* PRICE_SEPARATOR = "  \xC2\xB7  ";  // two spaces, middle dot, two spaces

        int role_px(const role_size& role, double scale, int dpi) {
            return pt_to_px(std::max(role.floor, role.base * scale), dpi);
        }

        std::string ascii_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string ascii_upper(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        bool has_text(const std::optional<std::string>& s) {
            return s && !s->empty();
        }

        // Canvas-space bounds shared by every pass
        struct layout_frame {
            int dpi = 72;
            int content_left = 0;
            int content_right = 0;
            int content_width = 0;
            int center_x = 0;
            int price_padding = 0;
            int title_zone_top = 0;
            int footer_zone_top = 0;
            int body_bottom = 0;
        };

        layout_frame make_frame(const canvas_format& format, const std::optional<clear_zone>& zone) {
            layout_frame f;
            f.dpi = format.dpi;

            const int canvas_height = format.canvas_height();
            const int canvas_width = format.canvas_width();
            const int inner_padding = pt_to_px(INNER_PADDING_PT, f.dpi);
            const int top_padding = pt_to_px(TOP_PADDING_PT, f.dpi);

            if (zone) {
                f.content_left = zone->left + inner_padding;
                f.content_right = zone->right - inner_padding;
                f.title_zone_top = zone->top + top_padding;
            } else {
                f.content_left = format.bleed + format.safe_margin;
                f.content_right = canvas_width - format.bleed - format.safe_margin;
                f.title_zone_top = format.bleed + round_half_up(format.height * TITLE_ZONE_FRACTION);
            }
            f.content_width = f.content_right - f.content_left;
            f.center_x = round_half_up((f.content_left + f.content_right) / 2.0);
            f.price_padding = pt_to_px(PRICE_PADDING_PT, f.dpi);

            const int footer_zone_bottom = zone ? zone->bottom
                                                : canvas_height - format.bleed - format.safe_margin;
            f.footer_zone_top = footer_zone_bottom - pt_to_px(FOOTER_LINE_PT, f.dpi) * 2;
            f.body_bottom = f.footer_zone_top - pt_to_px(BODY_FOOTER_GAP_PT, f.dpi);
            return f;
        }

        struct resolved_style {
            std::string heading_font;
            std::string body_font;
            std::string heading_color;
            std::string dark_color;
            std::string description_color;
        };

        resolved_style resolve_style(const style_tokens& style, const layout_options& options) {
            resolved_style r;
            r.heading_font = options.heading_font.value_or(style.heading_font);
            r.body_font = options.body_font.value_or(style.body_font);
            r.heading_color = options.accent_color.value_or(style.primary_color);
            r.dark_color = style.dark_color;
            r.description_color = style.description_color;
            return r;
        }

        // Vertical space the content needs at unscaled sizes, in pixels
        int estimate_needed_height(const menu_content& content, int dpi) {
            const auto described = content.described_item_count();
            const double item_pt = described > 0 ? DESCRIBED_ITEM_PT : ITEM_PT;
            const double title_pt = TITLE_BLOCK_PT + (has_text(content.subtitle) ? SUBTITLE_BLOCK_PT : 0.0);

            return pt_to_px(title_pt +
                            static_cast<double>(content.item_count()) * item_pt +
                            static_cast<double>(described) * DESCRIPTION_GAP_PT +
                            static_cast<double>(content.sections.size()) * SECTION_PT,
                            dpi);
        }

        class layout_pass {
        public:
            layout_pass(const layout_frame& frame, const resolved_style& style, bool narrow)
                : m_frame(frame), m_style(style), m_narrow(narrow) {
            }

            // Lays out title, subtitle and sections; returns the final cursor
            int run(const menu_content& content, double scale, std::vector<text_element>& out) {
                m_out = &out;
                const int dpi = m_frame.dpi;

                m_title_size = role_px(TITLE, scale, dpi);
                m_subtitle_size = role_px(SUBTITLE, scale, dpi);
                m_section_size = role_px(SECTION_HEADER, scale, dpi);
                m_item_size = role_px(ITEM_NAME, scale, dpi);
                m_desc_size = role_px(ITEM_DESCRIPTION, scale, dpi);

                int y = m_frame.title_zone_top + m_title_size;
                emit(content.title, m_frame.center_x, y, m_title_size, m_style.heading_font,
                     font_weight::bold, m_style.heading_color, text_anchor::middle, m_frame.content_width);
                y += extra_lines(content.title, m_title_size, m_frame.content_width);

                if (has_text(content.subtitle)) {
                    y += round_half_up(m_subtitle_size * 1.4);
                    emit(*content.subtitle, m_frame.center_x, y, m_subtitle_size, m_style.body_font,
                         font_weight::normal, m_style.description_color, text_anchor::middle,
                         m_frame.content_width);
                }

                y += round_half_up(m_title_size * 0.4);

                const bool single_section_echoes_title =
                    content.sections.size() == 1 &&
                    ascii_lower(content.sections.front().title) == ascii_lower(content.title);

                for (const auto& section : content.sections) {
                    if (!single_section_echoes_title) {
                        y = section_header(section, y);
                    }
                    for (const auto& item : section.items) {
                        y = m_narrow ? narrow_item(item, y) : split_item(item, y);
                    }
                }
                return y;
            }

        private:
            void emit(std::string text, int x, int y, int size, const std::string& family,
                      font_weight weight, const std::string& color, text_anchor anchor,
                      std::optional<double> max_width) {
                text_element el;
                el.text = std::move(text);
                el.x = x;
                el.y = y;
                el.font_size = size;
                el.font_family = family;
                el.weight = weight;
                el.color = color;
                el.anchor = anchor;
                el.max_width = max_width;
                m_out->push_back(std::move(el));
            }

            // Extra cursor advance for text wrapping past its first line
            static int extra_lines(std::string_view text, int size, double max_width) {
                const int lines = estimate_lines(text, size, max_width);
                if (lines <= 1) {
                    return 0;
                }
                return round_half_up(size * LINE_HEIGHT_RATIO) * (lines - 1);
            }

            int section_header(const menu_section& section, int y) {
                y += round_half_up(m_section_size * 2.2);
                std::string header = ascii_upper(section.title);
                const int extra = extra_lines(header, m_section_size, m_frame.content_width);
                emit(std::move(header), m_frame.center_x, y, m_section_size, m_style.heading_font,
                     font_weight::bold, m_style.heading_color, text_anchor::middle, m_frame.content_width);
                y += extra;
                y += round_half_up(m_section_size * 0.6);
                return y;
            }

            // Name and price merged on one centered line
            int narrow_item(const menu_item& item, int y) {
                y += round_half_up(m_item_size * 1.8);

                std::string display = item.name;
                if (has_text(item.price)) {
                    display += PRICE_SEPARATOR;
                    display += *item.price;
                }
                const int extra = extra_lines(display, m_item_size, m_frame.content_width);
                emit(std::move(display), m_frame.center_x, y, m_item_size, m_style.body_font,
                     font_weight::bold, m_style.dark_color, text_anchor::middle, m_frame.content_width);
                y += extra;

                if (has_text(item.description)) {
                    y += round_half_up(m_desc_size * 1.5);
                    emit(*item.description, m_frame.center_x, y, m_desc_size, m_style.body_font,
                         font_weight::normal, m_style.description_color, text_anchor::middle,
                         m_frame.content_width);
                    y += extra_lines(*item.description, m_desc_size, m_frame.content_width);
                    y += round_half_up(m_desc_size * 0.5);
                }
                return y;
            }

            // Name on the left, price on the right
            int split_item(const menu_item& item, int y) {
                y += round_half_up(m_item_size * 1.8);

                const bool priced = has_text(item.price);
                const double name_width = priced ? m_frame.content_width * NAME_COLUMN_FRACTION
                                                 : static_cast<double>(m_frame.content_width);

                emit(item.name, m_frame.content_left, y, m_item_size, m_style.body_font,
                     font_weight::bold, m_style.dark_color, text_anchor::start, name_width);
                if (priced) {
                    emit(*item.price, m_frame.content_right - m_frame.price_padding, y, m_item_size,
                         m_style.body_font, font_weight::normal, m_style.dark_color, text_anchor::end,
                         std::nullopt);
                }
                y += extra_lines(item.name, m_item_size, name_width);

                if (has_text(item.description)) {
                    y += round_half_up(m_desc_size * 1.5);
                    emit(*item.description, m_frame.content_left, y, m_desc_size, m_style.body_font,
                         font_weight::normal, m_style.description_color, text_anchor::start,
                         m_frame.content_width);
                    y += round_half_up(m_desc_size * 0.5);
                }
                return y;
            }

            const layout_frame& m_frame;
            const resolved_style& m_style;
            bool m_narrow;
            std::vector<text_element>* m_out = nullptr;

            int m_title_size = 0;
            int m_subtitle_size = 0;
            int m_section_size = 0;
            int m_item_size = 0;
            int m_desc_size = 0;
        };
    } // anonymous namespace

    layout_result calculate_menu_layout_ex(const menu_content& content,
                                           const style_tokens& style,
                                           const canvas_format& format,
                                           const std::optional<clear_zone>& zone,
                                           const layout_options& options) {
        const layout_frame frame = make_frame(format, zone);
        const resolved_style resolved = resolve_style(style, options);

        const double canvas_width = format.canvas_width();
        const double nominal_width = canvas_width * NOMINAL_COLUMN_FRACTION;
        const double width_scale = frame.content_width < nominal_width
                                       ? std::sqrt(std::max(0, frame.content_width) / nominal_width)
                                       : 1.0;

        const int body_height = frame.body_bottom - frame.title_zone_top;
        const int needed = estimate_needed_height(content, frame.dpi);
        const double height_scale = std::min(1.0, static_cast<double>(body_height) / needed);

        double scale = std::min(height_scale, width_scale);
        const bool narrow = width_scale < 1.0;

        layout_result result;
        result.layout.width = format.canvas_width();
        result.layout.height = format.canvas_height();
        result.body_bottom = frame.body_bottom;

        layout_pass pass(frame, resolved, narrow);
        std::vector<text_element> elements;
        int cursor = 0;

        for (int attempt = 1; attempt <= MAX_LAYOUT_ATTEMPTS; ++attempt) {
            elements.clear();
            cursor = pass.run(content, scale, elements);
            result.attempts = attempt;

            if (cursor <= frame.body_bottom || cursor <= 0 || attempt == MAX_LAYOUT_ATTEMPTS) {
                break;
            }
            spdlog::debug("menu layout: pass {} ends at y={} below body bottom {}, shrinking scale {:.3f}",
                          attempt, cursor, frame.body_bottom, scale);
            scale *= static_cast<double>(frame.body_bottom) / cursor;
        }

        result.scale = scale;
        result.cursor = cursor;
        result.overflow = cursor > frame.body_bottom;
        if (result.overflow) {
            spdlog::warn("menu layout: \"{}\" still overflows by {}px after {} passes",
                         content.title, cursor - frame.body_bottom, result.attempts);
        }

        if (has_text(content.footer)) {
            const int footer_size = role_px(FOOTER, scale, frame.dpi);
            text_element el;
            el.text = *content.footer;
            el.x = frame.center_x;
            el.y = frame.footer_zone_top + footer_size;
            el.font_size = footer_size;
            el.font_family = resolved.body_font;
            el.weight = font_weight::normal;
            el.color = resolved.dark_color;
            el.anchor = text_anchor::middle;
            el.max_width = frame.content_width;
            elements.push_back(std::move(el));
        }

        result.layout.elements = std::move(elements);
        return result;
    }

    text_layout calculate_menu_layout(const menu_content& content,
                                      const style_tokens& style,
                                      const canvas_format& format,
                                      const std::optional<clear_zone>& zone,
                                      const layout_options& options) {
        return calculate_menu_layout_ex(content, style, format, zone, options).layout;
    }

} // namespace menu_overlay
