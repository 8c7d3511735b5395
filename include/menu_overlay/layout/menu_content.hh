/**
 * @file menu_content.hh
 * @brief Menu content tree and brand style tokens.
 *
 * These are plain value types filled by the loaders (menu text parser,
 * YAML loaders) and read by the layout engine. The layout engine treats
 * every string here as opaque: font families and colors are passed
 * through to the text elements unchanged.
 *
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace menu_overlay {
    /**
     * @brief Single menu entry.
     */
    struct MENU_OVERLAY_EXPORT menu_item {
        std::string name;
        std::optional<std::string> price;       ///< Display string, e.g. "$14"
        std::optional<std::string> description;

        bool operator==(const menu_item&) const = default;
    };

    /**
     * @brief Titled group of items.
     */
    struct MENU_OVERLAY_EXPORT menu_section {
        std::string title;
        std::vector<menu_item> items;

        bool operator==(const menu_section&) const = default;
    };

    /**
     * @brief Complete menu.
     *
     * Tags and campaign are bookkeeping carried from content files; they
     * do not influence layout.
     */
    struct MENU_OVERLAY_EXPORT menu_content {
        std::string title;
        std::optional<std::string> subtitle;
        std::vector<menu_section> sections;
        std::optional<std::string> footer;
        std::vector<std::string> tags;
        std::optional<std::string> campaign;

        /// Number of items across all sections.
        [[nodiscard]] std::size_t item_count() const;

        /// Number of items that carry a non-empty description.
        [[nodiscard]] std::size_t described_item_count() const;
    };

    /// Color used for subtitles and item descriptions unless a brand sets one.
    inline constexpr const char* DEFAULT_DESCRIPTION_COLOR = "#555555";

    /**
     * @brief Brand typography and colors used by the layout engine.
     */
    struct MENU_OVERLAY_EXPORT style_tokens {
        std::string heading_font = "Georgia";
        std::string body_font = "Helvetica";
        std::string primary_color = "#000000";   ///< Title and section headers
        std::string dark_color = "#000000";      ///< Item names, prices, footer
        std::string description_color = DEFAULT_DESCRIPTION_COLOR;
    };
} // namespace menu_overlay
