/**
 * @file menu_parser.hh
 * @brief Plain text menu format.
 *
 * Menus are often supplied as a short text file:
 *
 * @code
 * Classics
 * Old Fashioned - $14 (bourbon, bitters, orange)
 * Manhattan - $15
 *
 * Bites
 * Fries $6
 * Olives - house marinated
 * @endcode
 *
 * A line that does not parse as an item starts a new section. A blank
 * line closes the current section once it holds items; a header followed
 * by a blank line keeps collecting the items below it. Items before any
 * header are grouped under a section named after the menu title.
 * Sections without items are dropped.
 *
 * Accepted item forms, tried in order:
 * - `Name - $Price` (hyphens or an em dash), optionally followed by `(description)`
 * - `Name $Price`
 * - `Name - Description`
 * - `Name (description)`
 *
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/layout/menu_content.hh>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace menu_overlay {
    /**
     * @brief Parse a single item line.
     *
     * @param line Trimmed line
     * @return The item, or std::nullopt if the line is not an item
     */
    MENU_OVERLAY_EXPORT std::optional<menu_item> parse_menu_item(std::string_view line);

    /**
     * @brief Parse a whole text menu.
     *
     * @param text File contents
     * @param title Menu title; also names the section of headerless items
     */
    MENU_OVERLAY_EXPORT menu_content parse_menu_text(std::string_view text, std::string title = "Menu");

    /**
     * @brief Read and parse a text menu file.
     *
     * @throws std::runtime_error if the file cannot be read
     */
    MENU_OVERLAY_EXPORT menu_content load_menu_file(const std::filesystem::path& path,
                                                    std::string title = "Menu");
} // namespace menu_overlay
