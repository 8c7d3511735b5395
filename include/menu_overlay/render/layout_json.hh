/**
 * @file layout_json.hh
 * @brief JSON hand-off of a layout to out-of-process exporters.
 *
 * The slide-deck exporter runs as a separate process and receives the
 * layout as JSON:
 *
 * @code{.json}
 * {
 *   "width": 1726,
 *   "height": 2626,
 *   "elements": [
 *     {
 *       "text": "Cocktail Menu",
 *       "x": 863, "y": 920,
 *       "fontSize": 117,
 *       "fontFamily": "Georgia",
 *       "fontWeight": "bold",
 *       "color": "#7213A5",
 *       "anchor": "middle",
 *       "maxWidth": 1500
 *     }
 *   ]
 * }
 * @endcode
 *
 * `maxWidth` is omitted for elements that never wrap.
 *
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/layout/text_layout.hh>
#include <filesystem>
#include <string>
#include <string_view>

namespace menu_overlay {
    /// Serialize with two-space indentation.
    MENU_OVERLAY_EXPORT std::string layout_to_json(const text_layout& layout);

    /**
     * @brief Parse a serialized layout.
     *
     * @throws std::runtime_error for malformed JSON or missing fields
     */
    MENU_OVERLAY_EXPORT text_layout layout_from_json(std::string_view json);

    /// @throws std::runtime_error if the file cannot be written
    MENU_OVERLAY_EXPORT void save_layout_json(const text_layout& layout, const std::filesystem::path& path);

    /// @throws std::runtime_error if the file cannot be read or parsed
    MENU_OVERLAY_EXPORT text_layout load_layout_json(const std::filesystem::path& path);
} // namespace menu_overlay
