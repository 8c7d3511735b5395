/**
 * @file yaml_loader.hh
 * @brief YAML sources for menu content, brand style and detector tuning.
 *
 * @section yaml_menu Menu content
 *
 * @code{.yaml}
 * title: Cocktail Menu
 * subtitle: Spring 2026
 * footer: Prices subject to change
 * tags: [spring, bar]
 * campaign: spring-launch
 * sections:
 *   - title: Classics
 *     items:
 *       - name: Old Fashioned
 *         price: "$14"
 *         description: bourbon, bitters, orange
 * @endcode
 *
 * A title and at least one section with at least one named item are
 * required.
 *
 * @section yaml_brand Brand style
 *
 * Only the keys the layout engine consumes are read; other brand
 * settings in the same file are ignored.
 *
 * @code{.yaml}
 * colors:
 *   primary: "#7213A5"
 *   dark: "#1A1A1A"
 *   description: "#555555"   # optional
 * typography:
 *   heading: Playfair Display
 *   body: Baskerville
 * @endcode
 *
 * @section yaml_detector Detector tuning
 *
 * Every key of detector_config may be set; missing keys keep their
 * defaults.
 *
 * @code{.yaml}
 * band_height: 50
 * busyness_threshold: 40
 * margin_threshold: 75
 * @endcode
 *
 * All functions throw std::runtime_error describing the first problem
 * found (unreadable file, malformed YAML, missing or empty field).
 *
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <menu_overlay/export.h>
#include <menu_overlay/layout/menu_content.hh>
#include <menu_overlay/image/clear_zone.hh>
#include <filesystem>
#include <string_view>

namespace menu_overlay {
    MENU_OVERLAY_EXPORT menu_content parse_menu_yaml(std::string_view yaml);
    MENU_OVERLAY_EXPORT menu_content load_menu_yaml(const std::filesystem::path& path);

    MENU_OVERLAY_EXPORT style_tokens parse_brand_style(std::string_view yaml);
    MENU_OVERLAY_EXPORT style_tokens load_brand_style(const std::filesystem::path& path);

    MENU_OVERLAY_EXPORT detector_config parse_detector_config(std::string_view yaml);
    MENU_OVERLAY_EXPORT detector_config load_detector_config(const std::filesystem::path& path);
} // namespace menu_overlay
