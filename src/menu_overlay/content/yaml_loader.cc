//
// Created by igor on 15/10/2026.
//

#include <menu_overlay/content/yaml_loader.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>

namespace menu_overlay {

    namespace {
        YAML::Node parse_document(std::string_view yaml, std::string_view what) {
            try {
                return YAML::Load(std::string(yaml));
            } catch (const YAML::Exception& e) {
                THROW_RUNTIME("Malformed", std::string(what), "YAML:", e.what());
            }
        }

        std::string read_text(const std::filesystem::path& path, std::string_view what) {
            std::ifstream file(path);
            THROW_IF(!file, std::runtime_error, std::string(what), "file not found:", path.string());
            std::ostringstream ss;
            ss << file.rdbuf();
            return ss.str();
        }

        std::optional<std::string> optional_string(const YAML::Node& node, const char* key,
                                                   const std::string& where) {
            const YAML::Node value = node[key];
            if (!value || value.IsNull()) {
                return std::nullopt;
            }
            THROW_IF(!value.IsScalar(), std::runtime_error, where + "." + key, "must be a string");
            return value.as<std::string>();
        }

        std::string required_string(const YAML::Node& node, const char* key, const std::string& where) {
            auto value = optional_string(node, key, where);
            THROW_IF(!value || value->empty(), std::runtime_error, where + "." + key, "is required");
            return *value;
        }

        menu_item parse_item(const YAML::Node& node, const std::string& where) {
            THROW_IF(!node.IsMap(), std::runtime_error, where, "must be a mapping");
            menu_item item;
            item.name = required_string(node, "name", where);
            item.price = optional_string(node, "price", where);
            item.description = optional_string(node, "description", where);
            return item;
        }

        menu_section parse_section(const YAML::Node& node, const std::string& where) {
            THROW_IF(!node.IsMap(), std::runtime_error, where, "must be a mapping");
            menu_section section;
            section.title = required_string(node, "title", where);

            const YAML::Node items = node["items"];
            THROW_IF(!items || !items.IsSequence() || items.size() == 0, std::runtime_error,
                     where + ".items", "must list at least one item");
            for (std::size_t i = 0; i < items.size(); ++i) {
                section.items.push_back(parse_item(items[i], where + ".items[" + std::to_string(i) + "]"));
            }
            return section;
        }

        template<typename T>
        void read_number(const YAML::Node& root, const char* key, T& out) {
            const YAML::Node value = root[key];
            if (!value || value.IsNull()) {
                return;
            }
            try {
                out = value.as<T>();
            } catch (const YAML::Exception& e) {
                THROW_RUNTIME("Detector setting", key, "is not a number:", e.what());
            }
        }
    } // anonymous namespace

    menu_content parse_menu_yaml(std::string_view yaml) {
        const YAML::Node root = parse_document(yaml, "menu");
        THROW_IF(!root.IsMap(), std::runtime_error, "Menu content must be a mapping");

        menu_content content;
        content.title = required_string(root, "title", "menu");
        content.subtitle = optional_string(root, "subtitle", "menu");
        content.footer = optional_string(root, "footer", "menu");
        content.campaign = optional_string(root, "campaign", "menu");

        if (const YAML::Node tags = root["tags"]; tags && tags.IsSequence()) {
            for (const auto& t : tags) {
                content.tags.push_back(t.as<std::string>());
            }
        }

        const YAML::Node sections = root["sections"];
        THROW_IF(!sections || !sections.IsSequence() || sections.size() == 0, std::runtime_error,
                 "menu.sections must list at least one section");
        for (std::size_t i = 0; i < sections.size(); ++i) {
            content.sections.push_back(parse_section(sections[i], "menu.sections[" + std::to_string(i) + "]"));
        }

        spdlog::debug("menu yaml: \"{}\" with {} sections", content.title, content.sections.size());
        return content;
    }

    menu_content load_menu_yaml(const std::filesystem::path& path) {
        return parse_menu_yaml(read_text(path, "Menu"));
    }

    style_tokens parse_brand_style(std::string_view yaml) {
        const YAML::Node root = parse_document(yaml, "brand");
        THROW_IF(!root.IsMap(), std::runtime_error, "Brand profile must be a mapping");

        const YAML::Node colors = root["colors"];
        const YAML::Node typography = root["typography"];
        THROW_IF(!colors || !colors.IsMap(), std::runtime_error, "brand.colors is required");
        THROW_IF(!typography || !typography.IsMap(), std::runtime_error, "brand.typography is required");

        style_tokens style;
        style.primary_color = required_string(colors, "primary", "brand.colors");
        style.dark_color = required_string(colors, "dark", "brand.colors");
        style.description_color = optional_string(colors, "description", "brand.colors")
                                      .value_or(DEFAULT_DESCRIPTION_COLOR);
        style.heading_font = required_string(typography, "heading", "brand.typography");
        style.body_font = required_string(typography, "body", "brand.typography");
        return style;
    }

    style_tokens load_brand_style(const std::filesystem::path& path) {
        return parse_brand_style(read_text(path, "Brand profile"));
    }

    detector_config parse_detector_config(std::string_view yaml) {
        detector_config config;
        const YAML::Node root = parse_document(yaml, "detector");
        if (!root || root.IsNull()) {
            return config;
        }
        THROW_IF(!root.IsMap(), std::runtime_error, "Detector settings must be a mapping");

        read_number(root, "band_height", config.band_height);
        read_number(root, "busyness_threshold", config.busyness_threshold);
        read_number(root, "min_clear_height", config.min_clear_height);
        read_number(root, "sample_step", config.sample_step);
        read_number(root, "column_step", config.column_step);
        read_number(root, "margin_threshold", config.margin_threshold);
        read_number(root, "fallback_top", config.fallback_top);
        read_number(root, "fallback_bottom", config.fallback_bottom);

        THROW_IF(config.band_height <= 0 || config.sample_step <= 0 || config.column_step <= 0,
                 std::runtime_error, "Detector strides must be positive");
        THROW_IF(!(config.fallback_top >= 0 && config.fallback_top < config.fallback_bottom &&
                   config.fallback_bottom <= 1.0),
                 std::runtime_error, "Detector fallback fractions must satisfy 0 <= top < bottom <= 1");
        return config;
    }

    detector_config load_detector_config(const std::filesystem::path& path) {
        return parse_detector_config(read_text(path, "Detector settings"));
    }

} // namespace menu_overlay
