//
// Created by igor on 15/10/2026.
//

#include <menu_overlay/render/layout_json.hh>
#include <menu_overlay/geometry.hh>
#include <failsafe/failsafe.hh>
#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace menu_overlay {

    namespace {
        Json::Value element_to_json(const text_element& el) {
            Json::Value v(Json::objectValue);
            v["text"] = el.text;
            v["x"] = el.x;
            v["y"] = el.y;
            v["fontSize"] = el.font_size;
            v["fontFamily"] = el.font_family;
            v["fontWeight"] = std::string(weight_name(el.weight));
            v["color"] = el.color;
            v["anchor"] = std::string(anchor_name(el.anchor));
            if (el.max_width) {
                v["maxWidth"] = *el.max_width;
            }
            return v;
        }

        const Json::Value& member(const Json::Value& obj, const char* key, const std::string& where) {
            const Json::Value* v = obj.find(key, key + std::char_traits<char>::length(key));
            THROW_IF(v == nullptr || v->isNull(), std::runtime_error, "Layout JSON:", where + "." + key, "is missing");
            return *v;
        }

        int int_member(const Json::Value& obj, const char* key, const std::string& where) {
            const Json::Value& v = member(obj, key, where);
            THROW_IF(!v.isNumeric(), std::runtime_error, "Layout JSON:", where + "." + key, "must be a number");
            return round_half_up(v.asDouble());
        }

        std::string string_member(const Json::Value& obj, const char* key, const std::string& where) {
            const Json::Value& v = member(obj, key, where);
            THROW_IF(!v.isString(), std::runtime_error, "Layout JSON:", where + "." + key, "must be a string");
            return v.asString();
        }

        text_element element_from_json(const Json::Value& v, const std::string& where) {
            THROW_IF(!v.isObject(), std::runtime_error, "Layout JSON:", where, "must be an object");

            text_element el;
            el.text = string_member(v, "text", where);
            el.x = int_member(v, "x", where);
            el.y = int_member(v, "y", where);
            el.font_size = int_member(v, "fontSize", where);
            el.font_family = string_member(v, "fontFamily", where);
            el.color = string_member(v, "color", where);
            try {
                el.weight = parse_weight(string_member(v, "fontWeight", where));
                el.anchor = parse_anchor(string_member(v, "anchor", where));
            } catch (const std::invalid_argument& e) {
                THROW_RUNTIME("Layout JSON:", where, e.what());
            }

            if (v.isMember("maxWidth") && !v["maxWidth"].isNull()) {
                THROW_IF(!v["maxWidth"].isNumeric(), std::runtime_error,
                         "Layout JSON:", where + ".maxWidth", "must be a number");
                el.max_width = v["maxWidth"].asDouble();
            }
            return el;
        }
    } // anonymous namespace

    std::string layout_to_json(const text_layout& layout) {
        Json::Value root(Json::objectValue);
        root["width"] = layout.width;
        root["height"] = layout.height;

        Json::Value elements(Json::arrayValue);
        for (const auto& el : layout.elements) {
            elements.append(element_to_json(el));
        }
        root["elements"] = elements;

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, root);
    }

    text_layout layout_from_json(std::string_view json) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        const bool ok = reader->parse(json.data(), json.data() + json.size(), &root, &errors);
        THROW_IF(!ok, std::runtime_error, "Layout JSON is malformed:", errors);
        THROW_IF(!root.isObject(), std::runtime_error, "Layout JSON must be an object");

        text_layout layout;
        layout.width = int_member(root, "width", "layout");
        layout.height = int_member(root, "height", "layout");

        const Json::Value& elements = member(root, "elements", "layout");
        THROW_IF(!elements.isArray(), std::runtime_error, "Layout JSON: layout.elements must be an array");
        for (Json::ArrayIndex i = 0; i < elements.size(); ++i) {
            layout.elements.push_back(element_from_json(elements[i], "layout.elements[" + std::to_string(i) + "]"));
        }
        return layout;
    }

    void save_layout_json(const text_layout& layout, const std::filesystem::path& path) {
        std::ofstream file(path);
        THROW_IF(!file, std::runtime_error, "Cannot create file:", path.string());
        file << layout_to_json(layout) << '\n';
        THROW_IF(!file, std::runtime_error, "Failed to write file:", path.string());
    }

    text_layout load_layout_json(const std::filesystem::path& path) {
        std::ifstream file(path);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());
        std::ostringstream ss;
        ss << file.rdbuf();
        return layout_from_json(ss.str());
    }

} // namespace menu_overlay
