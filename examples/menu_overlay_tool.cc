//
// Created by igor on 16/10/2026.
//
// Command line front end for menu_overlay
//
// Commands:
//   measure <background.png> [--format name] [--config detector.yaml] [--annotate out.png]
//       Print the clear zone of a background. With --format the background
//       is first fitted to that canvas. --annotate writes a copy of the
//       measured image with the zone outlined.
//
//   layout <background.png|--no-zone> <menu.txt|menu.yaml> [options]
//       Print the computed text elements.
//
//   render <background.png|--no-zone> <menu.txt|menu.yaml> [options]
//          [--svg out.svg] [--json out.json] [--background out.png]
//       Write the layout as an SVG overlay and/or JSON hand-off.
//       --background writes the background fitted to the canvas.
//
// Layout options:
//   --format <name>        Canvas format (default: half-letter)
//   --brand <brand.yaml>   Brand colors and typography
//   --title <text>         Title for .txt menus (default: Menu)
//   --accent-color <hex>   Override heading color
//   --heading-font <name>  Override heading family
//   --body-font <name>     Override body family
//   --config <yaml>        Detector configuration
//   --verbose              Debug logging
//

#include <menu_overlay/formats.hh>
#include <menu_overlay/image/pixel_buffer.hh>
#include <menu_overlay/image/clear_zone.hh>
#include <menu_overlay/image/canvas_fit.hh>
#include <menu_overlay/content/menu_parser.hh>
#include <menu_overlay/content/yaml_loader.hh>
#include <menu_overlay/layout/menu_layout.hh>
#include <menu_overlay/render/svg_renderer.hh>
#include <menu_overlay/render/layout_json.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace menu_overlay;

namespace {
    void print_usage(const char* prog) {
        std::cerr << "Usage:\n"
                  << "  " << prog << " measure <background.png> [--format name] [--config detector.yaml]"
                  << " [--annotate out.png]\n"
                  << "  " << prog << " layout <background.png|--no-zone> <menu.txt|menu.yaml> [options]\n"
                  << "  " << prog << " render <background.png|--no-zone> <menu.txt|menu.yaml> [options]"
                  << " [--svg out.svg] [--json out.json] [--background out.png]\n"
                  << "Options:\n"
                  << "  --format <name>        Canvas format (default: half-letter)\n"
                  << "  --brand <brand.yaml>   Brand colors and typography\n"
                  << "  --title <text>         Title for .txt menus\n"
                  << "  --accent-color <hex>   Override heading color\n"
                  << "  --heading-font <name>  Override heading family\n"
                  << "  --body-font <name>     Override body family\n"
                  << "  --config <yaml>        Detector configuration\n"
                  << "  --verbose              Debug logging\n"
                  << "Formats:";
        for (const auto& name : format_names()) {
            std::cerr << ' ' << name;
        }
        std::cerr << '\n';
    }

    // Positional arguments plus --key value pairs; --verbose and --no-zone are flags
    struct command_line {
        std::vector<std::string> positional;
        std::map<std::string, std::string> options;
        bool verbose = false;
        bool no_zone = false;

        [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
            auto it = options.find(key);
            if (it == options.end()) return std::nullopt;
            return it->second;
        }
    };

    bool parse_command_line(int argc, char* argv[], command_line& out) {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--verbose") {
                out.verbose = true;
            } else if (arg == "--no-zone") {
                out.no_zone = true;
            } else if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for " << arg << '\n';
                    return false;
                }
                out.options[arg.substr(2)] = argv[++i];
            } else {
                out.positional.push_back(arg);
            }
        }
        return true;
    }

    bool has_extension(const std::string& path, const char* ext) {
        auto dot = path.rfind('.');
        if (dot == std::string::npos) return false;
        std::string e = path.substr(dot + 1);
        for (char& c : e) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return e == ext;
    }

    detector_config load_config(const command_line& cmd) {
        if (auto path = cmd.get("config")) {
            return load_detector_config(*path);
        }
        return {};
    }

    // Outline the zone in red, 3 pixels wide
    void annotate_zone(pixel_buffer& image, const clear_zone& zone) {
        constexpr int thickness = 3;
        auto paint = [&](int x, int y) {
            if (x < 0 || y < 0 || x >= image.width || y >= image.height) return;
            uint8_t* p = image.pixel(x, y);
            p[0] = 255;
            p[1] = 0;
            p[2] = 0;
        };
        for (int t = 0; t < thickness; t++) {
            for (int x = zone.left; x < zone.right; x++) {
                paint(x, zone.top + t);
                paint(x, zone.bottom - 1 - t);
            }
            for (int y = zone.top; y < zone.bottom; y++) {
                paint(zone.left + t, y);
                paint(zone.right - 1 - t, y);
            }
        }
    }

    int run_measure(const command_line& cmd) {
        if (cmd.positional.empty()) {
            std::cerr << "measure: background image required\n";
            return 1;
        }

        auto image = load_png(cmd.positional[0]);
        std::cout << "Image: " << image.width << "x" << image.height << '\n';
        if (auto name = cmd.get("format")) {
            image = prepare_background(image, resolve_format(*name));
            std::cout << "Fitted to " << *name << ": " << image.width << "x" << image.height << '\n';
        }
        auto zone = measure_clear_zone(image, load_config(cmd));

        std::cout << "Clear zone: top=" << zone.top << " bottom=" << zone.bottom
                  << " left=" << zone.left << " right=" << zone.right
                  << " (" << zone.width() << "x" << zone.height() << ")\n";

        if (auto out = cmd.get("annotate")) {
            annotate_zone(image, zone);
            save_png(image, *out);
            std::cout << "Wrote " << *out << '\n';
        }
        return 0;
    }

    struct layout_run {
        layout_result result;
        std::optional<pixel_buffer> background; ///< Canvas-sized background, unless --no-zone
    };

    layout_run compute_layout(const command_line& cmd) {
        const std::size_t menu_index = cmd.no_zone ? 0 : 1;
        if (cmd.positional.size() <= menu_index) {
            THROW_INVALID_ARG("Menu file required");
        }

        const auto& format = resolve_format(cmd.get("format").value_or("half-letter"));

        layout_run run;
        std::optional<clear_zone> zone;
        if (!cmd.no_zone) {
            // Zone coordinates must be canvas pixels, so measure the fitted background
            run.background = prepare_background(load_png(cmd.positional[0]), format);
            zone = measure_clear_zone(*run.background, load_config(cmd));
        }

        const std::string& menu_path = cmd.positional[menu_index];
        menu_content content = (has_extension(menu_path, "yaml") || has_extension(menu_path, "yml"))
                                   ? load_menu_yaml(menu_path)
                                   : load_menu_file(menu_path, cmd.get("title").value_or("Menu"));

        style_tokens style;
        if (auto brand = cmd.get("brand")) {
            style = load_brand_style(*brand);
        }

        layout_options options;
        options.accent_color = cmd.get("accent-color");
        options.heading_font = cmd.get("heading-font");
        options.body_font = cmd.get("body-font");

        run.result = calculate_menu_layout_ex(content, style, format, zone, options);
        return run;
    }

    void print_layout(const layout_result& result) {
        const auto& layout = result.layout;
        std::cout << "Canvas: " << layout.width << "x" << layout.height
                  << "  passes=" << result.attempts << " scale=" << result.scale
                  << (result.overflow ? "  OVERFLOW" : "") << '\n';
        for (const auto& el : layout.elements) {
            std::cout << "  [" << anchor_name(el.anchor) << "] "
                      << "(" << el.x << ", " << el.y << ") "
                      << el.font_size << "px " << el.font_family << " " << weight_name(el.weight)
                      << " " << el.color;
            if (el.max_width) {
                std::cout << " max=" << *el.max_width;
            }
            std::cout << "  \"" << el.text << "\"\n";
        }
    }

    int run_layout(const command_line& cmd) {
        print_layout(compute_layout(cmd).result);
        return 0;
    }

    int run_render(const command_line& cmd) {
        auto svg_path = cmd.get("svg");
        auto json_path = cmd.get("json");
        auto background_path = cmd.get("background");
        if (!svg_path && !json_path && !background_path) {
            std::cerr << "render: at least one of --svg, --json or --background is required\n";
            return 1;
        }

        auto run = compute_layout(cmd);
        const auto& result = run.result;
        if (svg_path) {
            std::ofstream f(*svg_path);
            if (!f) {
                std::cerr << "Failed to create output file: " << *svg_path << '\n';
                return 1;
            }
            f << render_text_svg(result.layout);
            std::cout << "Wrote " << *svg_path << '\n';
        }
        if (json_path) {
            save_layout_json(result.layout, *json_path);
            std::cout << "Wrote " << *json_path << '\n';
        }
        if (background_path) {
            if (!run.background) {
                std::cerr << "render: --background needs a background image\n";
                return 1;
            }
            save_png(*run.background, *background_path);
            std::cout << "Wrote " << *background_path << '\n';
        }
        return 0;
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    command_line cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        return 1;
    }
    spdlog::set_level(cmd.verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        if (command == "measure") return run_measure(cmd);
        if (command == "layout") return run_layout(cmd);
        if (command == "render") return run_render(cmd);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << '\n';
    print_usage(argv[0]);
    return 1;
}
