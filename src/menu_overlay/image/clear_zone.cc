//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/image/clear_zone.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace menu_overlay {

    namespace {
        double brightness(const uint8_t* p) {
            return (static_cast<double>(p[0]) + static_cast<double>(p[1]) + static_cast<double>(p[2])) / 3.0;
        }

        // Population standard deviation; zero for fewer than two values
        double std_dev(const std::vector<double>& values) {
            const auto n = static_cast<double>(values.size());
            if (values.size() < 2) {
                return 0.0;
            }
            double mean = 0.0;
            for (double v : values) mean += v;
            mean /= n;

            double variance = 0.0;
            for (double v : values) variance += (v - mean) * (v - mean);
            variance /= n;
            return std::sqrt(variance);
        }

        double score_band(const pixel_buffer& image, const detector_config& config, int y_start, int y_end) {
            std::vector<double> row_devs;
            std::vector<double> row_values;

            for (int y = y_start; y < y_end; y += config.sample_step) {
                row_values.clear();
                for (int x = 0; x < image.width; x += config.sample_step) {
                    row_values.push_back(brightness(image.pixel(x, y)));
                }
                if (row_values.size() > 1) {
                    row_devs.push_back(std_dev(row_values));
                }
            }

            if (row_devs.empty()) {
                return MAX_BUSYNESS;
            }
            double sum = 0.0;
            for (double d : row_devs) sum += d;
            return sum / static_cast<double>(row_devs.size());
        }

        struct band_run {
            int start = 0;
            int length = 0;
        };

        // Longest run of quiet bands; earlier runs win ties
        band_run longest_quiet_run(const std::vector<double>& scores, double threshold) {
            band_run best;
            band_run current;

            for (int b = 0; b < static_cast<int>(scores.size()); ++b) {
                if (scores[static_cast<std::size_t>(b)] < threshold) {
                    if (current.length == 0) current.start = b;
                    ++current.length;
                } else {
                    if (current.length > best.length) best = current;
                    current.length = 0;
                }
            }
            if (current.length > best.length) best = current;
            return best;
        }

        struct rgb {
            double r = 0;
            double g = 0;
            double b = 0;
        };

        double column_distance(const pixel_buffer& image, int x, const std::vector<int>& rows, const rgb& ref) {
            double sum = 0.0;
            for (int y : rows) {
                const uint8_t* p = image.pixel(x, y);
                const double dr = static_cast<double>(p[0]) - ref.r;
                const double dg = static_cast<double>(p[1]) - ref.g;
                const double db = static_cast<double>(p[2]) - ref.b;
                sum += std::sqrt(dr * dr + dg * dg + db * db);
            }
            return sum / static_cast<double>(rows.size());
        }

        // Sweep outward from the image center until a column stops matching
        // the center color. Bounds land one step back from the breaking column.
        void find_margins(const pixel_buffer& image, const detector_config& config,
                          int top, int bottom, int& left, int& right) {
            const int center_x = std::min(round_half_up(image.width / 2.0), image.width - 1);
            const int span = bottom - top;

            std::vector<int> rows;
            for (int y : {round_half_up(top + span * 0.25),
                          round_half_up((top + bottom) / 2.0),
                          round_half_up(top + span * 0.75)}) {
                if (y >= top && y < bottom) {
                    rows.push_back(y);
                }
            }
            if (rows.empty()) {
                rows.push_back(top);
            }

            const uint8_t* ref_px = image.pixel(center_x, rows[rows.size() / 2]);
            const rgb ref{static_cast<double>(ref_px[0]), static_cast<double>(ref_px[1]),
                          static_cast<double>(ref_px[2])};

            left = 0;
            for (int x = center_x; x >= 0; x -= config.column_step) {
                if (column_distance(image, x, rows, ref) > config.margin_threshold) {
                    left = std::min(x + config.column_step, center_x);
                    break;
                }
            }

            right = image.width;
            for (int x = center_x; x < image.width; x += config.column_step) {
                if (column_distance(image, x, rows, ref) > config.margin_threshold) {
                    right = std::max(x - config.column_step, center_x);
                    break;
                }
            }
        }

        void validate(const pixel_buffer& image, const detector_config& config) {
            THROW_IF(!image.is_consistent(), std::invalid_argument,
                     "Invalid image: buffer does not match", image.width, "x", image.height,
                     "x", image.channels);
            THROW_IF(image.channels < 3, std::invalid_argument,
                     "Invalid image: expected RGB samples, got channels =", image.channels);
            THROW_IF(config.band_height <= 0 || config.sample_step <= 0 || config.column_step <= 0,
                     std::invalid_argument, "Detector strides must be positive");
        }
    } // anonymous namespace

    std::vector<double> band_busyness(const pixel_buffer& image, const detector_config& config) {
        validate(image, config);

        const int band_count = image.height / config.band_height;
        std::vector<double> scores(static_cast<std::size_t>(band_count));

        for (int b = 0; b < band_count; ++b) {
            const int y_start = b * config.band_height;
            const int y_end = std::min(y_start + config.band_height, image.height);
            scores[static_cast<std::size_t>(b)] = score_band(image, config, y_start, y_end);
        }
        return scores;
    }

    clear_zone measure_clear_zone(const pixel_buffer& image) {
        return measure_clear_zone(image, detector_config{});
    }

    clear_zone measure_clear_zone(const pixel_buffer& image, const detector_config& config) {
        const auto scores = band_busyness(image, config);
        const band_run run = longest_quiet_run(scores, config.busyness_threshold);

        clear_zone zone;
        if (run.length * config.band_height >= config.min_clear_height) {
            zone.top = run.start * config.band_height;
            zone.bottom = (run.start + run.length) * config.band_height;
        } else {
            zone.top = round_half_up(image.height * config.fallback_top);
            zone.bottom = round_half_up(image.height * config.fallback_bottom);
            spdlog::debug("clear zone: longest quiet run is {}px, using fallback rows {}..{}",
                          run.length * config.band_height, zone.top, zone.bottom);
        }

        zone.top = std::clamp(zone.top, 0, image.height - 1);
        zone.bottom = std::clamp(zone.bottom, zone.top + 1, image.height);

        find_margins(image, config, zone.top, zone.bottom, zone.left, zone.right);

        zone.left = std::clamp(zone.left, 0, image.width - 1);
        zone.right = std::clamp(zone.right, zone.left + 1, image.width);

        ENFORCE(zone.top < zone.bottom && zone.left < zone.right);

        spdlog::debug("clear zone: top={} bottom={} left={} right={} ({}x{} image)",
                      zone.top, zone.bottom, zone.left, zone.right, image.width, image.height);
        return zone;
    }

} // namespace menu_overlay
