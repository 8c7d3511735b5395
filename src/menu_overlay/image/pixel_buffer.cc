//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/image/pixel_buffer.hh>
#include <failsafe/failsafe.hh>
#include <png.h>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

namespace menu_overlay {

    namespace {
        // Releases libpng state on every exit path
        struct png_image_guard {
            png_image image{};

            png_image_guard() {
                std::memset(&image, 0, sizeof(image));
                image.version = PNG_IMAGE_VERSION;
            }

            ~png_image_guard() {
                png_image_free(&image);
            }

            png_image_guard(const png_image_guard&) = delete;
            png_image_guard& operator=(const png_image_guard&) = delete;
        };

        std::string png_message(const png_image& image) {
            return std::string(image.message);
        }
    } // anonymous namespace

    pixel_buffer::pixel_buffer(int w, int h, int c)
        : width(w), height(h), channels(c),
          data(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * static_cast<std::size_t>(c), 0) {
    }

    bool pixel_buffer::is_consistent() const {
        if (width <= 0 || height <= 0 || channels <= 0) {
            return false;
        }
        return data.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
                              static_cast<std::size_t>(channels);
    }

    pixel_buffer decode_png(std::span<const uint8_t> bytes) {
        THROW_IF(bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0,
                 std::runtime_error, "Invalid image: not a PNG stream");

        png_image_guard guard;
        THROW_IF(!png_image_begin_read_from_memory(&guard.image, bytes.data(), bytes.size()),
                 std::runtime_error, "Invalid image:", png_message(guard.image));

        // Read with alpha so it can be dropped rather than composited
        guard.image.format = PNG_FORMAT_RGBA;

        const auto w = static_cast<int>(guard.image.width);
        const auto h = static_cast<int>(guard.image.height);
        std::vector<uint8_t> rgba(PNG_IMAGE_SIZE(guard.image));

        THROW_IF(!png_image_finish_read(&guard.image, nullptr, rgba.data(), 0, nullptr),
                 std::runtime_error, "Invalid image:", png_message(guard.image));

        pixel_buffer out(w, h, 3);
        const std::size_t count = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
        for (std::size_t i = 0; i < count; ++i) {
            out.data[i * 3 + 0] = rgba[i * 4 + 0];
            out.data[i * 3 + 1] = rgba[i * 4 + 1];
            out.data[i * 3 + 2] = rgba[i * 4 + 2];
        }
        return out;
    }

    pixel_buffer load_png(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());

        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
        return decode_png(bytes);
    }

    std::vector<uint8_t> encode_png(const pixel_buffer& image) {
        THROW_IF(!image.is_consistent(), std::invalid_argument,
                 "Inconsistent pixel buffer:", image.width, "x", image.height, "x", image.channels);
        THROW_IF(image.channels != 1 && image.channels != 3, std::invalid_argument,
                 "Only gray and RGB buffers can be encoded, got channels =", image.channels);

        png_image_guard guard;
        guard.image.width = static_cast<png_uint_32>(image.width);
        guard.image.height = static_cast<png_uint_32>(image.height);
        guard.image.format = image.channels == 1 ? PNG_FORMAT_GRAY : PNG_FORMAT_RGB;

        png_alloc_size_t size = 0;
        THROW_IF(!png_image_write_to_memory(&guard.image, nullptr, &size, 0, image.data.data(), 0, nullptr),
                 std::runtime_error, "PNG encoding failed:", png_message(guard.image));

        std::vector<uint8_t> out(size);
        THROW_IF(!png_image_write_to_memory(&guard.image, out.data(), &size, 0, image.data.data(), 0, nullptr),
                 std::runtime_error, "PNG encoding failed:", png_message(guard.image));
        out.resize(size);
        return out;
    }

    void save_png(const pixel_buffer& image, const std::filesystem::path& path) {
        auto bytes = encode_png(image);
        std::ofstream file(path, std::ios::binary);
        THROW_IF(!file, std::runtime_error, "Cannot create file:", path.string());
        THROW_IF(!file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())),
                 std::runtime_error, "Failed to write file:", path.string());
    }

} // namespace menu_overlay
