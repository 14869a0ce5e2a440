// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "PngCodec.hpp"
#include "Logging.hpp"

#include <png.h>

#include <csetjmp>
#include <cstring>
#include <vector>

namespace cg {

namespace {
constexpr int kCompressionLevel = 6;

struct MemoryReader {
  std::string_view bytes;
  std::size_t offset = 0;
};

void read_from_memory(png_structp png, png_bytep out, png_size_t length) {
  auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
  if (reader->bytes.size() - reader->offset < length) {
    png_error(png, "unexpected end of data");
  }
  std::memcpy(out, reader->bytes.data() + reader->offset, length);
  reader->offset += length;
}

void write_to_string(png_structp png, png_bytep data, png_size_t length) {
  auto* out = static_cast<std::string*>(png_get_io_ptr(png));
  out->append(reinterpret_cast<char const*>(data), length);
}

void flush_noop(png_structp) {}

void warn_to_log(png_structp, png_const_charp message) { Log::d("libpng: {}", message); }

auto dots_per_metre(std::uint32_t dpi) -> png_uint_32 {
  return static_cast<png_uint_32>(dpi / 0.0254 + 0.5);
}
} // namespace

auto decode_png(std::string_view bytes) -> Image {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;

  if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
    std::string message = image.message;
    png_image_free(&image);
    throw ImageDecodeError("Failed to read PNG header: " + message);
  }

  image.format = PNG_FORMAT_RGBA;
  std::vector<std::uint8_t> rgba(PNG_IMAGE_SIZE(image));
  if (!png_image_finish_read(&image, nullptr, rgba.data(), 0, nullptr)) {
    std::string message = image.message;
    png_image_free(&image);
    throw ImageDecodeError("Failed to decode PNG: " + message);
  }

  Image result(image.width, image.height);
  auto pixels = result.pixels();
  for (std::size_t i = 0; i < pixels.size(); ++i) {
    std::uint8_t const* p = &rgba[i * 4];
    pixels[i] = (static_cast<std::uint32_t>(p[3]) << 24) | (static_cast<std::uint32_t>(p[0]) << 16) |
                (static_cast<std::uint32_t>(p[1]) << 8) | static_cast<std::uint32_t>(p[2]);
  }
  return result;
}

auto encode_png(Image const& image, std::uint32_t dpi) -> std::string {
  if (image.empty()) {
    throw PngEncodeError("Cannot encode an empty image");
  }

  const std::size_t width = image.width();
  const std::size_t height = image.height();
  std::vector<std::uint8_t> rgba(width * height * 4);
  std::vector<png_bytep> rows(height);
  for (std::size_t y = 0; y < height; ++y) {
    rows[y] = &rgba[y * width * 4];
    for (std::size_t x = 0; x < width; ++x) {
      const std::uint32_t argb = image.at(x, y);
      std::uint8_t* p = rows[y] + x * 4;
      p[0] = (argb >> 16) & 0xFF;
      p[1] = (argb >> 8) & 0xFF;
      p[2] = argb & 0xFF;
      p[3] = (argb >> 24) & 0xFF;
    }
  }

  std::string output;
  png_structp png =
      png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, warn_to_log);
  if (!png) {
    throw PngEncodeError("Failed to create PNG write struct");
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_write_struct(&png, nullptr);
    throw PngEncodeError("Failed to create PNG info struct");
  }

  // libpng reports errors by jumping back here
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    throw PngEncodeError("libpng failed to encode image");
  }

  png_set_write_fn(png, &output, write_to_string, flush_noop);
  png_set_compression_level(png, kCompressionLevel);
  png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8,
               PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  if (dpi > 0) {
    png_set_pHYs(png, info, dots_per_metre(dpi), dots_per_metre(dpi), PNG_RESOLUTION_METER);
  }
  png_write_info(png, info);
  png_write_image(png, rows.data());
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return output;
}

auto read_png_dpi(std::string_view bytes) -> std::optional<std::uint32_t> {
  png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, warn_to_log);
  if (!png) {
    throw ImageDecodeError("Failed to create PNG read struct");
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    throw ImageDecodeError("Failed to create PNG info struct");
  }

  MemoryReader reader{bytes};
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    throw ImageDecodeError("Failed to read PNG header");
  }

  png_set_read_fn(png, &reader, read_from_memory);
  png_read_info(png, info);

  png_uint_32 res_x = 0;
  png_uint_32 res_y = 0;
  int unit = PNG_RESOLUTION_UNKNOWN;
  const bool has_phys = png_get_pHYs(png, info, &res_x, &res_y, &unit) != 0;
  png_destroy_read_struct(&png, &info, nullptr);

  if (!has_phys || unit != PNG_RESOLUTION_METER) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(res_x * 0.0254 + 0.5);
}

} // namespace cg
