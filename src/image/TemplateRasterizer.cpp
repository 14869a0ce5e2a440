// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "TemplateRasterizer.hpp"
#include "Logging.hpp"
#include "PngCodec.hpp"
#include "Strings.hpp"

#ifdef CERTGEN_HAS_LIBRSVG
#include <cairo.h>
#include <librsvg/rsvg.h>

#include <cmath>
#include <memory>
#endif

namespace cg {

namespace {
#ifdef CERTGEN_HAS_LIBRSVG
struct GObjectDeleter {
  void operator()(RsvgHandle* handle) const { g_object_unref(handle); }
};

struct CairoSurfaceDeleter {
  void operator()(cairo_surface_t* surface) const { cairo_surface_destroy(surface); }
};

struct CairoDeleter {
  void operator()(cairo_t* cr) const { cairo_destroy(cr); }
};

auto take_error_message(GError* error) -> std::string {
  if (!error) {
    return "unknown error";
  }
  std::string message = error->message;
  g_error_free(error);
  return message;
}

auto append_to_string(void* closure, unsigned char const* data, unsigned int length)
    -> cairo_status_t {
  static_cast<std::string*>(closure)->append(reinterpret_cast<char const*>(data), length);
  return CAIRO_STATUS_SUCCESS;
}

auto resolve_size(double intrinsic_w, double intrinsic_h, TemplateSize requested)
    -> std::pair<int, int> {
  if (requested.width && requested.height) {
    return {static_cast<int>(*requested.width), static_cast<int>(*requested.height)};
  }
  if (intrinsic_w <= 0 || intrinsic_h <= 0) {
    throw ConversionFailed("SVG has no intrinsic size; pass both width and height");
  }
  if (requested.width) {
    return {static_cast<int>(*requested.width),
            static_cast<int>(std::lround(*requested.width * intrinsic_h / intrinsic_w))};
  }
  if (requested.height) {
    return {static_cast<int>(std::lround(*requested.height * intrinsic_w / intrinsic_h)),
            static_cast<int>(*requested.height)};
  }
  return {static_cast<int>(std::lround(intrinsic_w)), static_cast<int>(std::lround(intrinsic_h))};
}

auto render_svg(std::filesystem::path const& path, TemplateSize requested) -> std::string {
  GError* error = nullptr;
  std::unique_ptr<RsvgHandle, GObjectDeleter> handle(
      rsvg_handle_new_from_file(path.c_str(), &error));
  if (!handle) {
    throw ConversionFailed("Failed to parse SVG " + path.string() + ": " +
                           take_error_message(error));
  }

  double intrinsic_w = 0;
  double intrinsic_h = 0;
  if (!rsvg_handle_get_intrinsic_size_in_pixels(handle.get(), &intrinsic_w, &intrinsic_h)) {
    intrinsic_w = 0;
    intrinsic_h = 0;
  }
  auto [width, height] = resolve_size(intrinsic_w, intrinsic_h, requested);
  if (width <= 0 || height <= 0) {
    throw ConversionFailed("Invalid output size for " + path.string());
  }

  std::unique_ptr<cairo_surface_t, CairoSurfaceDeleter> surface(
      cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height));
  if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
    throw ConversionFailed("Failed to allocate a " + std::to_string(width) + "x" +
                           std::to_string(height) + " surface");
  }
  std::unique_ptr<cairo_t, CairoDeleter> cr(cairo_create(surface.get()));

  cairo_set_source_rgb(cr.get(), 1.0, 1.0, 1.0);
  cairo_paint(cr.get());

  RsvgRectangle viewport{0.0, 0.0, static_cast<double>(width), static_cast<double>(height)};
  if (!rsvg_handle_render_document(handle.get(), cr.get(), &viewport, &error)) {
    throw ConversionFailed("Failed to render SVG " + path.string() + ": " +
                           take_error_message(error));
  }
  cairo_surface_flush(surface.get());

  std::string png;
  if (cairo_surface_write_to_png_stream(surface.get(), append_to_string, &png) !=
      CAIRO_STATUS_SUCCESS) {
    throw ConversionFailed("Failed to encode rendered SVG " + path.string());
  }
  Log::d("Rasterized {} at {}x{}", path.string(), width, height);
  return png;
}
#endif
} // namespace

auto is_vector_template(std::filesystem::path const& path) -> bool {
  return to_lower(path.extension().string()) == ".svg";
}

auto vector_conversion_available() noexcept -> bool {
#ifdef CERTGEN_HAS_LIBRSVG
  return true;
#else
  return false;
#endif
}

auto rasterize(std::filesystem::path const& path, TemplateSize size) -> std::string {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw TemplateNotFound("Template not found: " + path.string());
  }

  if (!is_vector_template(path)) {
    return read_full_file(path);
  }

#ifdef CERTGEN_HAS_LIBRSVG
  std::string png = render_svg(path, size);
  if (png.empty()) {
    throw ConversionFailed("SVG conversion produced no data for " + path.string());
  }
  return png;
#else
  (void)size;
  throw ConversionUnavailable("SVG templates need librsvg, which this build does not include: " +
                              path.string());
#endif
}

auto load_template(std::filesystem::path const& path, TemplateSize size) -> Image {
  return decode_png(rasterize(path, size));
}

} // namespace cg
