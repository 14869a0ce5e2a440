// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Font.hpp"
#include "BuiltinFont.hpp"
#include "FontImpl.hpp"
#include "FontManager.hpp"

#include <algorithm>

namespace cg {

FreeTypeLibrary::FreeTypeLibrary() {
  FT_Error error = FT_Init_FreeType(&handle);
  if (error) {
    throw FontManagerError("Failed to initialize FreeType library");
  }
}

FreeTypeLibrary::~FreeTypeLibrary() {
  if (handle) {
    FT_Done_FreeType(handle);
  }
}

void FontImplDeleter::operator()(FontImpl* ptr) const {
  if (ptr && ptr->face) {
    FT_Done_Face(ptr->face);
  }
  delete ptr;
}

auto make_font_impl(std::shared_ptr<FreeTypeLibrary> library, FT_Face face, std::uint32_t size_px,
                    std::string origin) -> std::shared_ptr<FontImpl> {
  auto* impl = new FontImpl{};
  impl->library = std::move(library);
  impl->face = face;
  impl->size_px = size_px;
  impl->origin = std::move(origin);
  return std::shared_ptr<FontImpl>(impl, FontImplDeleter{});
}

auto make_builtin_font_impl(std::uint32_t size_px) -> std::shared_ptr<FontImpl> {
  auto* impl = new FontImpl{};
  impl->size_px = size_px;
  impl->builtin_scale = std::max<std::uint32_t>(
      1, (size_px + builtin_font::kCellHeight / 2) / builtin_font::kCellHeight);
  impl->origin = "built-in";
  return std::shared_ptr<FontImpl>(impl, FontImplDeleter{});
}

namespace {
auto builtin_glyph_metrics(std::uint32_t scale, std::uint32_t glyph_index) -> GlyphMetrics {
  const builtin_font::InkBox box = builtin_font::ink_box(glyph_index);
  const auto advance = static_cast<std::int32_t>(builtin_font::kCellWidth * scale);
  if (box.empty) {
    return GlyphMetrics{
        .width = 0, .height = 0, .bearing_x = 0, .bearing_y = 0, .advance_x = advance};
  }
  return GlyphMetrics{
      .width = (box.max_col - box.min_col + 1) * scale,
      .height = (box.max_row - box.min_row + 1) * scale,
      .bearing_x = static_cast<std::int32_t>(box.min_col * scale),
      .bearing_y = (static_cast<std::int32_t>(builtin_font::kBaseline) -
                    static_cast<std::int32_t>(box.min_row)) *
                   static_cast<std::int32_t>(scale),
      .advance_x = advance};
}
} // namespace

Font::Font(std::shared_ptr<FontImpl> impl) : mImpl(std::move(impl)) {}

auto Font::metrics() const -> FontMetrics {
  if (!is_valid()) {
    return {};
  }

  if (mImpl->builtin_scale) {
    const auto scale = static_cast<std::int32_t>(mImpl->builtin_scale);
    const auto baseline = static_cast<std::int32_t>(builtin_font::kBaseline);
    const auto cell = static_cast<std::int32_t>(builtin_font::kCellHeight);
    return FontMetrics{.ascent = baseline * scale,
                       .descent = (baseline - cell) * scale,
                       .line_height = cell * scale,
                       .size_px = builtin_font::kCellHeight * mImpl->builtin_scale};
  }

  FT_Face face = mImpl->face;
  return FontMetrics{.ascent = static_cast<std::int32_t>(face->size->metrics.ascender >> 6),
                     .descent = static_cast<std::int32_t>(face->size->metrics.descender >> 6),
                     .line_height = static_cast<std::int32_t>(face->size->metrics.height >> 6),
                     .size_px = static_cast<std::uint32_t>(face->size->metrics.y_ppem)};
}

auto Font::nominal_size() const -> std::uint32_t { return mImpl ? mImpl->size_px : 0; }

auto Font::description() const -> std::string { return mImpl ? mImpl->origin : "invalid"; }

auto Font::is_builtin() const -> bool { return mImpl && mImpl->builtin_scale != 0; }

auto Font::get_glyph_index(char32_t codepoint) const -> std::uint32_t {
  if (!is_valid()) {
    return 0;
  }

  if (mImpl->builtin_scale) {
    return builtin_font::glyph_index(codepoint);
  }
  return FT_Get_Char_Index(mImpl->face, codepoint);
}

auto Font::get_glyph_metrics(std::uint32_t glyph_index) const -> std::optional<GlyphMetrics> {
  if (!is_valid()) {
    return std::nullopt;
  }

  if (mImpl->builtin_scale) {
    if (glyph_index == 0) {
      return std::nullopt;
    }
    return builtin_glyph_metrics(mImpl->builtin_scale, glyph_index);
  }

  FT_Face face = mImpl->face;
  FT_Error error = FT_Load_Glyph(face, glyph_index, FT_LOAD_DEFAULT);
  if (error) {
    return std::nullopt;
  }

  return GlyphMetrics{
      .width = static_cast<std::uint32_t>(face->glyph->metrics.width >> 6),
      .height = static_cast<std::uint32_t>(face->glyph->metrics.height >> 6),
      .bearing_x = static_cast<std::int32_t>(face->glyph->metrics.horiBearingX >> 6),
      .bearing_y = static_cast<std::int32_t>(face->glyph->metrics.horiBearingY >> 6),
      .advance_x = static_cast<std::int32_t>(face->glyph->metrics.horiAdvance >> 6)};
}

auto Font::load_glyph_bitmap(std::uint32_t glyph_index) const -> std::optional<GlyphBitmap> {
  if (!is_valid()) {
    return std::nullopt;
  }

  if (mImpl->builtin_scale) {
    if (glyph_index == 0) {
      return std::nullopt;
    }
    const std::uint32_t scale = mImpl->builtin_scale;
    const GlyphMetrics metrics = builtin_glyph_metrics(scale, glyph_index);
    const builtin_font::InkBox box = builtin_font::ink_box(glyph_index);
    auto rows = builtin_font::glyph_rows(glyph_index);

    // Nearest-neighbour upscale of the ink box
    mImpl->scratch.assign(static_cast<std::size_t>(metrics.width) * metrics.height, 0);
    for (std::uint32_t y = 0; y < metrics.height; ++y) {
      const std::uint8_t bits = rows[box.min_row + y / scale];
      for (std::uint32_t x = 0; x < metrics.width; ++x) {
        const std::uint32_t col = box.min_col + x / scale;
        if (bits & (0x80u >> col)) {
          mImpl->scratch[static_cast<std::size_t>(y) * metrics.width + x] = 0xFF;
        }
      }
    }
    return GlyphBitmap{.coverage = mImpl->scratch, .pitch = metrics.width, .metrics = metrics};
  }

  FT_Face face = mImpl->face;
  FT_Error error = FT_Load_Glyph(face, glyph_index, FT_LOAD_DEFAULT);
  if (error) {
    return std::nullopt;
  }

  error = FT_Render_Glyph(face->glyph, FT_RENDER_MODE_NORMAL);
  if (error) {
    return std::nullopt;
  }

  FT_Bitmap const& bitmap = face->glyph->bitmap;
  if (bitmap.pitch < 0) {
    // Bottom-up bitmaps are not produced by the normal render mode
    return std::nullopt;
  }
  GlyphMetrics metrics{.width = bitmap.width,
                       .height = bitmap.rows,
                       .bearing_x = face->glyph->bitmap_left,
                       .bearing_y = face->glyph->bitmap_top,
                       .advance_x = static_cast<std::int32_t>(face->glyph->advance.x >> 6)};
  const auto pitch = static_cast<std::uint32_t>(bitmap.pitch);
  std::span<std::uint8_t const> coverage;
  if (bitmap.buffer) {
    coverage = std::span<std::uint8_t const>(bitmap.buffer,
                                             static_cast<std::size_t>(pitch) * bitmap.rows);
  }
  return GlyphBitmap{.coverage = coverage, .pitch = pitch, .metrics = metrics};
}

auto Font::get_kerning(std::uint32_t left_glyph, std::uint32_t right_glyph) const -> std::int32_t {
  if (!is_valid() || mImpl->builtin_scale) {
    return 0;
  }

  FT_Face face = mImpl->face;
  if (!FT_HAS_KERNING(face)) {
    return 0;
  }

  FT_Vector delta;
  FT_Error error = FT_Get_Kerning(face, left_glyph, right_glyph, FT_KERNING_DEFAULT, &delta);
  if (error) {
    return 0;
  }

  return static_cast<std::int32_t>(delta.x >> 6);
}

auto Font::id() const -> void const* { return mImpl.get(); }

auto Font::is_valid() const -> bool { return mImpl && (mImpl->face || mImpl->builtin_scale); }

} // namespace cg
