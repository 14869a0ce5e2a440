// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace cg {

// Faces keep the library alive, so fonts may outlive their FontManager
struct FreeTypeLibrary {
  FT_Library handle = nullptr;

  FreeTypeLibrary();
  FreeTypeLibrary(FreeTypeLibrary const&) = delete;
  auto operator=(FreeTypeLibrary const&) -> FreeTypeLibrary& = delete;
  ~FreeTypeLibrary();
};

struct FontImpl {
  std::shared_ptr<FreeTypeLibrary> library;
  FT_Face face = nullptr;
  std::uint32_t size_px = 0;
  // Non-zero selects the built-in bitmap face, scaled by this factor
  std::uint32_t builtin_scale = 0;
  std::string origin;
  std::vector<std::uint8_t> scratch;
};

struct FontImplDeleter {
  void operator()(FontImpl* ptr) const;
};

auto make_font_impl(std::shared_ptr<FreeTypeLibrary> library, FT_Face face, std::uint32_t size_px,
                    std::string origin) -> std::shared_ptr<FontImpl>;

auto make_builtin_font_impl(std::uint32_t size_px) -> std::shared_ptr<FontImpl>;

} // namespace cg
