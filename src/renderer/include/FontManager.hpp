// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cg {

struct FontManagerError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A font file or family could not be loaded. Callers usually fall back to another font.
struct FontLoadFailed : public FontManagerError {
  using FontManagerError::FontManagerError;
};

class Font;

// Manages font discovery and loading
class FontManager {
public:
  FontManager();
  FontManager(FontManager&&) noexcept;
  auto operator=(FontManager&&) noexcept -> FontManager&;
  ~FontManager();

  // Load the default family (see set_default_family)
  // Throws FontLoadFailed if it is not installed
  auto get_default(std::uint32_t size_px) -> Font;

  auto set_default_family(std::string_view family) -> void;

  // Load a font by family name and size in pixels
  // Throws FontLoadFailed if font cannot be found or loaded
  auto load_font(std::string_view family, std::uint32_t size_px) -> Font;

  // Load a font from a specific file path
  auto load_font_file(std::string_view path, std::uint32_t size_px) -> Font;

  // The embedded bitmap face. Covers printable ASCII, never fails.
  static auto builtin(std::uint32_t size_px) -> Font;

  // Add a directory to search for fonts
  auto add_font_directory(std::string_view path) -> void;

private:
  std::unique_ptr<struct FontManagerImpl> mImpl;
};

} // namespace cg
