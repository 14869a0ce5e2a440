// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FontManager.hpp"
#include "Font.hpp"
#include "FontImpl.hpp"
#include "Logging.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

namespace cg {

struct FontManagerImpl {
  std::shared_ptr<FreeTypeLibrary> library = std::make_shared<FreeTypeLibrary>();
  std::vector<std::filesystem::path> font_directories;
  std::string default_family = "DejaVu Sans";

  FontManagerImpl() {
    // Add default system font directories
    font_directories.push_back("/usr/share/fonts");
    font_directories.push_back("/usr/local/share/fonts");

    // Add user font directory if it exists
    if (auto home = std::getenv("HOME")) {
      std::filesystem::path user_fonts = std::filesystem::path(home) / ".fonts";
      std::error_code ec;
      if (std::filesystem::exists(user_fonts, ec)) {
        font_directories.push_back(user_fonts);
      }
    }
  }

  static auto normalize_font_name(std::string_view name) -> std::string {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
      if (c != ' ' && c != '-' && c != '_') {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
    }
    return result;
  }

  static auto is_font_file(std::filesystem::path const& path) -> bool {
    auto ext = path.extension();
    return ext == ".ttf" || ext == ".otf" || ext == ".TTF" || ext == ".OTF";
  }

  auto find_font_file(std::string_view family) -> std::filesystem::path {
    // Normalize search term by removing spaces and converting to lowercase
    std::string normalized_family = normalize_font_name(family);

    // Prefer an exact stem match ("DejaVuSans.ttf" over "DejaVuSans-Bold.ttf")
    std::filesystem::path partial_match;
    for (auto const& dir : font_directories) {
      std::error_code ec;
      if (!std::filesystem::exists(dir, ec))
        continue;

      auto options = std::filesystem::directory_options::skip_permission_denied;
      for (auto it = std::filesystem::recursive_directory_iterator(dir, options, ec);
           !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        auto const& entry = *it;
        if (!entry.is_regular_file(ec) || !is_font_file(entry.path()))
          continue;

        std::string normalized_filename = normalize_font_name(entry.path().stem().string());
        if (normalized_filename == normalized_family) {
          return entry.path();
        }
        if (partial_match.empty() &&
            normalized_filename.find(normalized_family) != std::string::npos) {
          partial_match = entry.path();
        }
      }
    }

    if (!partial_match.empty()) {
      return partial_match;
    }
    throw FontLoadFailed("Font family not found: " + std::string(family));
  }
};

FontManager::FontManager() : mImpl(std::make_unique<FontManagerImpl>()) {}

FontManager::FontManager(FontManager&&) noexcept = default;
auto FontManager::operator=(FontManager&&) noexcept -> FontManager& = default;
FontManager::~FontManager() = default;

auto FontManager::load_font(std::string_view family, std::uint32_t size_px) -> Font {
  auto path = mImpl->find_font_file(family);
  Log::d("Resolved font family '{}' to {}", family, path.string());
  return load_font_file(path.string(), size_px);
}

auto FontManager::load_font_file(std::string_view path, std::uint32_t size_px) -> Font {
  const std::string file(path);
  FT_Face face;
  FT_Error error = FT_New_Face(mImpl->library->handle, file.c_str(), 0, &face);
  if (error) {
    throw FontLoadFailed("Failed to load font file: " + file);
  }

  // Set pixel size
  error = FT_Set_Pixel_Sizes(face, 0, size_px);
  if (error) {
    FT_Done_Face(face);
    throw FontLoadFailed("Failed to set font size " + std::to_string(size_px) + " for " + file);
  }

  return Font(make_font_impl(mImpl->library, face, size_px, file));
}

auto FontManager::builtin(std::uint32_t size_px) -> Font {
  return Font(make_builtin_font_impl(size_px));
}

auto FontManager::add_font_directory(std::string_view path) -> void {
  mImpl->font_directories.insert(mImpl->font_directories.begin(), std::filesystem::path(path));
}

auto FontManager::set_default_family(std::string_view family) -> void {
  mImpl->default_family = family;
}

auto FontManager::get_default(std::uint32_t size_px) -> Font {
  return load_font(mImpl->default_family, size_px);
}

} // namespace cg
