// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Logging.hpp"
#include "TextLayout.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace cg {

struct ConfigError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Everything one certificate run needs
struct GeneratorConfig {
  std::filesystem::path template_path = "template.png";
  std::filesystem::path names_path = "participants.csv";
  std::optional<std::filesystem::path> font_path;
  std::string default_font_family = "DejaVu Sans";
  std::filesystem::path output_path = "certificates.zip";

  // Anchor of the name, defaults to the template centre
  std::optional<int> anchor_x;
  std::optional<int> anchor_y;

  std::uint32_t font_size = 90;
  std::string color = "#000000";
  Align align = Align::Center;
  OutlineOptions outline;
  std::uint32_t dpi = 600;

  // Output size for vector templates
  std::optional<std::uint32_t> template_width;
  std::optional<std::uint32_t> template_height;

  Log::Level log_level = Log::Level::Info;
};

// Throws ConfigError for values no run can use
auto validate(GeneratorConfig const& config) -> void;

} // namespace cg
