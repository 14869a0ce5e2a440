// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "GeneratorConfig.hpp"

namespace cg {

auto validate(GeneratorConfig const& config) -> void {
  if (config.font_size == 0) {
    throw ConfigError("Font size must be positive");
  }
  if (config.dpi == 0) {
    throw ConfigError("DPI must be positive");
  }
  if (config.outline.width < 0) {
    throw ConfigError("Outline width must not be negative");
  }
  if (config.template_width && *config.template_width == 0) {
    throw ConfigError("Template width must be positive");
  }
  if (config.template_height && *config.template_height == 0) {
    throw ConfigError("Template height must be positive");
  }
  if (config.output_path.empty()) {
    throw ConfigError("Output path must not be empty");
  }
}

} // namespace cg
