// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Color.hpp"
#include "Image.hpp"
#include "PixelsView.hpp"
#include "TextLayout.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace cg {

class Font;

// No certificate of a batch could be produced
struct EmptyBatch : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RenderSettings {
  Point anchor;
  Color color = colors::kBlack;
  Align align = Align::Center;
  OutlineOptions outline;
  std::uint32_t dpi = 600;
};

struct BatchOutcome {
  std::string name;
  std::string entry_name; // Empty if the item failed before a key was assigned
  bool succeeded = false;
  std::size_t bytes = 0;  // Encoded image size on success
  std::string error;      // Failure reason
  RenderStatus render_status = RenderStatus::Rendered;
};

struct BatchResult {
  std::string archive;
  std::vector<BatchOutcome> outcomes;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
};

// Turns a rendered certificate into file bytes
using ImageEncoder = std::function<std::string(Image const&, std::uint32_t dpi)>;

// Renders one certificate per name and packs them into a ZIP archive as {key}.png
class BatchPackager {
public:
  explicit BatchPackager(TextLayoutEngine& layout);
  BatchPackager(TextLayoutEngine& layout, ImageEncoder encoder);

  // A failing item is recorded and skipped. Throws EmptyBatch if every item failed.
  auto run(std::span<std::string const> names, Image const& base, Font const& font,
           RenderSettings const& settings) -> BatchResult;

private:
  TextLayoutEngine* mLayout;
  ImageEncoder mEncoder;
};

} // namespace cg
