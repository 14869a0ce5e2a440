// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "CertificateGenerator.hpp"
#include "Files.hpp"
#include "Font.hpp"
#include "FontManager.hpp"
#include "Logging.hpp"
#include "NameLoader.hpp"
#include "PngCodec.hpp"
#include "TemplateRasterizer.hpp"
#include "ZipWriter.hpp"

#include <system_error>

namespace cg {

CertificateGenerator::CertificateGenerator(FontManager& fonts)
    : CertificateGenerator(fonts, encode_png) {}

CertificateGenerator::CertificateGenerator(FontManager& fonts, ImageEncoder encoder)
    : mFonts(&fonts), mEncoder(std::move(encoder)) {}

auto CertificateGenerator::resolve_font(GeneratorConfig const& config) -> Font {
  if (config.font_path) {
    try {
      return mFonts->load_font_file(config.font_path->string(), config.font_size);
    } catch (FontManagerError const& ex) {
      Log::w("{}; trying default family '{}'", ex.what(), config.default_font_family);
    }
  }

  try {
    mFonts->set_default_family(config.default_font_family);
    return mFonts->get_default(config.font_size);
  } catch (FontManagerError const& ex) {
    Log::w("{}; using the built-in font", ex.what());
  }
  return FontManager::builtin(config.font_size);
}

auto CertificateGenerator::generate(GeneratorConfig const& config) -> RunSummary {
  validate(config);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(config.template_path, ec)) {
    throw TemplateNotFound("Template not found: " + config.template_path.string());
  }
  require_file(config.names_path, "participants file");
  if (config.font_path) {
    require_file(*config.font_path, "font file");
  }

  const Color color = Color::parse(config.color);

  Image base = load_template(config.template_path,
                             TemplateSize{config.template_width, config.template_height});
  Log::i("Template size: {} x {} pixels", base.width(), base.height());

  RunSummary summary;
  summary.template_width = base.width();
  summary.template_height = base.height();
  summary.anchor = Point{config.anchor_x.value_or(static_cast<int>(base.width() / 2)),
                         config.anchor_y.value_or(static_cast<int>(base.height() / 2))};

  std::vector<std::string> names = load_names(config.names_path);
  if (names.empty()) {
    throw EmptyNameList("No valid names found in " + config.names_path.string());
  }
  summary.names = names.size();

  if (summary.anchor.x < 0 || summary.anchor.y < 0 ||
      static_cast<std::size_t>(summary.anchor.x) >= base.width() ||
      static_cast<std::size_t>(summary.anchor.y) >= base.height()) {
    Log::w("Coordinates ({}, {}) may be outside image bounds", summary.anchor.x,
           summary.anchor.y);
  }

  Font font = resolve_font(config);
  summary.font = font.description();
  Log::i("Using font {} at {}px", summary.font, config.font_size);

  RenderSettings settings{.anchor = summary.anchor,
                          .color = color,
                          .align = config.align,
                          .outline = config.outline,
                          .dpi = config.dpi};
  BatchPackager packager(mLayout, mEncoder);
  BatchResult batch = packager.run(names, base, font, settings);

  try {
    write_full_file(config.output_path, batch.archive);
  } catch (std::system_error const& ex) {
    throw ArchiveError(std::string("Failed to write archive: ") + ex.what());
  }

  summary.archive_path = std::filesystem::absolute(config.output_path, ec);
  if (ec) {
    summary.archive_path = config.output_path;
  }
  summary.archive_bytes = batch.archive.size();
  summary.succeeded = batch.succeeded;
  summary.failed = batch.failed;
  summary.outcomes = std::move(batch.outcomes);

  Log::i("Generated {}/{} certificates", summary.succeeded, summary.names);
  Log::i("Certificates archive written to {}", summary.archive_path.string());
  return summary;
}

} // namespace cg
