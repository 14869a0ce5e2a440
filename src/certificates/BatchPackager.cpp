// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "BatchPackager.hpp"
#include "FilenameSanitizer.hpp"
#include "Logging.hpp"
#include "PngCodec.hpp"
#include "ZipWriter.hpp"

#include <sstream>

namespace cg {

BatchPackager::BatchPackager(TextLayoutEngine& layout) : BatchPackager(layout, encode_png) {}

BatchPackager::BatchPackager(TextLayoutEngine& layout, ImageEncoder encoder)
    : mLayout(&layout), mEncoder(std::move(encoder)) {}

auto BatchPackager::run(std::span<std::string const> names, Image const& base, Font const& font,
                        RenderSettings const& settings) -> BatchResult {
  BatchResult result;
  result.outcomes.reserve(names.size());

  std::ostringstream archive;
  {
    ZipWriter zip(archive);
    KeyRegistry keys;
    const std::size_t total = names.size();

    for (std::size_t i = 0; i < total; ++i) {
      std::string const& name = names[i];
      BatchOutcome outcome{.name = name};
      try {
        outcome.entry_name = keys.claim(sanitize(name)) + ".png";

        RenderResult rendered = mLayout->render(base, name, settings.anchor, font,
                                                settings.color, settings.align, settings.outline);
        outcome.render_status = rendered.status;

        std::string encoded = mEncoder(rendered.image, settings.dpi);
        zip.add_entry(outcome.entry_name, encoded);

        outcome.bytes = encoded.size();
        outcome.succeeded = true;
        ++result.succeeded;
        Log::i("[{}/{}] {} -> {} ({} bytes)", i + 1, total, name, outcome.entry_name,
               outcome.bytes);
      } catch (std::exception const& ex) {
        outcome.error = ex.what();
        ++result.failed;
        Log::e("[{}/{}] Failed for {}: {}", i + 1, total, name, ex.what());
      }
      result.outcomes.push_back(std::move(outcome));
    }

    zip.close();
  }

  if (result.succeeded == 0) {
    throw EmptyBatch("No certificates were generated out of " + std::to_string(names.size()) +
                     " names");
  }
  result.archive = std::move(archive).str();
  return result;
}

} // namespace cg
