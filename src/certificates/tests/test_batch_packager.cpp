// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "BatchPackager.hpp"
#include "FilenameSanitizer.hpp"
#include "Font.hpp"
#include "FontManager.hpp"
#include "PngCodec.hpp"
#include "ZipReader.hpp"

#include <cassert>
#include <set>

namespace {
constexpr std::uint32_t kWhite = 0xFFFFFFFF;

auto default_settings() -> cg::RenderSettings {
  return cg::RenderSettings{.anchor = {64, 32}, .dpi = 300};
}

// Fails on the calls whose index is in `failing`
auto flaky_encoder(std::set<int> failing) -> cg::ImageEncoder {
  return [failing, call = 0](cg::Image const& image, std::uint32_t dpi) mutable {
    if (failing.contains(call++)) {
      throw std::runtime_error("encoder failure");
    }
    return cg::encode_png(image, dpi);
  };
}
} // namespace

void test_packs_one_entry_per_name() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout);
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(128, 64, kWhite);
  const std::vector<std::string> names{"Ana Maria", "Bob", "Dr. Who?"};

  cg::BatchResult result = packager.run(names, base, font, default_settings());
  assert(result.succeeded == 3);
  assert(result.failed == 0);
  assert(result.outcomes.size() == 3);

  cg::ZipReader reader(result.archive);
  assert(reader.entries().size() == 3);
  for (std::size_t i = 0; i < names.size(); ++i) {
    assert(result.outcomes[i].succeeded);
    assert(result.outcomes[i].entry_name == cg::sanitize(names[i]) + ".png");
    assert(reader.entries()[i].name == result.outcomes[i].entry_name);

    std::string png = reader.read(result.outcomes[i].entry_name);
    assert(png.size() == result.outcomes[i].bytes);
    assert(cg::read_png_dpi(png) == 300u);
    cg::Image image = cg::decode_png(png);
    assert(image.width() == 128);
    assert(image.height() == 64);
    assert(image != base);
  }
  assert(reader.contains("Ana_Maria.png"));
  assert(reader.contains("Dr._Who.png"));
}

void test_colliding_keys_get_suffixes() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout);
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  const std::vector<std::string> names{"Ana Maria", "Ana  Maria", "Ana/Maria?"};

  cg::BatchResult result = packager.run(names, base, font, default_settings());
  assert(result.succeeded == 3);
  cg::ZipReader reader(result.archive);
  assert(reader.contains("Ana_Maria.png"));
  assert(reader.contains("Ana_Maria_2.png"));
  assert(reader.contains("AnaMaria.png"));
}

void test_failures_are_skipped() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout, flaky_encoder({1, 3}));
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  const std::vector<std::string> names{"Alice", "Bob", "Carol", "Dave", "Eve"};

  cg::BatchResult result = packager.run(names, base, font, default_settings());
  assert(result.succeeded == 3);
  assert(result.failed == 2);
  assert(!result.outcomes[1].succeeded);
  assert(result.outcomes[1].error == "encoder failure");
  assert(!result.outcomes[3].succeeded);

  cg::ZipReader reader(result.archive);
  assert(reader.entries().size() == 3);
  assert(reader.contains("Alice.png"));
  assert(!reader.contains("Bob.png"));
  assert(reader.contains("Carol.png"));
  assert(!reader.contains("Dave.png"));
  assert(reader.contains("Eve.png"));
}

void test_blank_certificate_still_counts() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout);
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  const std::vector<std::string> names{"Zo\xC3\xAB"};

  cg::BatchResult result = packager.run(names, base, font, default_settings());
  assert(result.succeeded == 1);
  assert(result.outcomes[0].render_status == cg::RenderStatus::DrawFailed);
  cg::ZipReader reader(result.archive);
  assert(cg::decode_png(reader.read("Zo\xC3\xAB.png")) == base);
}

void test_all_failures_raise() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout, flaky_encoder({0, 1}));
  cg::Font font = cg::FontManager::builtin(16);
  cg::Image base(64, 32, kWhite);
  const std::vector<std::string> names{"Alice", "Bob"};

  bool thrown = false;
  try {
    packager.run(names, base, font, default_settings());
  } catch (cg::EmptyBatch const&) {
    thrown = true;
  }
  assert(thrown);
}

void test_archive_is_reproducible() {
  cg::TextLayoutEngine layout;
  cg::BatchPackager packager(layout);
  cg::Font font = cg::FontManager::builtin(24);
  cg::Image base(160, 48, kWhite);
  const std::vector<std::string> names{"Alice", "Bob"};

  cg::RenderSettings settings = default_settings();
  settings.outline = cg::OutlineOptions{.enabled = true, .width = 1};
  cg::BatchResult first = packager.run(names, base, font, settings);
  cg::BatchResult second = packager.run(names, base, font, settings);
  assert(first.archive == second.archive);
}

int main() {
  test_packs_one_entry_per_name();
  test_colliding_keys_get_suffixes();
  test_failures_are_skipped();
  test_blank_certificate_still_counts();
  test_all_failures_raise();
  test_archive_is_reproducible();
}
