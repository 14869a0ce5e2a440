// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <cassert>
#include <string>

void test_parse_level() {
  assert(cg::Log::parse_level("debug") == cg::Log::Level::Debug);
  assert(cg::Log::parse_level("info") == cg::Log::Level::Info);
  assert(cg::Log::parse_level("warn") == cg::Log::Level::Warning);
  assert(cg::Log::parse_level("warning") == cg::Log::Level::Warning);
  assert(cg::Log::parse_level("error") == cg::Log::Level::Error);
  assert(!cg::Log::parse_level("verbose"));
}

void test_set_level() {
  assert(cg::Log::level() == cg::Log::Level::Info);
  cg::Log::set_level(cg::Log::Level::Error);
  assert(cg::Log::level() == cg::Log::Level::Error);
  // Dropped below the threshold
  cg::Log::i("hidden {}", 1);
  cg::Log::e("shown {} {}", std::string("two"), 2.5);
  cg::Log::set_level(cg::Log::Level::Debug);
  cg::Log::d("debug {}", "enabled");
}

int main() {
  test_parse_level();
  test_set_level();
}
