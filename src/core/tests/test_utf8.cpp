// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Files.hpp"
#include "Strings.hpp"
#include "Utf8.hpp"

#include <cassert>
#include <filesystem>
#include <unistd.h>

void test_validation() {
  assert(cg::utf8::is_valid(""));
  assert(cg::utf8::is_valid("plain ascii"));
  assert(cg::utf8::is_valid("Jos\xC3\xA9"));
  assert(cg::utf8::is_valid("\xEF\xBF\xBD"));
  assert(!cg::utf8::is_valid("Jos\xE9"));
  // Overlong encoding of '/'
  assert(!cg::utf8::is_valid("\xC0\xAF"));
  // UTF-16 surrogate
  assert(!cg::utf8::is_valid("\xED\xA0\x80"));
  // Truncated sequence
  assert(!cg::utf8::is_valid("\xE2\x82"));
}

void test_latin1_transcoding() {
  assert(cg::utf8::from_latin1("Jos\xE9") == "Jos\xC3\xA9");
  assert(cg::utf8::from_latin1("M\xFCller") == "M\xC3\xBCller");
  assert(cg::utf8::from_latin1("abc") == "abc");
}

void test_decode() {
  std::u32string decoded = cg::utf8::decode("Zo\xC3\xAB");
  assert(decoded == U"Zoë");

  std::u32string broken = cg::utf8::decode("a\xFF" "b");
  assert(broken.size() == 3);
  assert(broken[1] == cg::utf8::kReplacementCharacter);
}

void test_truncate_keeps_sequences_whole() {
  std::string_view text = "\xC3\xA9\xC3\xA9\xC3\xA9";
  assert(cg::utf8::codepoint_count(text) == 3);
  assert(cg::utf8::truncate(text, 2) == "\xC3\xA9\xC3\xA9");
  assert(cg::utf8::truncate(text, 10) == text);
  assert(cg::utf8::truncate(text, 0).empty());
}

void test_strip_bom() {
  assert(cg::utf8::strip_bom("\xEF\xBB\xBFName") == "Name");
  assert(cg::utf8::strip_bom("Name") == "Name");
}

void test_trim() {
  assert(cg::trim("  \t Alice \r\n") == "Alice");
  assert(cg::trim("   ").empty());
  assert(cg::to_lower("CeNtEr") == "center");

  assert(cg::utf8::trim("\xC2\xA0 Jos\xC3\xA9\xE3\x80\x80") == "Jos\xC3\xA9");
  assert(cg::utf8::trim("\xE2\x80\x8A\x1C").empty());
  assert(cg::utf8::is_space(U'\u2003'));
  assert(!cg::utf8::is_space(U'\u200B'));
  assert(!cg::utf8::is_space(U'x'));
}

void test_files() {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / ("certgen_files_" + std::to_string(::getpid()));
  cg::write_full_file(path, std::string_view("a\0b", 3));
  std::string content = cg::read_full_file(path);
  assert(content.size() == 3);
  assert(content[1] == '\0');
  cg::require_file(path, "test file");
  std::filesystem::remove(path);

  bool thrown = false;
  try {
    cg::read_full_file(path);
  } catch (cg::InputNotFound const&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    cg::require_file(path, "template");
  } catch (cg::InputNotFound const& ex) {
    thrown = std::string_view(ex.what()).starts_with("template not found");
  }
  assert(thrown);
}

int main() {
  test_validation();
  test_latin1_transcoding();
  test_decode();
  test_truncate_keeps_sequences_whole();
  test_strip_bom();
  test_trim();
  test_files();
}
