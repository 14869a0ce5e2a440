// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FilenameSanitizer.hpp"
#include "Utf8.hpp"

#include <cassert>

void test_blank_names_fall_back() {
  assert(cg::sanitize("") == "participant");
  assert(cg::sanitize("  ") == "participant");
  assert(cg::sanitize("\t\r\n") == "participant");
}

void test_whitespace_collapses() {
  assert(cg::sanitize("Ana Mar\xC3\xAD" "a") == "Ana_Mar\xC3\xAD" "a");
  assert(cg::sanitize("  John   Ronald \t Tolkien ") == "John_Ronald_Tolkien");
}

void test_unicode_whitespace_collapses() {
  // No-break space
  assert(cg::sanitize("Ana\xC2\xA0Mar\xC3\xAD" "a") == "Ana_Mar\xC3\xAD" "a");
  // Ideographic space next to an ASCII space forms one run
  assert(cg::sanitize("\xE5\xB1\xB1\xE7\x94\xB0\xE3\x80\x80 \xE5\xA4\xAA\xE9\x83\x8E") ==
         "\xE5\xB1\xB1\xE7\x94\xB0_\xE5\xA4\xAA\xE9\x83\x8E");
  // Leading and trailing Unicode spaces are trimmed
  assert(cg::sanitize("\xE2\x80\x83Grace\xE2\x80\xAF") == "Grace");
  assert(cg::sanitize("\xC2\xA0\xE3\x80\x80") == "participant");
}

void test_forbidden_characters_are_removed() {
  assert(cg::sanitize("a<b>c:d\"e/f\\g|h?i*j") == "abcdefghij");
  assert(cg::sanitize(std::string_view("x\x01y\x7Fz")) == "xy\x7Fz");
  // The separators U+001C..U+001F count as whitespace, other controls are dropped
  assert(cg::sanitize(std::string_view("x\x01y\x1Fz")) == "xy_z");
  assert(cg::sanitize("Dr. O'Brien") == "Dr._O'Brien");
}

void test_only_forbidden_characters_fall_back() {
  assert(cg::sanitize("???") == "participant");
  assert(cg::sanitize("<>") == "participant");
}

void test_truncation_counts_code_points() {
  std::string ascii(200, 'a');
  assert(cg::sanitize(ascii) == std::string(120, 'a'));

  std::string accented;
  for (int i = 0; i < 150; ++i) {
    accented += "\xC3\xA9";
  }
  std::string key = cg::sanitize(accented);
  assert(cg::utf8::codepoint_count(key) == 120);
  assert(key.size() == 240);
  assert(cg::utf8::is_valid(key));
}

void test_is_deterministic() {
  assert(cg::sanitize(" Grace  Hopper ") == cg::sanitize(" Grace  Hopper "));
}

void test_key_registry_suffixes() {
  cg::KeyRegistry keys;
  assert(keys.claim("Alice") == "Alice");
  assert(keys.claim("Alice") == "Alice_2");
  assert(keys.claim("Alice") == "Alice_3");
  assert(keys.claim("Bob") == "Bob");
  // A literal name that looks like a suffixed key is respected
  assert(keys.claim("Alice_4") == "Alice_4");
  assert(keys.claim("Alice") == "Alice_5");
  assert(keys.contains("Alice_2"));
  assert(keys.size() == 6);
}

void test_key_registry_keeps_length_bound() {
  cg::KeyRegistry keys;
  std::string long_key(120, 'z');
  assert(keys.claim(long_key) == long_key);
  std::string second = keys.claim(long_key);
  assert(second.size() == 120);
  assert(second.ends_with("_2"));
}

int main() {
  test_blank_names_fall_back();
  test_whitespace_collapses();
  test_unicode_whitespace_collapses();
  test_forbidden_characters_are_removed();
  test_only_forbidden_characters_fall_back();
  test_truncation_counts_code_points();
  test_is_deterministic();
  test_key_registry_suffixes();
  test_key_registry_keeps_length_bound();
}
