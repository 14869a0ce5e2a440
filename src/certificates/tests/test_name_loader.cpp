// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Files.hpp"
#include "NameLoader.hpp"

#include <cassert>
#include <filesystem>
#include <unistd.h>

using Names = std::vector<std::string>;

void test_csv_takes_first_cell() {
  assert((cg::parse_names("Alice,alice@x.com\nBob,bob@x.com") == Names{"Alice", "Bob"}));
}

void test_csv_skips_empty_leading_cells() {
  assert((cg::parse_names(",  ,Carol,carol@x.com\n,,\nDave,") == Names{"Carol", "Dave"}));
}

void test_csv_quoting() {
  assert((cg::parse_names("\"Smith, John\",john@x.com\n\"O\"\"Neil\",x") ==
          Names{"Smith, John", "O\"Neil"}));
  // A quoted field may span lines
  assert((cg::parse_names("\"Multi\nLine\",a\nNext,b") == Names{"Multi\nLine", "Next"}));
}

void test_csv_quotes_inside_a_field_are_literal() {
  assert((cg::parse_names("O\"Neil,o@x.com\nBob,bob@x.com") == Names{"O\"Neil", "Bob"}));
  assert((cg::parse_names("Robert \"Bob\" Smith,r@x.com\nAnn,a@x.com") ==
          Names{"Robert \"Bob\" Smith", "Ann"}));

  std::optional<std::vector<cg::CsvRow>> rows = cg::parse_csv("a\"b,c\n");
  assert(rows);
  assert(((*rows)[0] == cg::CsvRow{"a\"b", "c"}));
}

void test_unterminated_quote_falls_back_to_lines() {
  assert((cg::parse_names("\"Alice,a\nBob,b") == Names{"\"Alice,a", "Bob,b"}));
}

void test_line_mode() {
  assert((cg::parse_names("Alice\n\n  Bob  \r\nCarol\rDave\n") ==
          Names{"Alice", "Bob", "Carol", "Dave"}));
}

void test_deduplicates_in_order() {
  assert((cg::parse_names("Alice\nAlice\nBob") == Names{"Alice", "Bob"}));
  assert((cg::parse_names("Bob,1\nAlice,2\nBob,3") == Names{"Bob", "Alice"}));
}

void test_empty_content() {
  assert(cg::parse_names("").empty());
  assert(cg::parse_names(" \n\t\r\n ").empty());
}

void test_parse_csv_structure() {
  std::optional<std::vector<cg::CsvRow>> rows = cg::parse_csv("a,b\r\n\"c\"\"d\",\n");
  assert(rows);
  assert(rows->size() == 2);
  assert(((*rows)[0] == cg::CsvRow{"a", "b"}));
  assert(((*rows)[1] == cg::CsvRow{"c\"d", ""}));

  assert(!cg::parse_csv("\"open"));
  assert(!cg::parse_csv(std::string_view("a,\0b", 4)));
}

void test_decoding() {
  assert(cg::decode_names_text("Jos\xC3\xA9") == "Jos\xC3\xA9");
  assert(cg::decode_names_text("Jos\xE9") == "Jos\xC3\xA9");
  assert(cg::decode_names_text("\xEF\xBB\xBF" "Alice") == "Alice");
}

void test_load_from_file() {
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("certgen_names_" + std::to_string(::getpid()) + ".csv");
  cg::write_full_file(path, "Jos\xE9,jose@x.com\nM\xFCller,m@x.com\n");
  assert((cg::load_names(path) == Names{"Jos\xC3\xA9", "M\xC3\xBCller"}));

  cg::write_full_file(path, "");
  assert(cg::load_names(path).empty());
  std::filesystem::remove(path);

  bool thrown = false;
  try {
    cg::load_names(path);
  } catch (cg::InputNotFound const&) {
    thrown = true;
  }
  assert(thrown);
}

int main() {
  test_csv_takes_first_cell();
  test_csv_skips_empty_leading_cells();
  test_csv_quoting();
  test_csv_quotes_inside_a_field_are_literal();
  test_unterminated_quote_falls_back_to_lines();
  test_line_mode();
  test_deduplicates_in_order();
  test_empty_content();
  test_parse_csv_structure();
  test_decoding();
  test_load_from_file();
}
