// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ZipReader.hpp"
#include "ZipWriter.hpp"

#include <cassert>
#include <sstream>

namespace {
auto make_archive(bool explicit_close) -> std::string {
  std::ostringstream out;
  {
    cg::ZipWriter zip(out);
    zip.add_entry("Alice.png", "first entry");
    zip.add_entry("Bob.png", std::string(10000, 'x'));
    if (explicit_close) {
      zip.close();
      assert(zip.is_closed());
      // Closing twice is harmless
      zip.close();
    }
  }
  return out.str();
}
} // namespace

void test_write_and_read_back() {
  std::string bytes = make_archive(true);
  assert(bytes.starts_with("PK\x03\x04"));

  cg::ZipReader reader(bytes);
  assert(reader.entries().size() == 2);
  assert(reader.entries()[0].name == "Alice.png");
  assert(reader.entries()[1].name == "Bob.png");
  assert(reader.entries()[1].method == 8);
  // Repetitive data must actually be compressed
  assert(reader.entries()[1].compressed_size < 10000);

  assert(reader.contains("Alice.png"));
  assert(!reader.contains("Carol.png"));
  assert(reader.read("Alice.png") == "first entry");
  assert(reader.read("Bob.png") == std::string(10000, 'x'));
}

void test_destructor_finishes_archive() {
  assert(make_archive(false) == make_archive(true));
}

void test_output_is_deterministic() {
  assert(make_archive(true) == make_archive(true));
}

void test_utf8_names_are_flagged() {
  std::ostringstream out;
  {
    cg::ZipWriter zip(out);
    zip.add_entry("Ana_Mar\xC3\xAD" "a.png", "data");
    zip.add_entry("plain.png", "data");
  }
  std::string bytes = out.str();
  // General purpose bit 11 of the first local header marks a UTF-8 name
  assert(bytes[7] & 0x08);

  cg::ZipReader reader(bytes);
  assert(reader.entries()[0].name == "Ana_Mar\xC3\xAD" "a.png");
  assert(reader.entries()[1].name == "plain.png");
  assert(reader.read("Ana_Mar\xC3\xAD" "a.png") == "data");
}

void test_rejects_invalid_entries() {
  std::ostringstream out;
  cg::ZipWriter zip(out);
  zip.add_entry("a.png", "1");

  bool thrown = false;
  try {
    zip.add_entry("a.png", "2");
  } catch (cg::ArchiveError const&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    zip.add_entry("", "2");
  } catch (cg::ArchiveError const&) {
    thrown = true;
  }
  assert(thrown);
  assert(zip.entry_count() == 1);

  zip.close();
  thrown = false;
  try {
    zip.add_entry("b.png", "3");
  } catch (cg::ArchiveError const&) {
    thrown = true;
  }
  assert(thrown);
  assert(zip.entry_count() == 1);
  assert(zip.bytes_written() == out.str().size());
  assert(cg::ZipReader(out.str()).read("a.png") == "1");
}

void test_empty_archive_writes_nothing() {
  std::ostringstream out;
  cg::ZipWriter zip(out);
  zip.close();
  assert(zip.is_closed());
  assert(zip.entry_count() == 0);
  assert(zip.bytes_written() == 0);
  assert(out.str().empty());
}

void test_reader_rejects_garbage() {
  bool thrown = false;
  try {
    cg::ZipReader reader(std::string("PK not really"));
  } catch (cg::ArchiveError const&) {
    thrown = true;
  }
  assert(thrown);

  std::string bytes = make_archive(true);
  // Corrupt the data of the first entry, which follows its name and extra field
  auto le16 = [&](std::size_t at) {
    return static_cast<std::size_t>(static_cast<unsigned char>(bytes[at])) |
           static_cast<std::size_t>(static_cast<unsigned char>(bytes[at + 1])) << 8;
  };
  bytes[30 + le16(26) + le16(28) + 2] ^= 0x55;
  cg::ZipReader reader(bytes);
  thrown = false;
  try {
    reader.read("Alice.png");
  } catch (cg::ArchiveError const&) {
    thrown = true;
  }
  assert(thrown);
}

int main() {
  test_write_and_read_back();
  test_destructor_finishes_archive();
  test_output_is_deterministic();
  test_utf8_names_are_flagged();
  test_rejects_invalid_entries();
  test_empty_archive_writes_nothing();
  test_reader_rejects_garbage();
}
