// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Files.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace cg {

auto read_full_file(const std::filesystem::path& file) -> std::string {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    throw InputNotFound("File not found: " + file.string());
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw InputNotFound("Failed to open file: " + file.string());
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw InputNotFound("Failed to read file: " + file.string());
  }
  return content;
}

auto write_full_file(const std::filesystem::path& file, std::string_view content) -> void {
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to open " + file.string() + " for writing");
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    throw std::system_error(errno, std::generic_category(), "Failed to write " + file.string());
  }
}

auto require_file(const std::filesystem::path& file, std::string_view what) -> void {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw InputNotFound(std::string(what) + " not found: " + file.string());
  }
}

} // namespace cg
