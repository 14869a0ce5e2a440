// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cg {

// A required input file (names, template, font) does not exist or cannot be read
struct InputNotFound : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Throws InputNotFound if the file is missing or unreadable
auto read_full_file(const std::filesystem::path& file) -> std::string;

// Replaces the file content. Throws std::system_error on failure.
auto write_full_file(const std::filesystem::path& file, std::string_view content) -> void;

// Throws InputNotFound naming `what` if the path is not an existing regular file
auto require_file(const std::filesystem::path& file, std::string_view what) -> void;

} // namespace cg
