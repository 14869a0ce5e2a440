// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cg {

using CsvRow = std::vector<std::string>;

// Comma separated rows with `"` quoting. Quoted fields may contain line breaks.
// Returns nullopt on an unterminated quote or a NUL byte.
auto parse_csv(std::string_view text) -> std::optional<std::vector<CsvRow>>;

// UTF-8 if valid (BOM dropped), latin-1 otherwise. The result is always UTF-8.
auto decode_names_text(std::string_view bytes) -> std::string;

// Names in order of first appearance without duplicates.
// CSV rows contribute their first non-empty cell, plain text one name per line.
auto parse_names(std::string_view text) -> std::vector<std::string>;

// Throws InputNotFound if the file is missing or unreadable
auto load_names(std::filesystem::path const& path) -> std::vector<std::string>;

} // namespace cg
