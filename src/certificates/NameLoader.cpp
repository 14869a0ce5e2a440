// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "NameLoader.hpp"
#include "Files.hpp"
#include "Logging.hpp"
#include "Strings.hpp"
#include "Utf8.hpp"

#include <unordered_set>

namespace cg {

namespace {
auto split_lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n' || text[i] == '\r') {
      lines.push_back(text.substr(start, i - start));
      if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
  }
  if (start < text.size()) {
    lines.push_back(text.substr(start));
  }
  return lines;
}

auto names_from_lines(std::vector<std::string_view> const& lines) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (std::string_view line : lines) {
    std::string_view name = trim(line);
    if (!name.empty()) {
      names.emplace_back(name);
    }
  }
  return names;
}

auto names_from_rows(std::vector<CsvRow> const& rows) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (CsvRow const& row : rows) {
    for (std::string const& cell : row) {
      std::string_view name = trim(cell);
      if (!name.empty()) {
        names.emplace_back(name);
        break;
      }
    }
  }
  return names;
}

auto deduplicate(std::vector<std::string> names) -> std::vector<std::string> {
  std::unordered_set<std::string> seen;
  std::vector<std::string> unique;
  unique.reserve(names.size());
  for (std::string& name : names) {
    if (seen.insert(name).second) {
      unique.push_back(std::move(name));
    }
  }
  return unique;
}
} // namespace

auto parse_csv(std::string_view text) -> std::optional<std::vector<CsvRow>> {
  std::vector<CsvRow> rows;
  CsvRow row;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;
  bool row_has_content = false;

  auto end_field = [&] {
    row.push_back(std::move(field));
    field.clear();
    field_started = false;
  };
  auto end_row = [&] {
    if (row_has_content || !field.empty() || !row.empty()) {
      end_field();
      rows.push_back(std::move(row));
    }
    row.clear();
    field.clear();
    field_started = false;
    row_has_content = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\0') {
      return std::nullopt;
    }
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else if (c == '\r') {
        // Quoted line breaks are normalized to \n
        field += '\n';
        if (i + 1 < text.size() && text[i + 1] == '\n') {
          ++i;
        }
      } else {
        field += c;
      }
      continue;
    }

    switch (c) {
    case '"':
      // Quotes only open at the start of a field, elsewhere they are text
      if (field_started) {
        field += c;
      } else {
        in_quotes = true;
        field_started = true;
        row_has_content = true;
      }
      break;
    case ',':
      end_field();
      row_has_content = true;
      break;
    case '\r':
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      end_row();
      break;
    case '\n':
      end_row();
      break;
    default:
      field += c;
      field_started = true;
      break;
    }
  }

  if (in_quotes) {
    return std::nullopt;
  }
  end_row();
  return rows;
}

auto decode_names_text(std::string_view bytes) -> std::string {
  if (utf8::is_valid(bytes)) {
    return std::string(utf8::strip_bom(bytes));
  }
  Log::d("Name list is not valid UTF-8, decoding as latin-1");
  return utf8::from_latin1(bytes);
}

auto parse_names(std::string_view text) -> std::vector<std::string> {
  std::string_view content = trim(text);
  if (content.empty()) {
    return {};
  }

  std::vector<std::string_view> lines = split_lines(content);
  const bool has_comma = content.find(',') != std::string_view::npos;
  if (!has_comma) {
    return deduplicate(names_from_lines(lines));
  }

  std::optional<std::vector<CsvRow>> rows = parse_csv(content);
  if (!rows) {
    Log::w("Name list is not well-formed CSV, reading one name per line");
    return deduplicate(names_from_lines(lines));
  }
  return deduplicate(names_from_rows(*rows));
}

auto load_names(std::filesystem::path const& path) -> std::vector<std::string> {
  std::string bytes = read_full_file(path);
  std::vector<std::string> names = parse_names(decode_names_text(bytes));
  Log::i("Loaded {} names from {}", names.size(), path.string());
  return names;
}

} // namespace cg
