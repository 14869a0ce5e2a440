// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FilenameSanitizer.hpp"
#include "Logging.hpp"
#include "Utf8.hpp"

namespace cg {

namespace {
auto is_forbidden(char c) -> bool {
  if (static_cast<unsigned char>(c) < 0x20) {
    return true;
  }
  switch (c) {
  case '<':
  case '>':
  case ':':
  case '"':
  case '/':
  case '\\':
  case '|':
  case '?':
  case '*':
    return true;
  default:
    return false;
  }
}
} // namespace

auto sanitize(std::string_view name) -> std::string {
  std::string_view trimmed = utf8::trim(name);
  if (trimmed.empty()) {
    return std::string(kFallbackKey);
  }

  std::string key;
  key.reserve(trimmed.size());
  bool in_space = false;
  std::size_t pos = 0;
  while (pos < trimmed.size()) {
    char32_t codepoint = 0;
    const std::size_t consumed = utf8::decode_at(trimmed, pos, codepoint);
    std::string_view bytes = trimmed.substr(pos, consumed);
    pos += consumed;
    if (utf8::is_space(codepoint)) {
      if (!in_space) {
        key += '_';
      }
      in_space = true;
      continue;
    }
    in_space = false;
    if (bytes.size() != 1 || !is_forbidden(bytes.front())) {
      key += bytes;
    }
  }

  key.resize(utf8::truncate(key, kMaxKeyLength).size());
  if (key.empty()) {
    return std::string(kFallbackKey);
  }
  return key;
}

auto KeyRegistry::claim(std::string_view key) -> std::string {
  if (mKeys.insert(std::string(key)).second) {
    return std::string(key);
  }

  for (std::size_t n = 2;; ++n) {
    const std::string suffix = "_" + std::to_string(n);
    const std::size_t room = kMaxKeyLength - suffix.size();
    std::string candidate = std::string(utf8::truncate(key, room)) + suffix;
    if (mKeys.insert(candidate).second) {
      Log::w("Key '{}' is already taken, using '{}'", key, candidate);
      return candidate;
    }
  }
}

auto KeyRegistry::contains(std::string_view key) const -> bool {
  return mKeys.contains(std::string(key));
}

} // namespace cg
