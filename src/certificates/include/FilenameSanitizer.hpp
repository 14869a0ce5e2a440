// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace cg {

inline constexpr std::size_t kMaxKeyLength = 120; // code points
inline constexpr std::string_view kFallbackKey = "participant";

// Filesystem-safe token for a name: runs of Unicode whitespace (utf8::is_space) become `_`, characters
// `<>:"/\|?*` and controls below 0x20 are dropped, at most kMaxKeyLength code points.
// Never empty.
auto sanitize(std::string_view name) -> std::string;

// Hands out unique keys. A key seen before gets the first free suffix _2, _3, ...
class KeyRegistry {
public:
  auto claim(std::string_view key) -> std::string;

  auto contains(std::string_view key) const -> bool;
  auto size() const -> std::size_t { return mKeys.size(); }

private:
  std::unordered_set<std::string> mKeys;
};

} // namespace cg
