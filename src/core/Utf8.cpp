// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Utf8.hpp"

#include <algorithm>
#include <cstdint>

namespace cg::utf8 {

namespace {
auto is_continuation(unsigned char c) noexcept -> bool { return (c & 0xC0) == 0x80; }

// Length of the sequence starting at `lead`, or 0 for an invalid lead byte
auto sequence_length(unsigned char lead) noexcept -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 0;
}

} // namespace

auto decode_at(std::string_view bytes, std::size_t pos, char32_t& out) noexcept -> std::size_t {
  const auto lead = static_cast<unsigned char>(bytes[pos]);
  const std::size_t length = sequence_length(lead);
  if (length == 0 || pos + length > bytes.size()) {
    out = kReplacementCharacter;
    return 1;
  }
  if (length == 1) {
    out = lead;
    return 1;
  }

  static constexpr std::uint8_t kLeadMask[] = {0, 0, 0x1F, 0x0F, 0x07};
  static constexpr char32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};

  char32_t codepoint = lead & kLeadMask[length];
  for (std::size_t i = 1; i < length; ++i) {
    const auto c = static_cast<unsigned char>(bytes[pos + i]);
    if (!is_continuation(c)) {
      out = kReplacementCharacter;
      return i;
    }
    codepoint = (codepoint << 6) | (c & 0x3F);
  }

  if (codepoint < kMinimum[length] || codepoint > 0x10FFFF ||
      (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
    out = kReplacementCharacter;
    return length;
  }
  out = codepoint;
  return length;
}

auto is_valid(std::string_view bytes) noexcept -> bool {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t codepoint = 0;
    const std::size_t consumed = decode_at(bytes, pos, codepoint);
    if (codepoint == kReplacementCharacter) {
      // U+FFFD itself is valid when it was actually encoded as EF BF BD
      if (bytes.substr(pos, consumed) != "\xEF\xBF\xBD") {
        return false;
      }
    }
    pos += consumed;
  }
  return true;
}

auto from_latin1(std::string_view bytes) -> std::string {
  std::string result;
  result.reserve(bytes.size() * 2);
  for (char c : bytes) {
    encode(static_cast<unsigned char>(c), result);
  }
  return result;
}

auto decode(std::string_view bytes) -> std::u32string {
  std::u32string result;
  result.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t codepoint = 0;
    pos += decode_at(bytes, pos, codepoint);
    result.push_back(codepoint);
  }
  return result;
}

auto encode(char32_t codepoint, std::string& out) -> void {
  if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
    codepoint = kReplacementCharacter;
  }
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else if (codepoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

auto codepoint_count(std::string_view bytes) noexcept -> std::size_t {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t codepoint = 0;
    pos += decode_at(bytes, pos, codepoint);
    ++count;
  }
  return count;
}

auto truncate(std::string_view bytes, std::size_t max_codepoints) noexcept -> std::string_view {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < bytes.size() && count < max_codepoints) {
    char32_t codepoint = 0;
    pos += decode_at(bytes, pos, codepoint);
    ++count;
  }
  return bytes.substr(0, pos);
}

auto is_space(char32_t codepoint) noexcept -> bool {
  switch (codepoint) {
  case 0x20:
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return (codepoint >= 0x09 && codepoint <= 0x0D) || (codepoint >= 0x1C && codepoint <= 0x1F) ||
           (codepoint >= 0x2000 && codepoint <= 0x200A);
  }
}

auto trim(std::string_view bytes) noexcept -> std::string_view {
  std::size_t begin = bytes.size();
  std::size_t end = 0;
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t codepoint = 0;
    const std::size_t consumed = decode_at(bytes, pos, codepoint);
    if (!is_space(codepoint)) {
      begin = std::min(begin, pos);
      end = pos + consumed;
    }
    pos += consumed;
  }
  if (begin >= end) {
    return bytes.substr(0, 0);
  }
  return bytes.substr(begin, end - begin);
}

auto strip_bom(std::string_view bytes) noexcept -> std::string_view {
  if (bytes.starts_with("\xEF\xBB\xBF")) {
    bytes.remove_prefix(3);
  }
  return bytes;
}

} // namespace cg::utf8
