// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cg::utf8 {

inline constexpr char32_t kReplacementCharacter = 0xFFFD;

// Strict check: rejects overlong forms, surrogates and code points above U+10FFFF
auto is_valid(std::string_view bytes) noexcept -> bool;

// Maps every byte to the code point of the same value
auto from_latin1(std::string_view bytes) -> std::string;

// Best-effort decoding. Malformed sequences become U+FFFD.
auto decode(std::string_view bytes) -> std::u32string;

// Decodes the sequence at `pos` into `out` (U+FFFD if malformed) and returns the
// number of bytes consumed, at least 1
auto decode_at(std::string_view bytes, std::size_t pos, char32_t& out) noexcept -> std::size_t;

auto encode(char32_t codepoint, std::string& out) -> void;

auto codepoint_count(std::string_view bytes) noexcept -> std::size_t;

// Longest prefix holding at most `max_codepoints` code points, never splitting a sequence
auto truncate(std::string_view bytes, std::size_t max_codepoints) noexcept -> std::string_view;

// Unicode White_Space plus the information separators U+001C..U+001F
auto is_space(char32_t codepoint) noexcept -> bool;

// Strips leading and trailing code points for which is_space holds
auto trim(std::string_view bytes) noexcept -> std::string_view;

auto strip_bom(std::string_view bytes) noexcept -> std::string_view;

} // namespace cg::utf8
