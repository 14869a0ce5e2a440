// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "ZipWriter.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace cg {

struct ZipEntryInfo {
  std::string name;
  std::uint16_t method; // 0 = stored, 8 = deflate
  std::uint32_t crc32;
  std::uint64_t compressed_size;
  std::uint64_t uncompressed_size;
  std::uint64_t index;
};

// Reads archives held in memory
class ZipReader {
public:
  // Throws ArchiveError if `bytes` is not a readable archive
  explicit ZipReader(std::string bytes);
  ZipReader(ZipReader&&) noexcept;
  auto operator=(ZipReader&&) noexcept -> ZipReader&;
  ~ZipReader();

  static auto open(std::filesystem::path const& path) -> ZipReader;

  auto entries() const -> std::span<ZipEntryInfo const>;

  auto contains(std::string_view name) const -> bool;

  // Decompresses and checks the CRC. Throws ArchiveError for unknown names or corrupt data.
  auto read(std::string_view name) const -> std::string;

private:
  std::unique_ptr<struct ZipReaderImpl> mImpl;
};

} // namespace cg
