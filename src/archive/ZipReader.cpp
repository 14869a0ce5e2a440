// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ZipReader.hpp"
#include "Files.hpp"

#include <zip.h>

#include <algorithm>
#include <array>
#include <vector>

namespace cg {

struct ZipReaderImpl {
  // The archive reads from this buffer, it must not move
  std::string bytes;
  zip_t* archive = nullptr;
  std::vector<ZipEntryInfo> entries;

  explicit ZipReaderImpl(std::string data) : bytes(std::move(data)) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    if (source == nullptr) {
      std::string message = zip_error_strerror(&error);
      zip_error_fini(&error);
      throw ArchiveError("Failed to create archive buffer: " + message);
    }
    archive = zip_open_from_source(source, ZIP_RDONLY, &error);
    if (archive == nullptr) {
      std::string message = zip_error_strerror(&error);
      zip_error_fini(&error);
      zip_source_free(source);
      throw ArchiveError("Not a readable ZIP archive: " + message);
    }
    zip_error_fini(&error);
  }

  ZipReaderImpl(ZipReaderImpl const&) = delete;
  auto operator=(ZipReaderImpl const&) -> ZipReaderImpl& = delete;

  ~ZipReaderImpl() { zip_discard(archive); }

  auto find(std::string_view name) const -> ZipEntryInfo const* {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](ZipEntryInfo const& entry) { return entry.name == name; });
    return it == entries.end() ? nullptr : &*it;
  }
};

ZipReader::ZipReader(std::string bytes)
    : mImpl(std::make_unique<ZipReaderImpl>(std::move(bytes))) {
  const zip_int64_t count = zip_get_num_entries(mImpl->archive, 0);
  mImpl->entries.reserve(static_cast<std::size_t>(std::max<zip_int64_t>(count, 0)));
  for (zip_int64_t i = 0; i < count; ++i) {
    zip_stat_t stat;
    zip_stat_init(&stat);
    const auto index = static_cast<zip_uint64_t>(i);
    if (zip_stat_index(mImpl->archive, index, 0, &stat) != 0 || (stat.valid & ZIP_STAT_NAME) == 0) {
      throw ArchiveError("Malformed directory entry " + std::to_string(i) + ": " +
                         zip_strerror(mImpl->archive));
    }
    mImpl->entries.push_back(ZipEntryInfo{.name = stat.name,
                                          .method = stat.comp_method,
                                          .crc32 = stat.crc,
                                          .compressed_size = stat.comp_size,
                                          .uncompressed_size = stat.size,
                                          .index = index});
  }
}

ZipReader::ZipReader(ZipReader&&) noexcept = default;
auto ZipReader::operator=(ZipReader&&) noexcept -> ZipReader& = default;
ZipReader::~ZipReader() = default;

auto ZipReader::open(std::filesystem::path const& path) -> ZipReader {
  return ZipReader(read_full_file(path));
}

auto ZipReader::entries() const -> std::span<ZipEntryInfo const> { return mImpl->entries; }

auto ZipReader::contains(std::string_view name) const -> bool {
  return mImpl->find(name) != nullptr;
}

auto ZipReader::read(std::string_view name) const -> std::string {
  ZipEntryInfo const* entry = mImpl->find(name);
  if (entry == nullptr) {
    throw ArchiveError("No such entry: " + std::string(name));
  }

  zip_file_t* file = zip_fopen_index(mImpl->archive, entry->index, 0);
  if (file == nullptr) {
    throw ArchiveError("Failed to open " + entry->name + ": " + zip_strerror(mImpl->archive));
  }

  std::string data;
  data.reserve(entry->uncompressed_size);
  std::array<char, 64 * 1024> buffer;
  // Reading up to the end lets libzip check the CRC
  for (;;) {
    const zip_int64_t read = zip_fread(file, buffer.data(), buffer.size());
    if (read < 0) {
      std::string message = zip_file_strerror(file);
      zip_fclose(file);
      throw ArchiveError("Corrupt entry " + entry->name + ": " + message);
    }
    if (read == 0) {
      break;
    }
    data.append(buffer.data(), static_cast<std::size_t>(read));
  }
  if (zip_fclose(file) != 0 || data.size() != entry->uncompressed_size) {
    throw ArchiveError("Corrupt entry " + entry->name);
  }
  return data;
}

} // namespace cg
