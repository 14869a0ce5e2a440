// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace cg {

struct ArchiveError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Builds a ZIP archive in memory and writes it to `out` on close(), or at the
// latest in the destructor. Entries are DEFLATE level 6 with a fixed 1980-01-01
// timestamp, so equal input always gives equal bytes. An archive without entries
// writes nothing.
class ZipWriter {
public:
  explicit ZipWriter(std::ostream& out);
  ZipWriter(ZipWriter&&) noexcept;
  auto operator=(ZipWriter&&) noexcept -> ZipWriter&;
  ~ZipWriter();

  // Keeps a copy of `data` until close(). Throws ArchiveError on empty or
  // duplicate names and on a closed writer.
  auto add_entry(std::string_view name, std::string_view data) -> void;

  // Finishes the archive and writes it out. Further calls do nothing.
  auto close() -> void;

  auto is_closed() const -> bool;
  auto entry_count() const -> std::size_t;

  // Size of the finished archive, 0 before close()
  auto bytes_written() const -> std::uint64_t;

private:
  std::unique_ptr<struct ZipWriterImpl> mImpl;
};

} // namespace cg
