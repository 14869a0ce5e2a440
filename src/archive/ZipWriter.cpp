// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ZipWriter.hpp"
#include "Logging.hpp"

#include <zip.h>

#include <deque>
#include <string>

namespace cg {

namespace {
constexpr zip_uint32_t kDeflateLevel = 6;

// 1980-01-01 00:00:00, the DOS epoch
constexpr zip_uint16_t kDosTime = 0;
constexpr zip_uint16_t kDosDate = (1 << 5) | 1;
} // namespace

struct ZipWriterImpl {
  std::ostream* out;
  zip_source_t* source = nullptr;
  zip_t* archive = nullptr;
  // Entry sources point into these until the archive is closed
  std::deque<std::string> payloads;
  std::size_t entries = 0;
  std::uint64_t size = 0;
  bool closed = false;

  explicit ZipWriterImpl(std::ostream& out) : out(&out) {
    zip_error_t error;
    zip_error_init(&error);
    source = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (source == nullptr) {
      std::string message = zip_error_strerror(&error);
      zip_error_fini(&error);
      throw ArchiveError("Failed to create archive buffer: " + message);
    }
    archive = zip_open_from_source(source, ZIP_CREATE | ZIP_TRUNCATE, &error);
    if (archive == nullptr) {
      std::string message = zip_error_strerror(&error);
      zip_error_fini(&error);
      zip_source_free(source);
      throw ArchiveError("Failed to create archive: " + message);
    }
    zip_error_fini(&error);
    // The archive releases its reference on close, ours keeps the buffer readable
    zip_source_keep(source);
  }

  ZipWriterImpl(ZipWriterImpl const&) = delete;
  auto operator=(ZipWriterImpl const&) -> ZipWriterImpl& = delete;

  ~ZipWriterImpl() {
    if (archive != nullptr) {
      zip_discard(archive);
    }
    if (source != nullptr) {
      zip_source_free(source);
    }
  }

  auto read_source() -> std::string {
    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_source_stat(source, &stat) != 0) {
      throw ArchiveError(std::string("Failed to stat archive buffer: ") +
                         zip_error_strerror(zip_source_error(source)));
    }
    if (zip_source_open(source) != 0) {
      throw ArchiveError(std::string("Failed to open archive buffer: ") +
                         zip_error_strerror(zip_source_error(source)));
    }
    std::string bytes(stat.size, '\0');
    const zip_int64_t read = zip_source_read(source, bytes.data(), stat.size);
    zip_source_close(source);
    if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
      throw ArchiveError("Failed to read archive buffer");
    }
    return bytes;
  }
};

ZipWriter::ZipWriter(std::ostream& out) : mImpl(std::make_unique<ZipWriterImpl>(out)) {}

ZipWriter::ZipWriter(ZipWriter&&) noexcept = default;
auto ZipWriter::operator=(ZipWriter&&) noexcept -> ZipWriter& = default;

ZipWriter::~ZipWriter() {
  if (!mImpl || mImpl->closed) {
    return;
  }
  try {
    close();
  } catch (std::exception const& ex) {
    Log::e("Failed to finish archive: {}", ex.what());
  }
}

auto ZipWriter::add_entry(std::string_view name, std::string_view data) -> void {
  if (mImpl->closed) {
    throw ArchiveError("Archive is already closed");
  }
  if (name.empty()) {
    throw ArchiveError("Entry name is empty");
  }

  const std::string entry_name(name);
  std::string& payload = mImpl->payloads.emplace_back(data);
  zip_source_t* entry = zip_source_buffer(mImpl->archive, payload.data(), payload.size(), 0);
  if (entry == nullptr) {
    mImpl->payloads.pop_back();
    throw ArchiveError("Failed to create source for " + entry_name + ": " +
                       zip_strerror(mImpl->archive));
  }

  // Duplicate names are refused with ZIP_ER_EXISTS
  const zip_int64_t index =
      zip_file_add(mImpl->archive, entry_name.c_str(), entry, ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    zip_source_free(entry);
    mImpl->payloads.pop_back();
    throw ArchiveError("Failed to add " + entry_name + ": " + zip_strerror(mImpl->archive));
  }

  const auto at = static_cast<zip_uint64_t>(index);
  if (zip_set_file_compression(mImpl->archive, at, ZIP_CM_DEFLATE, kDeflateLevel) != 0 ||
      zip_file_set_dostime(mImpl->archive, at, kDosTime, kDosDate, 0) != 0) {
    std::string message = zip_strerror(mImpl->archive);
    zip_delete(mImpl->archive, at);
    throw ArchiveError("Failed to configure " + entry_name + ": " + message);
  }
  ++mImpl->entries;
}

auto ZipWriter::close() -> void {
  if (mImpl->closed) {
    return;
  }
  if (mImpl->entries == 0) {
    zip_discard(mImpl->archive);
    mImpl->archive = nullptr;
    mImpl->payloads.clear();
    mImpl->closed = true;
    return;
  }

  if (zip_close(mImpl->archive) != 0) {
    std::string message = zip_strerror(mImpl->archive);
    zip_discard(mImpl->archive);
    mImpl->archive = nullptr;
    mImpl->closed = true;
    throw ArchiveError("Failed to finish archive: " + message);
  }
  mImpl->archive = nullptr;
  mImpl->payloads.clear();
  mImpl->closed = true;

  const std::string bytes = mImpl->read_source();
  mImpl->out->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  mImpl->out->flush();
  if (!*mImpl->out) {
    throw ArchiveError("Failed to write archive data");
  }
  mImpl->size = bytes.size();
  Log::d("Archive finished with {} bytes", mImpl->size);
}

auto ZipWriter::is_closed() const -> bool { return mImpl->closed; }

auto ZipWriter::entry_count() const -> std::size_t { return mImpl->entries; }

auto ZipWriter::bytes_written() const -> std::uint64_t { return mImpl->size; }

} // namespace cg
