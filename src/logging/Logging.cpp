// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>

#include <unistd.h>

namespace cg {

namespace {
std::atomic<Log::Level> gLevel{Log::Level::Info};

char levelToChar(Log::Level level) {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  }
  return 'U';
}
} // namespace

void Log::set_level(Level level) noexcept { gLevel.store(level, std::memory_order_relaxed); }

auto Log::level() noexcept -> Level { return gLevel.load(std::memory_order_relaxed); }

auto Log::parse_level(std::string_view name) -> std::optional<Level> {
  if (name == "debug") {
    return Level::Debug;
  }
  if (name == "info") {
    return Level::Info;
  }
  if (name == "warning" || name == "warn") {
    return Level::Warning;
  }
  if (name == "error") {
    return Level::Error;
  }
  return std::nullopt;
}

void Log::vlog(Level level, const std::source_location& location, std::string_view fmt,
               fmt::format_args args) {
  std::string message = fmt::vformat(fmt, args);
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename().string();
  int pid = ::getpid();
  int tid = ::gettid();
  std::fprintf(stderr, "[%s:%u] %c %d-%d %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

} // namespace cg
