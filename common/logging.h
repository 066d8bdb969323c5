#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>

#include "macros.h"

namespace Common {

/// Front end of the asynchronous file logger.
///
/// Messages are formatted on the calling thread into a fixed stack buffer and
/// handed to a bounded MPMC queue; a background writer thread drains the queue
/// in batches. A full queue drops the record and counts the drop, it never blocks.
class Logger {
public:
  enum Level : uint16_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
  };

  static constexpr size_t MAX_MSG_SIZE = 240;

  explicit Logger(const char* filename) noexcept;
  ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  template<typename... Args>
  void log(Level level, const char* format, Args&&... args) noexcept {
    if (UNLIKELY(level < min_level_.load(std::memory_order_relaxed))) {
      return;
    }
    char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
    if (len <= 0) {
      return;
    }
    // Truncated messages are still logged, cut at the buffer size
    size_t n = static_cast<size_t>(len) < sizeof(buffer) ? static_cast<size_t>(len) : sizeof(buffer) - 1;
    submit(level, buffer, n);
  }

  template<typename... Args>
  void debug(const char* format, Args&&... args) noexcept {
    log(DEBUG, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(const char* format, Args&&... args) noexcept {
    log(INFO, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(const char* format, Args&&... args) noexcept {
    log(WARN, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(const char* format, Args&&... args) noexcept {
    log(ERROR, format, std::forward<Args>(args)...);
  }

  void setMinLevel(Level level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
  }

  [[nodiscard]] auto filename() const noexcept -> const char* { return filename_; }

  struct Stats {
    uint64_t messages_written = 0;
    uint64_t messages_dropped = 0;
    uint64_t bytes_written = 0;
  };

  Stats getStats() const noexcept;

private:
  void submit(Level level, const char* msg, size_t len) noexcept;

  char filename_[512];
  std::atomic<uint16_t> min_level_{DEBUG};
};

// Global logger instance, nullptr until initLogging()
extern Logger* g_logger;

/// Start the writer thread and open log_file (parent directories are created).
void initLogging(const char* log_file);

/// Drain pending records, join the writer and close the file.
void shutdownLogging();

/// Map "debug"/"info"/"warn"/"error" to a level; false on unknown names
[[nodiscard]] bool parseLogLevel(const char* name, Logger::Level* level) noexcept;

} // namespace Common

#define LOG_DEBUG(...) do { if (::Common::g_logger) ::Common::g_logger->debug(__VA_ARGS__); } while (0)
#define LOG_INFO(...)  do { if (::Common::g_logger) ::Common::g_logger->info(__VA_ARGS__); } while (0)
#define LOG_WARN(...)  do { if (::Common::g_logger) ::Common::g_logger->warn(__VA_ARGS__); } while (0)
#define LOG_ERROR(...) do { if (::Common::g_logger) ::Common::g_logger->error(__VA_ARGS__); } while (0)
