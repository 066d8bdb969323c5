// logging.cpp - async file logger backed by a bounded Vyukov MPMC queue

#include "logging.h"
#include "time_utils.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>

namespace Common {

// ---------- Runtime-sized Vyukov MPMC bounded queue ----------
class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  MPMCQueue(const MPMCQueue&) = delete;
  MPMCQueue& operator=(const MPMCQueue&) = delete;
  MPMCQueue(MPMCQueue&&) = delete;
  MPMCQueue& operator=(MPMCQueue&&) = delete;

  struct LogRecord {
    uint64_t wall_nanos{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  explicit MPMCQueue(std::size_t capacity)
  : size_(std::min(round_up_pow2(capacity), MAX_CAPACITY)),
    mask_(size_ - 1),
    buffer_(nullptr) {
    void* mem = std::aligned_alloc(CACHE_LINE_SIZE, size_ * sizeof(Cell));
    if (!mem) {
      throw std::bad_alloc();
    }
    buffer_ = static_cast<Cell*>(mem);
    for (std::size_t i = 0; i < size_; ++i) {
      new (&buffer_[i]) Cell();
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  ~MPMCQueue() {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].~Cell();
    }
    std::free(buffer_);
  }

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t round_up_pow2(std::size_t n) {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> head_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  Cell* buffer_;
};

// ---------- Async writer ----------
class AsyncLoggerImpl {
public:
  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl(AsyncLoggerImpl&&) = delete;
  AsyncLoggerImpl& operator=(AsyncLoggerImpl&&) = delete;

  AsyncLoggerImpl(const char* path, std::size_t capacity)
  : file_(nullptr),
    queue_(capacity),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::strncpy(path_, path, sizeof(path_) - 1);
    path_[sizeof(path_) - 1] = '\0';

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      if (ec) {
        std::fprintf(stderr, "Logger: cannot create %s: %s\n",
                     p.parent_path().c_str(), ec.message().c_str());
      }
    }

    file_ = std::fopen(path_, "a");
    if (!file_) {
      // Records are still drained and counted as dropped
      std::fprintf(stderr, "Logger: cannot open %s: %s\n", path_, std::strerror(errno));
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool log(uint16_t level, const char* msg, std::size_t len) noexcept {
    MPMCQueue::LogRecord rec{};
    rec.wall_nanos = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (!queue_.enqueue(rec)) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    cv_.notify_one();
    return true;
  }

  uint64_t getDrops() const noexcept { return drops_.load(std::memory_order_relaxed); }
  uint64_t getWritten() const noexcept { return written_.load(std::memory_order_relaxed); }
  uint64_t getBytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  static constexpr std::size_t BATCH_SIZE = 128;

  void writerLoop() {
    MPMCQueue::LogRecord batch[BATCH_SIZE];

    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(5), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
      }

      std::size_t n = 0;
      while (n < BATCH_SIZE && queue_.dequeue(batch[n])) {
        ++n;
      }
      if (n == 0) {
        continue;
      }
      if (!file_) {
        drops_.fetch_add(n, std::memory_order_relaxed);
        continue;
      }

      for (std::size_t i = 0; i < n; ++i) {
        const auto& rec = batch[i];
        int written = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
            static_cast<unsigned long long>(rec.wall_nanos / 1000000000ULL),
            static_cast<unsigned long long>(rec.wall_nanos % 1000000000ULL),
            levelToString(rec.level),
            rec.thread_id,
            rec.msg);
        if (written > 0) {
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(written), std::memory_order_relaxed);
        }
      }
      if (queue_.empty()) {
        std::fflush(file_);
      }
    }

    if (file_) {
      std::fflush(file_);
    }
  }

  static const char* levelToString(uint16_t level) noexcept {
    switch (level) {
      case Logger::DEBUG: return "DEBUG";
      case Logger::INFO:  return "INFO ";
      case Logger::WARN:  return "WARN ";
      case Logger::ERROR: return "ERROR";
      default: return "UNKN ";
    }
  }

  char path_[512];
  FILE* file_;
  MPMCQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> drops_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> written_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> bytes_{0};
};

// Global logger state
static AsyncLoggerImpl* g_logger_impl = nullptr;
static std::mutex g_logger_mutex;

Logger* g_logger = nullptr;

Logger::Logger(const char* filename) noexcept {
  if (filename) {
    std::strncpy(filename_, filename, sizeof(filename_) - 1);
    filename_[sizeof(filename_) - 1] = '\0';
  } else {
    filename_[0] = '\0';
  }
}

void Logger::submit(Level level, const char* msg, size_t len) noexcept {
  // g_logger_impl is only replaced under g_logger_mutex while no producer runs
  if (g_logger_impl) {
    g_logger_impl->log(static_cast<uint16_t>(level), msg, len);
  }
}

Logger::Stats Logger::getStats() const noexcept {
  Stats stats;
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_impl) {
    stats.messages_written = g_logger_impl->getWritten();
    stats.messages_dropped = g_logger_impl->getDrops();
    stats.bytes_written = g_logger_impl->getBytes();
  }
  return stats;
}

static void destroyLocked() {
  if (g_logger) {
    g_logger->~Logger();
    g_logger = nullptr;
  }
  if (g_logger_impl) {
    g_logger_impl->~AsyncLoggerImpl();
    g_logger_impl = nullptr;
  }
}

void initLogging(const char* log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  destroyLocked();

  // Static storage, one logger per process
  alignas(AsyncLoggerImpl) static char impl_storage[sizeof(AsyncLoggerImpl)];
  alignas(Logger) static char logger_storage[sizeof(Logger)];

  g_logger_impl = new (impl_storage) AsyncLoggerImpl(log_file, 4096);
  g_logger = new (logger_storage) Logger(log_file);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  destroyLocked();
}

bool parseLogLevel(const char* name, Logger::Level* level) noexcept {
  if (!name || !level) return false;
  if (std::strcmp(name, "debug") == 0) { *level = Logger::DEBUG; return true; }
  if (std::strcmp(name, "info") == 0)  { *level = Logger::INFO;  return true; }
  if (std::strcmp(name, "warn") == 0)  { *level = Logger::WARN;  return true; }
  if (std::strcmp(name, "error") == 0) { *level = Logger::ERROR; return true; }
  return false;
}

} // namespace Common
