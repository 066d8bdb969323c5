#pragma once

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>

#include "macros.h"

namespace Common {

  /// Name the calling thread (truncated to the 15 chars pthread allows)
  inline auto setThreadName(const char* name) noexcept -> bool {
    char truncated_name[16];
    std::strncpy(truncated_name, name, 15);
    truncated_name[15] = '\0';
    return pthread_setname_np(pthread_self(), truncated_name) == 0;
  }

  /// Resolve a configured worker count: 0 means one per hardware thread
  inline auto resolveWorkerCount(size_t requested) noexcept -> size_t {
    if (requested > 0) {
      return requested;
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
  }

  /// Parse a decimal worker count; rejects signs, junk and values above UINT32_MAX
  inline auto parseWorkerCount(const char* text, uint32_t* out) noexcept -> bool {
    if (text == nullptr || *text < '0' || *text > '9') {
      return false;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long n = std::strtoull(text, &end, 10);
    if (*end != '\0' || errno == ERANGE || n > UINT32_MAX) {
      return false;
    }
    *out = static_cast<uint32_t>(n);
    return true;
  }

  /// Fixed-size pool of pre-created worker threads draining a shared task deque
  class ThreadPool {
  public:
    static constexpr size_t MAX_THREADS = 64;

    explicit ThreadPool(size_t num_workers, const char* name = "ui_audit_wrk")
      : num_workers_(num_workers == 0 ? 1 : (num_workers > MAX_THREADS ? MAX_THREADS : num_workers)),
        tasks_{}, queue_mutex_{}, condition_{}, stopped_{false} {
      for (size_t i = 0; i < num_workers_; ++i) {
        workers_[i] = std::thread([this, name] {
          setThreadName(name);

          while (true) {
            std::function<void()> task;

            {
              std::unique_lock<std::mutex> lock(queue_mutex_);
              condition_.wait(lock, [this] {
                return stopped_.load(std::memory_order_acquire) || !tasks_.empty();
              });

              if (stopped_.load(std::memory_order_acquire) && tasks_.empty()) {
                break;
              }

              task = std::move(tasks_.front());
              tasks_.pop_front();
            }

            if (task) {
              task();
            }
          }
        });
      }
    }

    ~ThreadPool() {
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stopped_.store(true, std::memory_order_release);
      }
      condition_.notify_all();

      for (size_t i = 0; i < num_workers_; ++i) {
        if (workers_[i].joinable()) {
          workers_[i].join();
        }
      }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
      using R = std::invoke_result_t<F, Args...>;

      auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::forward<F>(f),
         args_tuple = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
          return std::apply([&fn](auto&&... captured_args) -> R {
            return std::invoke(std::move(fn), std::forward<decltype(captured_args)>(captured_args)...);
          }, std::move(args_tuple));
        }
      );

      auto res = task->get_future();

      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
          std::promise<R> error_promise;
          error_promise.set_exception(std::make_exception_ptr(
            std::runtime_error("enqueue on stopped ThreadPool")));
          return error_promise.get_future();
        }

        tasks_.emplace_back([task]() { (*task)(); });
      }

      condition_.notify_one();
      return res;
    }

    [[nodiscard]] auto size() const noexcept -> size_t { return num_workers_; }

  private:
    std::thread workers_[MAX_THREADS];
    size_t num_workers_;
    std::deque<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopped_;
  };
}
