#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace fslite {
namespace utils {

// Start time of a submitted task, set by the worker that picks it up
struct TaskClock {
  std::mutex mutex;
  std::condition_variable started_cv;
  bool started{false};
  std::chrono::steady_clock::time_point start;
};

// Handle to one submitted task. The timeout counts from the moment a worker
// starts the task, so time spent queued behind other tasks is never charged to it.
template <typename Result>
class IoTask {
public:
  IoTask() = default;
  IoTask(std::future<Result> result, std::shared_ptr<TaskClock> clock, std::chrono::milliseconds timeout)
    : result_(std::move(result))
    , clock_(std::move(clock))
    , timeout_(timeout) {}

  bool valid() const { return result_.valid(); }

  // Blocks until the task has started, then at most timeout beyond its start
  std::future_status wait_for_result() {
    std::chrono::steady_clock::time_point start;
    {
      std::unique_lock<std::mutex> lock(clock_->mutex);
      clock_->started_cv.wait(lock, [this]() { return clock_->started; });
      start = clock_->start;
    }
    return result_.wait_until(start + timeout_);
  }

  // Blocks until the task has finished, however long it runs
  void settle() {
    if (result_.valid()) {
      result_.wait();
    }
  }

  Result get() { return result_.get(); }

private:
  std::future<Result> result_;
  std::shared_ptr<TaskClock> clock_;
  std::chrono::milliseconds timeout_{0};
};

// Worker pool for per-fragment storage I/O. The pool is joined on
// destruction, so tasks still running at that point finish first.
class IoExecutor {
public:
  // Delete copy constructor and assignment operator
  IoExecutor(const IoExecutor&) = delete;
  IoExecutor& operator=(const IoExecutor&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  IoExecutor(std::size_t threads, std::chrono::milliseconds timeout);
  ~IoExecutor();


  // ---- TASK SUBMISSION ----
  // Runs fn on the pool. Exceptions thrown by fn are delivered through the task.
  template <typename Fn>
  IoTask<std::invoke_result_t<Fn>> submit(Fn fn) {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto clock = std::make_shared<TaskClock>();
    std::future<Result> result = task->get_future();

    boost::asio::post(pool_, [task, clock]() {
      {
        std::lock_guard<std::mutex> lock(clock->mutex);
        clock->start = std::chrono::steady_clock::now();
        clock->started = true;
      }
      clock->started_cv.notify_all();
      (*task)();
    });

    return IoTask<Result>(std::move(result), std::move(clock), timeout_);
  }


  // ---- GETTERS ----
  std::chrono::milliseconds timeout() const { return timeout_; }
  std::size_t threads() const { return threads_; }

private:
  // ---- PARAMETERS ----
  std::size_t threads_;
  std::chrono::milliseconds timeout_;
  boost::asio::thread_pool pool_;
};

} // namespace utils
} // namespace fslite
