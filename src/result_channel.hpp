#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>

// Fan-in point between transfer workers and the thread that dispatched
// them. Sized for one result per task, so a worker reporting its outcome
// never waits on the reader. A null exception_ptr is a success.
class ResultChannel {
public:
  explicit ResultChannel(std::size_t capacity) : capacity_(capacity) {}

  ResultChannel(const ResultChannel&) = delete;
  ResultChannel& operator=(const ResultChannel&) = delete;

  void push(std::exception_ptr result) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(pushed_ >= capacity_) {
        throw std::logic_error("result channel over capacity");
      }
      ++pushed_;
      results_.push_back(std::move(result));
    }
    cv_.notify_one();
  }

  std::exception_ptr pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return !results_.empty(); });
    auto result = std::move(results_.front());
    results_.pop_front();
    return result;
  }

private:
  const std::size_t capacity_;
  std::size_t pushed_ = 0;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::exception_ptr> results_;
};
