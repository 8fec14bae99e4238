#include "iolat/scheduler/dispatcher.hpp"

#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "iolat/core/error.hpp"

namespace iolat {
namespace {

class ThreadPerTaskDispatcher final : public ITaskDispatcher {
 public:
  ThreadPerTaskDispatcher() = default;

  ~ThreadPerTaskDispatcher() override {
    std::unique_lock lock(mu_);
    cv_drained_.wait(lock, [this]() { return in_flight_ == 0; });
  }

  ThreadPerTaskDispatcher(const ThreadPerTaskDispatcher&) = delete;
  ThreadPerTaskDispatcher& operator=(const ThreadPerTaskDispatcher&) = delete;

  void submit(Task task) override {
    if (!task) {
      throw Error{ErrorCode::InvalidArgument, "cannot submit an empty task"};
    }
    {
      std::scoped_lock lock(mu_);
      ++in_flight_;
    }

    try {
      std::thread([this, task = std::move(task)]() { this->run(task); }).detach();
    } catch (const std::system_error& e) {
      {
        std::scoped_lock lock(mu_);
        if (--in_flight_ == 0) {
          cv_drained_.notify_all();
        }
      }
      throw Error{ErrorCode::Internal, std::format("failed to start task thread: {}", e.what())};
    }
  }

  void drain() override {
    std::exception_ptr failure;
    {
      std::unique_lock lock(mu_);
      cv_drained_.wait(lock, [this]() { return in_flight_ == 0; });
      failure = std::exchange(first_failure_, nullptr);
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  uint64_t in_flight() const override {
    std::scoped_lock lock(mu_);
    return in_flight_;
  }

  uint64_t completed() const override {
    std::scoped_lock lock(mu_);
    return completed_;
  }

 private:
  void run(const Task& task) {
    std::exception_ptr failure;
    try {
      task();
    } catch (...) {
      failure = std::current_exception();
    }
    finish(failure);
  }

  // Last touch of `this` from a task thread; notify under the lock so a
  // waiter cannot destroy the dispatcher before the notify returns.
  void finish(std::exception_ptr failure) {
    std::scoped_lock lock(mu_);
    if (failure && !first_failure_) {
      first_failure_ = std::move(failure);
    }
    --in_flight_;
    ++completed_;
    if (in_flight_ == 0) {
      cv_drained_.notify_all();
    }
  }

  mutable std::mutex mu_;
  std::condition_variable cv_drained_;

  uint64_t in_flight_{0};
  uint64_t completed_{0};
  std::exception_ptr first_failure_;
};

}  // namespace

std::unique_ptr<ITaskDispatcher> make_thread_per_task_dispatcher() {
  return std::make_unique<ThreadPerTaskDispatcher>();
}

}  // namespace iolat
