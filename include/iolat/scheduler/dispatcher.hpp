#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace iolat {

using Task = std::function<void()>;

// Runs every submitted task concurrently and independently of the caller.
// There is no queue and no capacity limit: submit() never waits for earlier
// tasks, so offered load is decoupled from task completion.
class ITaskDispatcher {
 public:
  virtual ~ITaskDispatcher() = default;

  virtual void submit(Task task) = 0;

  // Blocks until every submitted task has finished, then rethrows the first
  // exception raised by any of them.
  virtual void drain() = 0;

  virtual uint64_t in_flight() const = 0;
  virtual uint64_t completed() const = 0;
};

// One detached thread per task. The destructor waits for in-flight tasks.
std::unique_ptr<ITaskDispatcher> make_thread_per_task_dispatcher();

}  // namespace iolat
