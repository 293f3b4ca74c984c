#pragma once

#include <chrono>
#include <functional>

namespace mosaic {

// Defers work onto the core thread. Callbacks never run re-entrantly from
// inside Post or CallLater.
class Scheduler {
public:
  using Task = std::function<void()>;

  virtual ~Scheduler() = default;

  virtual void Post(Task task) = 0;
  virtual void CallLater(std::chrono::milliseconds delay, Task task) = 0;
};

}  // namespace mosaic
