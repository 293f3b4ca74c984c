#pragma once

#include <list>
#include <memory>

#include <wx/event.h>
#include <wx/timer.h>

#include "Scheduler.h"

namespace mosaic {

// Scheduler backed by the wx event loop: Post goes through CallAfter and
// CallLater arms a one-shot wxTimer.
class WxScheduler final : public wxEvtHandler, public Scheduler {
public:
  WxScheduler() = default;
  ~WxScheduler() override;

  void Post(Task task) override;
  void CallLater(std::chrono::milliseconds delay, Task task) override;

  size_t PendingTimers() const { return timers_.size(); }

private:
  class OneShotTimer;

  void OnTimerFired(OneShotTimer* timer);
  void PruneFired();

  std::list<std::unique_ptr<OneShotTimer>> timers_;
};

}  // namespace mosaic
