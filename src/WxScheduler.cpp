#include "WxScheduler.h"

#include <algorithm>

#include <wx/log.h>

namespace mosaic {

class WxScheduler::OneShotTimer final : public wxTimer {
public:
  OneShotTimer(WxScheduler* owner, Task task) : owner_(owner), task_(std::move(task)) {}

  void Notify() override { owner_->OnTimerFired(this); }

  Task TakeTask() { return std::move(task_); }
  bool fired{false};

private:
  WxScheduler* owner_{nullptr};
  Task task_;
};

WxScheduler::~WxScheduler() {
  for (auto& t : timers_) t->Stop();
}

void WxScheduler::Post(Task task) {
  CallAfter([task = std::move(task)]() { task(); });
}

void WxScheduler::CallLater(std::chrono::milliseconds delay, Task task) {
  auto timer = std::make_unique<OneShotTimer>(this, std::move(task));
  const auto ms = static_cast<int>(std::max<long long>(1, delay.count()));
  if (!timer->StartOnce(ms)) {
    wxLogWarning("Unable to start a %d ms timer; running the task on the next idle cycle.", ms);
    Post(timer->TakeTask());
    return;
  }
  timers_.push_back(std::move(timer));
}

void WxScheduler::OnTimerFired(OneShotTimer* timer) {
  timer->fired = true;
  auto task = timer->TakeTask();
  // The timer object cannot be destroyed from inside its own Notify().
  CallAfter([this]() { PruneFired(); });
  if (task) task();
}

void WxScheduler::PruneFired() {
  timers_.remove_if([](const std::unique_ptr<OneShotTimer>& t) { return t->fired; });
}

}  // namespace mosaic
