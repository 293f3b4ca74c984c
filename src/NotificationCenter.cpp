#include "NotificationCenter.h"

#include <algorithm>

#include <wx/log.h>

namespace mosaic {

const char* SeverityName(Severity severity) {
  switch (severity) {
    case Severity::Error: return "error";
    case Severity::Warning: return "warning";
    case Severity::Info: return "info";
    case Severity::Success: return "success";
  }
  return "info";
}

const char* BatchOpName(BatchOp op) {
  switch (op) {
    case BatchOp::Copy: return "copy";
    case BatchOp::Move: return "move";
    case BatchOp::Delete: return "delete";
  }
  return "copy";
}

const char* BatchStateName(BatchState state) {
  switch (state) {
    case BatchState::InFlight: return "in-flight";
    case BatchState::Completed: return "completed";
    case BatchState::PartiallyFailed: return "partially-failed";
    case BatchState::Failed: return "failed";
    case BatchState::Cancelled: return "cancelled";
  }
  return "in-flight";
}

NotificationCenter::NotificationCenter(Scheduler& scheduler, const CoreSettings& settings)
    : scheduler_(scheduler), settings_(settings) {}

std::string NotificationCenter::Notify(Severity severity, const std::string& message,
                                       std::optional<std::string> panelId) {
  Notification n{
      .id = "notification-" + std::to_string(nextNotification_++),
      .message = message,
      .severity = severity,
      .panelId = std::move(panelId),
      .autoClose = severity != Severity::Error,
      .duration = settings_.DurationFor(severity),
  };

  wxLogDebug("Notification %s [%s]: %s", n.id, SeverityName(severity), message);
  notifications_.push_back(n);
  while (notifications_.size() > kCapacity) notifications_.pop_front();

  if (n.autoClose) {
    std::weak_ptr<bool> alive = alive_;
    const auto id = n.id;
    scheduler_.CallLater(n.duration, [this, alive, id]() {
      if (alive.expired()) return;
      Dismiss(id);
    });
  }

  if (listener_) listener_(n);
  return n.id;
}

void NotificationCenter::Dismiss(const std::string& id) {
  notifications_.erase(std::remove_if(notifications_.begin(), notifications_.end(),
                                      [&](const Notification& n) { return n.id == id; }),
                       notifications_.end());
}

void NotificationCenter::ClearAll() { notifications_.clear(); }

void NotificationCenter::ClearPanel(const std::string& panelId) {
  notifications_.erase(std::remove_if(notifications_.begin(), notifications_.end(),
                                      [&](const Notification& n) { return n.panelId == panelId; }),
                       notifications_.end());
}

std::vector<Notification> NotificationCenter::VisibleFor(const std::string& panelId) const {
  std::vector<Notification> out;
  for (const auto& n : notifications_) {
    if (!n.panelId || *n.panelId == panelId) out.push_back(n);
  }
  return out;
}

std::string NotificationCenter::BeginProgress(BatchOp op, int totalFiles) {
  ProgressRecord r{
      .id = std::string(BatchOpName(op)) + "-" + std::to_string(nextProgress_++),
      .operation = op,
      .totalFiles = totalFiles,
  };
  progress_.push_back(r);
  return r.id;
}

void NotificationCenter::UpdateProgress(const std::string& id, const std::string& fileName,
                                        int currentFile) {
  const auto it = std::find_if(progress_.begin(), progress_.end(),
                               [&](const ProgressRecord& r) { return r.id == id; });
  if (it == progress_.end() || it->isComplete) return;
  it->fileName = fileName;
  it->currentFile = currentFile;
  it->percentage = it->totalFiles > 0 ? (100 * currentFile) / it->totalFiles : 100;
}

void NotificationCenter::FinishProgress(const std::string& id, BatchState state,
                                        std::optional<std::string> error) {
  const auto it = std::find_if(progress_.begin(), progress_.end(),
                               [&](const ProgressRecord& r) { return r.id == id; });
  if (it == progress_.end()) return;
  it->isComplete = true;
  it->state = state;
  it->error = std::move(error);
  if (state == BatchState::Completed) it->percentage = 100;

  std::weak_ptr<bool> alive = alive_;
  scheduler_.CallLater(settings_.progressRemovalDelay, [this, alive, id]() {
    if (alive.expired()) return;
    DismissProgress(id);
  });
}

void NotificationCenter::DismissProgress(const std::string& id) {
  progress_.erase(std::remove_if(progress_.begin(), progress_.end(),
                                 [&](const ProgressRecord& r) { return r.id == id; }),
                  progress_.end());
}

void NotificationCenter::ClearCompletedProgress() {
  progress_.erase(std::remove_if(progress_.begin(), progress_.end(),
                                 [](const ProgressRecord& r) { return r.isComplete; }),
                  progress_.end());
}

const ProgressRecord* NotificationCenter::FindProgress(const std::string& id) const {
  const auto it = std::find_if(progress_.begin(), progress_.end(),
                               [&](const ProgressRecord& r) { return r.id == id; });
  return it == progress_.end() ? nullptr : &*it;
}

}  // namespace mosaic
