#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CoreSettings.h"
#include "Scheduler.h"

namespace mosaic {

struct Notification {
  std::string id;
  std::string message;
  Severity severity{Severity::Info};
  std::optional<std::string> panelId;
  bool autoClose{true};
  std::chrono::milliseconds duration{0};
};

enum class BatchOp { Copy, Move, Delete };
enum class BatchState { InFlight, Completed, PartiallyFailed, Failed, Cancelled };

struct ProgressRecord {
  std::string id;
  BatchOp operation{BatchOp::Copy};
  std::string fileName;
  int totalFiles{0};
  int currentFile{0};
  int percentage{0};
  bool isComplete{false};
  BatchState state{BatchState::InFlight};
  std::optional<std::string> error;
};

const char* SeverityName(Severity severity);
const char* BatchOpName(BatchOp op);
const char* BatchStateName(BatchState state);

// Bounded list of user-facing notifications plus the progress records of
// running and recently finished batches.
class NotificationCenter final {
public:
  static constexpr size_t kCapacity = 5;

  using Listener = std::function<void(const Notification& n)>;

  NotificationCenter(Scheduler& scheduler, const CoreSettings& settings);

  // Returns the new notification id. Error notifications never auto-close.
  std::string Notify(Severity severity, const std::string& message,
                     std::optional<std::string> panelId = std::nullopt);
  std::string Error(const std::string& message, std::optional<std::string> panelId = std::nullopt) {
    return Notify(Severity::Error, message, std::move(panelId));
  }
  std::string Warning(const std::string& message, std::optional<std::string> panelId = std::nullopt) {
    return Notify(Severity::Warning, message, std::move(panelId));
  }
  std::string Info(const std::string& message, std::optional<std::string> panelId = std::nullopt) {
    return Notify(Severity::Info, message, std::move(panelId));
  }
  std::string Success(const std::string& message, std::optional<std::string> panelId = std::nullopt) {
    return Notify(Severity::Success, message, std::move(panelId));
  }

  void Dismiss(const std::string& id);
  void ClearAll();
  void ClearPanel(const std::string& panelId);

  const std::deque<Notification>& All() const { return notifications_; }
  std::vector<Notification> VisibleFor(const std::string& panelId) const;

  void BindNotified(Listener listener) { listener_ = std::move(listener); }

  std::string BeginProgress(BatchOp op, int totalFiles);
  void UpdateProgress(const std::string& id, const std::string& fileName, int currentFile);
  // Marks the record terminal and schedules its removal.
  void FinishProgress(const std::string& id, BatchState state,
                      std::optional<std::string> error = std::nullopt);
  void DismissProgress(const std::string& id);
  void ClearCompletedProgress();

  const ProgressRecord* FindProgress(const std::string& id) const;
  const std::vector<ProgressRecord>& Progress() const { return progress_; }

private:
  Scheduler& scheduler_;
  const CoreSettings& settings_;
  std::deque<Notification> notifications_;
  std::vector<ProgressRecord> progress_;
  Listener listener_;
  int nextNotification_{1};
  int nextProgress_{1};
  // Expired when this center is destroyed so pending timers become no-ops.
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace mosaic
