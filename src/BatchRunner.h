#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "NotificationCenter.h"
#include "Scheduler.h"
#include "util.h"

namespace mosaic {

struct BatchReport {
  std::string progressId;
  BatchOp operation{BatchOp::Copy};
  int total{0};
  int succeeded{0};
  int skipped{0};
  int attempted{0};
  // "name: message" per failed item, in processing order.
  std::vector<std::string> errors;
  BatchState state{BatchState::InFlight};
};

struct BatchSpec {
  BatchOp operation{BatchOp::Copy};
  // One display label per item; the batch size is labels.size().
  std::vector<std::string> labels;
  // Performs item `index` and reports exactly once through `done`.
  std::function<void(size_t index, Completion done)> run;
  std::function<void(const BatchReport& report)> finish;
};

// Runs the items of a batch one after another with a single progress
// record. Item failures are collected and the batch keeps going; a cancel
// request takes effect before the next item starts.
class BatchRunner final {
public:
  BatchRunner(NotificationCenter& notifications, Scheduler& scheduler);

  // Returns the progress id of the new batch.
  std::string Start(BatchSpec spec);
  // Returns false when no running batch has that id.
  bool Cancel(const std::string& progressId);

  size_t RunningCount() const { return jobs_.size(); }
  bool IsRunning(const std::string& progressId) const { return jobs_.count(progressId) != 0; }

private:
  struct Job;

  void Step(const std::shared_ptr<Job>& job);
  void ItemDone(const std::shared_ptr<Job>& job, size_t index, const OpResult& result);
  void Finish(const std::shared_ptr<Job>& job);

  NotificationCenter& notifications_;
  Scheduler& scheduler_;
  std::map<std::string, std::shared_ptr<Job>> jobs_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

// Surfaces a finished batch as one notification: success when everything
// went through, a warning quoting the first `quotedErrors` failures when some
// items failed, an error when none succeeded and info when cancelled.
void ReportBatch(NotificationCenter& notifications, const BatchReport& report, int quotedErrors,
                 const std::optional<std::string>& panelId = std::nullopt);

}  // namespace mosaic
