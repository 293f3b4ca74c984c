#include "BatchRunner.h"

#include <exception>

#include <wx/log.h>

namespace mosaic {

struct BatchRunner::Job {
  BatchSpec spec;
  BatchReport report;
  size_t next{0};
  bool cancelRequested{false};
};

namespace {

const char* PastTense(BatchOp op) {
  switch (op) {
    case BatchOp::Copy: return "Copied";
    case BatchOp::Move: return "Moved";
    case BatchOp::Delete: return "Deleted";
  }
  return "Processed";
}

std::string Items(int n) { return std::to_string(n) + (n == 1 ? " item" : " items"); }

std::string QuoteErrors(const std::vector<std::string>& errors, int limit) {
  std::string out;
  int shown = 0;
  for (const auto& e : errors) {
    if (shown >= limit) break;
    out += shown == 0 ? "" : "; ";
    out += e;
    shown++;
  }
  const int rest = static_cast<int>(errors.size()) - shown;
  if (rest > 0) out += wxString::Format(" (and %d more)", rest).ToStdString();
  return out;
}

}  // namespace

BatchRunner::BatchRunner(NotificationCenter& notifications, Scheduler& scheduler)
    : notifications_(notifications), scheduler_(scheduler) {}

std::string BatchRunner::Start(BatchSpec spec) {
  auto job = std::make_shared<Job>();
  const int total = static_cast<int>(spec.labels.size());
  job->report.progressId = notifications_.BeginProgress(spec.operation, total);
  job->report.operation = spec.operation;
  job->report.total = total;
  job->spec = std::move(spec);

  const auto id = job->report.progressId;
  jobs_[id] = job;
  wxLogMessage("Started %s batch %s (%d items)", BatchOpName(job->report.operation), id, total);

  std::weak_ptr<bool> alive = alive_;
  scheduler_.Post([this, alive, job]() {
    if (alive.expired()) return;
    Step(job);
  });
  return id;
}

bool BatchRunner::Cancel(const std::string& progressId) {
  const auto it = jobs_.find(progressId);
  if (it == jobs_.end()) return false;
  if (!it->second->cancelRequested) wxLogMessage("Cancel requested for %s", progressId);
  it->second->cancelRequested = true;
  return true;
}

void BatchRunner::Step(const std::shared_ptr<Job>& job) {
  const auto total = job->spec.labels.size();
  if (job->next >= total || job->cancelRequested) {
    Finish(job);
    return;
  }

  const auto index = job->next;
  auto settled = std::make_shared<bool>(false);
  std::weak_ptr<bool> alive = alive_;
  Completion itemDone = [this, alive, job, index, settled](const OpResult& result) {
    if (*settled || alive.expired()) return;
    *settled = true;
    ItemDone(job, index, result);
  };

  try {
    job->spec.run(index, itemDone);
  } catch (const std::exception& e) {
    wxLogError("Item %s of %s threw: %s", job->spec.labels[index], job->report.progressId, e.what());
    itemDone(ErrorResult(ErrorKind::Runtime, wxString::FromUTF8(e.what())));
  }
}

void BatchRunner::ItemDone(const std::shared_ptr<Job>& job, size_t index, const OpResult& result) {
  auto& r = job->report;
  const auto& label = job->spec.labels[index];
  r.attempted++;

  switch (result.code) {
    case OpCode::Ok:
      r.succeeded++;
      break;
    case OpCode::Skipped:
    case OpCode::Cancelled:
      r.skipped++;
      break;
    case OpCode::Error:
      wxLogWarning("%s failed for %s: %s", BatchOpName(r.operation), label, result.message);
      r.errors.push_back(label + ": " + result.message.ToStdString());
      break;
  }

  job->next = index + 1;
  notifications_.UpdateProgress(r.progressId, label, static_cast<int>(job->next));

  // The next item starts from the event loop so cancel requests get a turn.
  std::weak_ptr<bool> alive = alive_;
  scheduler_.Post([this, alive, job]() {
    if (alive.expired()) return;
    Step(job);
  });
}

void BatchRunner::Finish(const std::shared_ptr<Job>& job) {
  auto& r = job->report;
  if (job->cancelRequested && r.attempted < r.total) {
    r.state = BatchState::Cancelled;
  } else if (r.errors.empty()) {
    r.state = BatchState::Completed;
  } else if (r.succeeded > 0) {
    r.state = BatchState::PartiallyFailed;
  } else {
    r.state = BatchState::Failed;
  }

  std::optional<std::string> error;
  if (!r.errors.empty()) error = r.errors.front();
  notifications_.FinishProgress(r.progressId, r.state, error);
  jobs_.erase(r.progressId);

  wxLogMessage("Batch %s %s: %d succeeded, %d skipped, %d failed", r.progressId,
               BatchStateName(r.state), r.succeeded, r.skipped, static_cast<int>(r.errors.size()));
  if (job->spec.finish) job->spec.finish(r);
}

void ReportBatch(NotificationCenter& notifications, const BatchReport& report, int quotedErrors,
                 const std::optional<std::string>& panelId) {
  const std::string verb = PastTense(report.operation);
  const std::string op = BatchOpName(report.operation);
  const int failed = static_cast<int>(report.errors.size());

  switch (report.state) {
    case BatchState::Completed: {
      if (report.succeeded == 0) {
        notifications.Info("Nothing to " + op + ": " + Items(report.skipped) + " skipped", panelId);
        return;
      }
      auto msg = verb + " " + Items(report.succeeded);
      if (report.skipped > 0) msg += ", skipped " + std::to_string(report.skipped);
      notifications.Success(msg, panelId);
      return;
    }
    case BatchState::PartiallyFailed: {
      notifications.Warning(wxString::Format("%s %d of %d items, %d failed: %s", verb,
                                             report.succeeded, report.total, failed,
                                             QuoteErrors(report.errors, quotedErrors))
                                .ToStdString(),
                            panelId);
      return;
    }
    case BatchState::Failed: {
      notifications.Error(wxString::Format("Failed to %s %s: %s", op, Items(report.total),
                                           QuoteErrors(report.errors, quotedErrors))
                              .ToStdString(),
                          panelId);
      return;
    }
    case BatchState::Cancelled: {
      notifications.Info(wxString::Format("Cancelled %s after %d of %d items", op,
                                          report.attempted, report.total)
                             .ToStdString(),
                         panelId);
      return;
    }
    case BatchState::InFlight:
      return;
  }
}

}  // namespace mosaic
