#include "CoreSettings.h"

#include <wx/config.h>
#include <wx/log.h>

#include "PanelStore.h"

namespace mosaic {

namespace {
constexpr const char* kRowsKey = "/core/layout/rows";
constexpr const char* kColsKey = "/core/layout/cols";
constexpr const char* kPathKey = "/core/defaultPath";
constexpr const char* kSuccessKey = "/core/notifications/successMs";
constexpr const char* kInfoKey = "/core/notifications/infoMs";
constexpr const char* kWarningKey = "/core/notifications/warningMs";
constexpr const char* kProgressKey = "/core/progress/removalDelayMs";
constexpr const char* kSummaryKey = "/core/progress/summaryErrorCount";

void ReadDuration(wxConfigBase& cfg, const char* key, std::chrono::milliseconds* out) {
  long value = 0;
  if (!cfg.Read(key, &value)) return;
  if (value <= 0) {
    wxLogWarning("Ignoring non-positive duration %ld for %s", value, key);
    return;
  }
  *out = std::chrono::milliseconds(value);
}
}  // namespace

std::chrono::milliseconds CoreSettings::DurationFor(Severity severity) const {
  switch (severity) {
    case Severity::Success: return successDuration;
    case Severity::Info: return infoDuration;
    case Severity::Warning: return warningDuration;
    case Severity::Error: return std::chrono::milliseconds(0);
  }
  return infoDuration;
}

CoreSettings LoadCoreSettings(wxConfigBase& cfg) {
  CoreSettings s;

  long rows = s.defaultLayout.rows;
  long cols = s.defaultLayout.cols;
  cfg.Read(kRowsKey, &rows);
  cfg.Read(kColsKey, &cols);
  if (rows >= 1 && cols >= 1) {
    s.defaultLayout = {.rows = static_cast<int>(rows),
                       .cols = static_cast<int>(cols),
                       .name = LayoutName(static_cast<int>(rows), static_cast<int>(cols))};
  } else {
    wxLogWarning("Ignoring invalid default layout %ldx%ld", rows, cols);
  }

  wxString path;
  if (cfg.Read(kPathKey, &path) && !path.empty()) s.defaultPath = path.ToStdString();

  ReadDuration(cfg, kSuccessKey, &s.successDuration);
  ReadDuration(cfg, kInfoKey, &s.infoDuration);
  ReadDuration(cfg, kWarningKey, &s.warningDuration);
  ReadDuration(cfg, kProgressKey, &s.progressRemovalDelay);

  long summary = s.summaryErrorCount;
  if (cfg.Read(kSummaryKey, &summary) && summary >= 0) s.summaryErrorCount = static_cast<int>(summary);

  return s;
}

void SaveCoreSettings(wxConfigBase& cfg, const CoreSettings& settings) {
  cfg.Write(kRowsKey, static_cast<long>(settings.defaultLayout.rows));
  cfg.Write(kColsKey, static_cast<long>(settings.defaultLayout.cols));
  cfg.Write(kPathKey, wxString::FromUTF8(settings.defaultPath));
  cfg.Write(kSuccessKey, static_cast<long>(settings.successDuration.count()));
  cfg.Write(kInfoKey, static_cast<long>(settings.infoDuration.count()));
  cfg.Write(kWarningKey, static_cast<long>(settings.warningDuration.count()));
  cfg.Write(kProgressKey, static_cast<long>(settings.progressRemovalDelay.count()));
  cfg.Write(kSummaryKey, static_cast<long>(settings.summaryErrorCount));
  cfg.Flush();
}

}  // namespace mosaic
