#pragma once

#include <chrono>
#include <string>

#include "Model.h"

class wxConfigBase;

namespace mosaic {

enum class Severity { Error, Warning, Info, Success };

struct CoreSettings {
  GridLayout defaultLayout{.rows = 1, .cols = 2, .name = "1x2 (Classic Dual)"};
  std::string defaultPath{"/"};
  std::chrono::milliseconds successDuration{3000};
  std::chrono::milliseconds infoDuration{4000};
  std::chrono::milliseconds warningDuration{5000};
  std::chrono::milliseconds progressRemovalDelay{3000};
  // How many item errors a partial-failure summary quotes.
  int summaryErrorCount{3};

  std::chrono::milliseconds DurationFor(Severity severity) const;
};

// Missing or out-of-range keys keep their defaults.
CoreSettings LoadCoreSettings(wxConfigBase& cfg);
void SaveCoreSettings(wxConfigBase& cfg, const CoreSettings& settings);

}  // namespace mosaic
