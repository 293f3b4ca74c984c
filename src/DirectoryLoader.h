#pragma once

#include <map>
#include <string>

#include "PanelStore.h"
#include "StorageBackend.h"
#include "util.h"

namespace mosaic {

// Resolves, lists and applies directory contents to panels. Each panel has a
// load ticket; a completion whose ticket is no longer current is dropped so
// a slow listing cannot overwrite a newer navigation.
class DirectoryLoader final {
public:
  DirectoryLoader(PanelStore& store, StorageBackend& backend);

  // Resolves `input` (path or alias), lists it and navigates the panel there.
  void Load(const std::string& panelId, const std::string& input, Completion done = {});
  // Re-lists the panel's current path without touching its selection.
  void Refresh(const std::string& panelId, Completion done = {});
  void RefreshPanelsShowing(const std::string& dir);

  int InFlight() const { return inFlight_; }

private:
  unsigned NextTicket(const std::string& panelId);
  unsigned CurrentTicket(const std::string& panelId) const;
  bool IsCurrent(const std::string& panelId, unsigned ticket) const;

  PanelStore& store_;
  StorageBackend& backend_;
  std::map<std::string, unsigned> tickets_;
  int inFlight_{0};
};

}  // namespace mosaic
