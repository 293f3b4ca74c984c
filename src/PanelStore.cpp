#include "PanelStore.h"

#include <algorithm>

#include <wx/log.h>

#include "util.h"

namespace mosaic {

namespace {

bool IsHidden(const FileInfo& e) { return !e.name.empty() && e.name[0] == '.'; }

const char* TypeKey(const FileInfo& e) {
  switch (e.type) {
    case FileType::Directory: return "dir";
    case FileType::Symlink: return "link";
    case FileType::File: return "file";
  }
  return "file";
}

}  // namespace

PanelStore::PanelStore(const GridLayout& initial, const std::string& initialPath)
    : defaultPath_(initialPath.empty() ? "/" : initialPath) {
  if (!SetGridLayout(initial)) {
    SetGridLayout({.rows = 1, .cols = 2, .name = LayoutName(1, 2)});
  }
  if (!order_.empty()) activePanelId_ = order_.front();
}

bool PanelStore::SetGridLayout(const GridLayout& layout) {
  const int required = layout.Cells();
  if (layout.rows < 1 || layout.cols < 1 || required < 1) {
    wxLogWarning("Rejected grid layout %dx%d", layout.rows, layout.cols);
    return false;
  }

  while (static_cast<int>(order_.size()) < required) {
    // Ids follow the slot index so a re-grown grid reuses "panel-3" etc.
    Panel p;
    p.id = "panel-" + std::to_string(order_.size() + 1);
    p.currentPath = defaultPath_;
    panels_[p.id] = p;
    order_.push_back(p.id);
  }

  while (static_cast<int>(order_.size()) > required) {
    const auto removed = order_.back();
    order_.pop_back();
    panels_.erase(removed);
    if (drag_.isDragging && drag_.sourcePanelId == removed) EndDrag();
  }

  if (activePanelId_ && panels_.count(*activePanelId_) == 0) {
    activePanelId_ = order_.empty() ? std::nullopt : std::optional<std::string>(order_.front());
  }

  layout_ = layout;
  if (layout_.name.empty()) layout_.name = LayoutName(layout.rows, layout.cols);
  wxLogDebug("Grid layout set to %s (%d panels)", layout_.name, required);
  return true;
}

void PanelStore::SetActivePanel(const std::string& panelId) {
  if (panels_.count(panelId) == 0) return;
  activePanelId_ = panelId;
}

Panel* PanelStore::Mutable(const std::string& panelId) {
  const auto it = panels_.find(panelId);
  return it == panels_.end() ? nullptr : &it->second;
}

const Panel* PanelStore::GetPanel(const std::string& panelId) const {
  const auto it = panels_.find(panelId);
  return it == panels_.end() ? nullptr : &it->second;
}

void PanelStore::NavigateToPath(const std::string& panelId, const std::string& path) {
  auto* p = Mutable(panelId);
  if (!p) return;
  p->currentPath = path;
  p->selectedFiles.clear();
}

void PanelStore::SetFiles(const std::string& panelId, std::vector<FileInfo> files) {
  auto* p = Mutable(panelId);
  if (!p) return;
  p->files = std::move(files);
  p->isLoading = false;
  p->error.reset();
}

void PanelStore::SetLoading(const std::string& panelId, bool loading) {
  if (auto* p = Mutable(panelId)) p->isLoading = loading;
}

void PanelStore::SetError(const std::string& panelId, const std::string& message) {
  auto* p = Mutable(panelId);
  if (!p) return;
  p->error = message;
  p->isLoading = false;
}

void PanelStore::SelectFiles(const std::string& panelId, const std::vector<std::string>& names,
                             bool toggle) {
  auto* p = Mutable(panelId);
  if (!p) return;
  if (!toggle) {
    p->selectedFiles = std::set<std::string>(names.begin(), names.end());
    return;
  }
  for (const auto& name : names) {
    if (p->selectedFiles.erase(name) == 0) p->selectedFiles.insert(name);
  }
}

void PanelStore::SetViewMode(const std::string& panelId, ViewMode mode) {
  if (auto* p = Mutable(panelId)) p->viewMode = mode;
}

void PanelStore::SetSorting(const std::string& panelId, SortBy sortBy,
                            std::optional<SortOrder> order) {
  auto* p = Mutable(panelId);
  if (!p) return;
  if (order) {
    p->sortOrder = *order;
  } else if (p->sortBy == sortBy) {
    p->sortOrder = p->sortOrder == SortOrder::Asc ? SortOrder::Desc : SortOrder::Asc;
  } else {
    p->sortOrder = SortOrder::Asc;
  }
  p->sortBy = sortBy;
}

void PanelStore::SetAddressBarActive(const std::string& panelId, bool active) {
  if (auto* p = Mutable(panelId)) p->isAddressBarActive = active;
}

std::uint64_t PanelStore::StageClipboard(std::vector<FileInfo> files, ClipboardOp op,
                                         const std::string& sourcePanelId) {
  if (files.empty() || op == ClipboardOp::None) {
    ClearClipboard();
    return clipboard_.stamp;
  }
  clipboard_ = ClipboardState{
      .hasFiles = true,
      .files = std::move(files),
      .operation = op,
      .sourcePanelId = sourcePanelId,
      .stamp = nextStamp_++,
  };
  return clipboard_.stamp;
}

void PanelStore::ClearClipboard() {
  const auto stamp = clipboard_.stamp;
  clipboard_ = ClipboardState{};
  clipboard_.stamp = stamp;
}

void PanelStore::BeginDrag(std::vector<std::string> names, const std::string& sourcePanelId,
                           TransferOp op) {
  drag_ = DragState{
      .isDragging = true,
      .draggedFiles = std::move(names),
      .sourcePanelId = sourcePanelId,
      .operation = op,
  };
}

void PanelStore::SetDragOperation(TransferOp op) {
  if (drag_.isDragging) drag_.operation = op;
}

void PanelStore::EndDrag() { drag_ = DragState{}; }

const std::vector<GridLayout>& PanelStore::PresetLayouts() {
  static const std::vector<GridLayout> presets = {
      {.rows = 1, .cols = 1, .name = "1x1 (Single Panel)"},
      {.rows = 1, .cols = 2, .name = "1x2 (Classic Dual)"},
      {.rows = 2, .cols = 2, .name = "2x2 (Quad)"},
      {.rows = 2, .cols = 3, .name = "2x3 (Six Panel)"},
      {.rows = 3, .cols = 2, .name = "3x2 (Vertical)"},
  };
  return presets;
}

std::string LayoutName(int rows, int cols) {
  for (const auto& l : PanelStore::PresetLayouts()) {
    if (l.rows == rows && l.cols == cols) return l.name;
  }
  return std::to_string(rows) + "x" + std::to_string(cols);
}

std::vector<FileInfo> SortedFiles(const Panel& panel) {
  const bool ascending = panel.sortOrder == SortOrder::Asc;

  const auto groupRank = [&](const FileInfo& e) -> int {
    // Ascending: folders, hidden folders, files, hidden files.
    const bool hidden = IsHidden(e);
    int rank = 0;
    if (e.IsDir() && !hidden) rank = 0;
    else if (e.IsDir() && hidden) rank = 1;
    else if (!e.IsDir() && !hidden) rank = 2;
    else rank = 3;
    return ascending ? rank : (3 - rank);
  };

  const auto cmp = [&](const FileInfo& a, const FileInfo& b) -> bool {
    const int ga = groupRank(a);
    const int gb = groupRank(b);
    if (ga != gb) return ga < gb;

    int rel = 0;
    switch (panel.sortBy) {
      case SortBy::Name: {
        const auto an = ToLower(a.name);
        const auto bn = ToLower(b.name);
        rel = (an < bn) ? -1 : (an > bn ? 1 : 0);
        break;
      }
      case SortBy::Type: {
        const std::string at = TypeKey(a);
        const std::string bt = TypeKey(b);
        rel = (at < bt) ? -1 : (at > bt ? 1 : 0);
        break;
      }
      case SortBy::Size: {
        if (a.size < b.size) rel = -1;
        else if (a.size > b.size) rel = 1;
        break;
      }
      case SortBy::Modified: {
        rel = (a.modified < b.modified) ? -1 : (a.modified > b.modified ? 1 : 0);
        break;
      }
    }

    if (!ascending) rel = -rel;
    if (rel != 0) return rel < 0;
    return ToLower(a.name) < ToLower(b.name);
  };

  auto entries = panel.files;
  std::stable_sort(entries.begin(), entries.end(), cmp);
  return entries;
}

std::vector<FileInfo> ResolveSelection(const Panel& panel) {
  std::vector<FileInfo> out;
  if (panel.selectedFiles.empty()) return out;
  for (const auto& f : SortedFiles(panel)) {
    if (panel.selectedFiles.count(f.name)) out.push_back(f);
  }
  return out;
}

}  // namespace mosaic
