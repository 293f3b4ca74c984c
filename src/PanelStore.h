#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Model.h"

namespace mosaic {

// Owns every panel, the grid arrangement and the clipboard and drag slots.
// All mutations are synchronous; observers read the store after each call.
class PanelStore final {
public:
  explicit PanelStore(const GridLayout& initial = {.rows = 1, .cols = 2, .name = "1x2 (Classic Dual)"},
                      const std::string& initialPath = "/");

  // Returns false (and changes nothing) when rows*cols < 1.
  bool SetGridLayout(const GridLayout& layout);
  void SetActivePanel(const std::string& panelId);

  void NavigateToPath(const std::string& panelId, const std::string& path);
  void SetFiles(const std::string& panelId, std::vector<FileInfo> files);
  void SetLoading(const std::string& panelId, bool loading);
  void SetError(const std::string& panelId, const std::string& message);
  void SelectFiles(const std::string& panelId, const std::vector<std::string>& names, bool toggle);
  void SetViewMode(const std::string& panelId, ViewMode mode);
  void SetSorting(const std::string& panelId, SortBy sortBy,
                  std::optional<SortOrder> order = std::nullopt);
  void SetAddressBarActive(const std::string& panelId, bool active);

  std::uint64_t StageClipboard(std::vector<FileInfo> files, ClipboardOp op,
                               const std::string& sourcePanelId);
  void ClearClipboard();

  void BeginDrag(std::vector<std::string> names, const std::string& sourcePanelId,
                 TransferOp op);
  void SetDragOperation(TransferOp op);
  void EndDrag();

  const Panel* GetPanel(const std::string& panelId) const;
  const std::map<std::string, Panel>& Panels() const { return panels_; }
  const std::vector<std::string>& PanelOrder() const { return order_; }
  const std::optional<std::string>& ActivePanelId() const { return activePanelId_; }
  const GridLayout& Layout() const { return layout_; }
  const ClipboardState& Clipboard() const { return clipboard_; }
  const DragState& Drag() const { return drag_; }
  const std::string& DefaultPath() const { return defaultPath_; }

  static const std::vector<GridLayout>& PresetLayouts();

private:
  Panel* Mutable(const std::string& panelId);

  std::map<std::string, Panel> panels_;
  std::vector<std::string> order_;
  std::optional<std::string> activePanelId_;
  GridLayout layout_;
  std::string defaultPath_;
  ClipboardState clipboard_;
  std::uint64_t nextStamp_{1};
  DragState drag_;
};

// The panel's listing in display order: folders, hidden folders, files,
// hidden files, each group ordered by the panel's sort field.
std::vector<FileInfo> SortedFiles(const Panel& panel);

// Selected entries resolved against the current listing, in display order.
// Names no longer present in the listing are dropped.
std::vector<FileInfo> ResolveSelection(const Panel& panel);

std::string LayoutName(int rows, int cols);

}  // namespace mosaic
