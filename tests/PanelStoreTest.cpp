#include <gtest/gtest.h>

#include "PanelStore.h"

namespace mosaic {
namespace {

FileInfo Entry(const std::string& name, FileType type, std::uintmax_t size = 0,
               const std::string& modified = "") {
  return FileInfo{.name = name, .path = "/d/" + name, .size = size, .modified = modified, .type = type};
}

TEST(PanelStoreTest, StartsWithClassicDual) {
  PanelStore store;
  EXPECT_EQ(store.PanelOrder(), (std::vector<std::string>{"panel-1", "panel-2"}));
  EXPECT_EQ(store.ActivePanelId(), "panel-1");
  EXPECT_EQ(store.Layout().name, "1x2 (Classic Dual)");

  const auto* p = store.GetPanel("panel-2");
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->currentPath, "/");
  EXPECT_EQ(p->viewMode, ViewMode::List);
  EXPECT_EQ(p->sortBy, SortBy::Name);
  EXPECT_EQ(p->sortOrder, SortOrder::Asc);
  EXPECT_FALSE(store.Clipboard().hasFiles);
  EXPECT_FALSE(store.Drag().isDragging);
}

TEST(PanelStoreTest, EveryGridHasOnePanelPerCell) {
  PanelStore store;
  for (int rows = 1; rows <= 4; rows++) {
    for (int cols = 1; cols <= 4; cols++) {
      ASSERT_TRUE(store.SetGridLayout({.rows = rows, .cols = cols}));
      ASSERT_EQ(static_cast<int>(store.PanelOrder().size()), rows * cols);
      ASSERT_EQ(store.Panels().size(), store.PanelOrder().size());
      for (const auto& id : store.PanelOrder()) EXPECT_NE(store.GetPanel(id), nullptr);
    }
  }
}

TEST(PanelStoreTest, RejectsEmptyGrid) {
  PanelStore store;
  EXPECT_FALSE(store.SetGridLayout({.rows = 0, .cols = 3}));
  EXPECT_FALSE(store.SetGridLayout({.rows = 2, .cols = -1}));
  EXPECT_EQ(store.PanelOrder().size(), 2u);
  EXPECT_EQ(store.Layout().cols, 2);
}

TEST(PanelStoreTest, ShrinkKeepsLeadingPanelsAndDropsTheRest) {
  PanelStore store;
  ASSERT_TRUE(store.SetGridLayout({.rows = 2, .cols = 3}));
  EXPECT_EQ(store.Layout().name, "2x3 (Six Panel)");
  store.NavigateToPath("panel-5", "/tmp");
  store.SetActivePanel("panel-5");

  ASSERT_TRUE(store.SetGridLayout({.rows = 1, .cols = 2}));
  EXPECT_EQ(store.PanelOrder(), (std::vector<std::string>{"panel-1", "panel-2"}));
  EXPECT_EQ(store.GetPanel("panel-5"), nullptr);
  EXPECT_EQ(store.ActivePanelId(), "panel-1");

  // A regrown slot starts fresh.
  ASSERT_TRUE(store.SetGridLayout({.rows = 2, .cols = 3}));
  EXPECT_EQ(store.GetPanel("panel-5")->currentPath, "/");
}

TEST(PanelStoreTest, ShrinkEndsDragFromRemovedPanel) {
  PanelStore store(GridLayout{.rows = 2, .cols = 2});
  store.BeginDrag({"a"}, "panel-4", TransferOp::Move);
  ASSERT_TRUE(store.SetGridLayout({.rows = 1, .cols = 1}));
  EXPECT_FALSE(store.Drag().isDragging);
  EXPECT_EQ(store.Layout().name, "1x1 (Single Panel)");
}

TEST(PanelStoreTest, CustomLayoutGetsGeneratedName) {
  PanelStore store;
  ASSERT_TRUE(store.SetGridLayout({.rows = 4, .cols = 1}));
  EXPECT_EQ(store.Layout().name, "4x1");
}

TEST(PanelStoreTest, UnknownPanelIsNotActivated) {
  PanelStore store;
  store.SetActivePanel("panel-9");
  EXPECT_EQ(store.ActivePanelId(), "panel-1");
  store.SetActivePanel("panel-2");
  EXPECT_EQ(store.ActivePanelId(), "panel-2");
}

TEST(PanelStoreTest, NavigationClearsSelectionButListingDoesNot) {
  PanelStore store;
  store.SetFiles("panel-1", {Entry("a", FileType::File), Entry("b", FileType::File)});
  store.SelectFiles("panel-1", {"a"}, false);

  store.SetFiles("panel-1", {Entry("a", FileType::File)});
  EXPECT_EQ(store.GetPanel("panel-1")->selectedFiles.count("a"), 1u);

  store.NavigateToPath("panel-1", "/other");
  EXPECT_TRUE(store.GetPanel("panel-1")->selectedFiles.empty());
  EXPECT_EQ(store.GetPanel("panel-1")->currentPath, "/other");
}

TEST(PanelStoreTest, LoadingAndErrorFlags) {
  PanelStore store;
  store.SetLoading("panel-1", true);
  store.SetError("panel-1", "boom");
  EXPECT_FALSE(store.GetPanel("panel-1")->isLoading);
  EXPECT_EQ(store.GetPanel("panel-1")->error, "boom");

  store.SetLoading("panel-1", true);
  store.SetFiles("panel-1", {});
  EXPECT_FALSE(store.GetPanel("panel-1")->isLoading);
  EXPECT_FALSE(store.GetPanel("panel-1")->error.has_value());
}

TEST(PanelStoreTest, ToggleTwiceRestoresSelection) {
  PanelStore store;
  store.SelectFiles("panel-1", {"a", "b"}, false);
  const auto before = store.GetPanel("panel-1")->selectedFiles;

  store.SelectFiles("panel-1", {"b", "c"}, true);
  EXPECT_EQ(store.GetPanel("panel-1")->selectedFiles, (std::set<std::string>{"a", "c"}));
  store.SelectFiles("panel-1", {"b", "c"}, true);
  EXPECT_EQ(store.GetPanel("panel-1")->selectedFiles, before);
}

TEST(PanelStoreTest, SortingTogglesOnSameField) {
  PanelStore store;
  store.SetSorting("panel-1", SortBy::Name);
  EXPECT_EQ(store.GetPanel("panel-1")->sortOrder, SortOrder::Desc);
  store.SetSorting("panel-1", SortBy::Name);
  EXPECT_EQ(store.GetPanel("panel-1")->sortOrder, SortOrder::Asc);

  store.SetSorting("panel-1", SortBy::Name, SortOrder::Desc);
  store.SetSorting("panel-1", SortBy::Size);
  EXPECT_EQ(store.GetPanel("panel-1")->sortBy, SortBy::Size);
  EXPECT_EQ(store.GetPanel("panel-1")->sortOrder, SortOrder::Asc);

  store.SetSorting("panel-1", SortBy::Size, SortOrder::Asc);
  EXPECT_EQ(store.GetPanel("panel-1")->sortOrder, SortOrder::Asc);
}

TEST(PanelStoreTest, ClipboardHoldsOnlyTheLatestStage) {
  PanelStore store;
  const auto first = store.StageClipboard({Entry("a", FileType::File)}, ClipboardOp::Copy, "panel-1");
  const auto second = store.StageClipboard({Entry("b", FileType::File)}, ClipboardOp::Cut, "panel-2");

  EXPECT_GT(second, first);
  const auto& clip = store.Clipboard();
  EXPECT_TRUE(clip.hasFiles);
  EXPECT_EQ(clip.operation, ClipboardOp::Cut);
  EXPECT_EQ(clip.sourcePanelId, "panel-2");
  ASSERT_EQ(clip.files.size(), 1u);
  EXPECT_EQ(clip.files[0].name, "b");

  store.ClearClipboard();
  EXPECT_FALSE(store.Clipboard().hasFiles);
  EXPECT_EQ(store.Clipboard().operation, ClipboardOp::None);

  store.StageClipboard({}, ClipboardOp::Copy, "panel-1");
  EXPECT_FALSE(store.Clipboard().hasFiles);
}

TEST(PanelStoreTest, DragOperationChangesOnlyWhileDragging) {
  PanelStore store;
  store.SetDragOperation(TransferOp::Copy);
  EXPECT_EQ(store.Drag().operation, TransferOp::Move);

  store.BeginDrag({"a", "b"}, "panel-1", TransferOp::Move);
  store.SetDragOperation(TransferOp::Copy);
  EXPECT_EQ(store.Drag().operation, TransferOp::Copy);
  store.EndDrag();
  EXPECT_FALSE(store.Drag().isDragging);
  EXPECT_TRUE(store.Drag().draggedFiles.empty());
}

TEST(PanelStoreTest, SortedFilesGroupsFoldersFirst) {
  Panel panel;
  panel.files = {
      Entry("zeta.txt", FileType::File, 5),  Entry(".hidden", FileType::File, 1),
      Entry("Alpha", FileType::Directory),   Entry(".git", FileType::Directory),
      Entry("beta.txt", FileType::File, 50),
  };

  auto names = [](const std::vector<FileInfo>& v) {
    std::vector<std::string> out;
    for (const auto& f : v) out.push_back(f.name);
    return out;
  };

  EXPECT_EQ(names(SortedFiles(panel)),
            (std::vector<std::string>{"Alpha", ".git", "beta.txt", "zeta.txt", ".hidden"}));

  panel.sortBy = SortBy::Size;
  panel.sortOrder = SortOrder::Desc;
  EXPECT_EQ(names(SortedFiles(panel)),
            (std::vector<std::string>{".hidden", "beta.txt", "zeta.txt", ".git", "Alpha"}));
}

TEST(PanelStoreTest, ResolveSelectionFollowsDisplayOrderAndDropsMissing) {
  Panel panel;
  panel.files = {Entry("b.txt", FileType::File), Entry("a.txt", FileType::File), Entry("dir", FileType::Directory)};
  panel.selectedFiles = {"b.txt", "dir", "gone.txt"};

  const auto sel = ResolveSelection(panel);
  ASSERT_EQ(sel.size(), 2u);
  EXPECT_EQ(sel[0].name, "dir");
  EXPECT_EQ(sel[1].name, "b.txt");
}

TEST(PanelStoreTest, LayoutNames) {
  EXPECT_EQ(LayoutName(2, 2), "2x2 (Quad)");
  EXPECT_EQ(LayoutName(3, 2), "3x2 (Vertical)");
  EXPECT_EQ(LayoutName(5, 5), "5x5");
  EXPECT_EQ(PanelStore::PresetLayouts().size(), 5u);
}

}  // namespace
}  // namespace mosaic
