#include <gtest/gtest.h>

#include "DirectoryLoader.h"
#include "FakeStorageBackend.h"

namespace mosaic {
namespace {

using testing::FakeStorageBackend;

class DirectoryLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    backend.AddFile("/a/one.txt", 1);
    backend.AddFile("/a/two.txt", 2);
    backend.AddFile("/b/three.txt", 3);
    backend.AddDir(FakeStorageBackend::kHome);
  }

  std::function<void(const OpResult&)> Capture(std::optional<OpResult>* out) {
    return [out](const OpResult& r) { *out = r; };
  }

  FakeStorageBackend backend;
  PanelStore store;
  DirectoryLoader loader{store, backend};
};

TEST_F(DirectoryLoaderTest, LoadNavigatesAndLists) {
  std::optional<OpResult> res;
  store.SelectFiles("panel-1", {"stale"}, false);
  loader.Load("panel-1", "/a/", Capture(&res));

  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->code, OpCode::Ok);
  const auto* p = store.GetPanel("panel-1");
  EXPECT_EQ(p->currentPath, "/a");
  EXPECT_EQ(p->files.size(), 2u);
  EXPECT_FALSE(p->isLoading);
  EXPECT_TRUE(p->selectedFiles.empty());
  EXPECT_EQ(loader.InFlight(), 0);
}

TEST_F(DirectoryLoaderTest, AliasesAreResolvedByTheBackend) {
  loader.Load("panel-2", "~");
  EXPECT_EQ(store.GetPanel("panel-2")->currentPath, FakeStorageBackend::kHome);
}

TEST_F(DirectoryLoaderTest, ListingFailureKeepsPathAndSetsError) {
  loader.Load("panel-1", "/a");
  std::optional<OpResult> res;
  loader.Load("panel-1", "/missing", Capture(&res));

  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->kind, ErrorKind::NotFound);
  const auto* p = store.GetPanel("panel-1");
  EXPECT_EQ(p->currentPath, "/a");
  EXPECT_TRUE(p->error.has_value());
  EXPECT_FALSE(p->isLoading);
}

TEST_F(DirectoryLoaderTest, RelativeInputIsRejected) {
  std::optional<OpResult> res;
  loader.Load("panel-1", "somewhere", Capture(&res));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->kind, ErrorKind::Validation);
  EXPECT_EQ(backend.CallsOf("List").size(), 0u);
}

TEST_F(DirectoryLoaderTest, UnknownPanel) {
  std::optional<OpResult> res;
  loader.Load("panel-7", "/a", Capture(&res));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->kind, ErrorKind::NotFound);
  EXPECT_TRUE(backend.Calls().empty());
}

TEST_F(DirectoryLoaderTest, NewerNavigationWins) {
  backend.SetDeferred(true);
  std::optional<OpResult> first;
  std::optional<OpResult> second;
  loader.Load("panel-1", "/a", Capture(&first));
  loader.Load("panel-1", "/b", Capture(&second));
  EXPECT_EQ(loader.InFlight(), 2);
  EXPECT_TRUE(store.GetPanel("panel-1")->isLoading);

  backend.CompleteAll();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->code, OpCode::Skipped);
  EXPECT_EQ(second->code, OpCode::Ok);
  EXPECT_EQ(store.GetPanel("panel-1")->currentPath, "/b");
  EXPECT_EQ(loader.InFlight(), 0);
}

TEST_F(DirectoryLoaderTest, RefreshKeepsSelection) {
  loader.Load("panel-1", "/a");
  store.SelectFiles("panel-1", {"one.txt"}, false);
  backend.AddFile("/a/new.txt");

  std::optional<OpResult> res;
  loader.Refresh("panel-1", Capture(&res));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->ok());
  EXPECT_EQ(store.GetPanel("panel-1")->files.size(), 3u);
  EXPECT_EQ(store.GetPanel("panel-1")->selectedFiles.count("one.txt"), 1u);
}

TEST_F(DirectoryLoaderTest, RefreshYieldsToANewerLoad) {
  loader.Load("panel-1", "/a");
  backend.SetDeferred(true);

  std::optional<OpResult> refreshed;
  loader.Refresh("panel-1", Capture(&refreshed));
  loader.Load("panel-1", "/b");
  backend.CompleteAll();

  ASSERT_TRUE(refreshed.has_value());
  EXPECT_EQ(refreshed->code, OpCode::Skipped);
  EXPECT_EQ(store.GetPanel("panel-1")->currentPath, "/b");
  ASSERT_EQ(store.GetPanel("panel-1")->files.size(), 1u);
  EXPECT_EQ(store.GetPanel("panel-1")->files[0].name, "three.txt");
}

TEST_F(DirectoryLoaderTest, RefreshPanelsShowingOnlyTouchesMatchingPanels) {
  loader.Load("panel-1", "/a");
  loader.Load("panel-2", "/b");
  backend.ClearCalls();

  loader.RefreshPanelsShowing("/a/");
  const auto lists = backend.CallsOf("List");
  ASSERT_EQ(lists.size(), 1u);
  EXPECT_EQ(lists[0].a, "/a");
}

TEST_F(DirectoryLoaderTest, PanelRemovedMidLoad) {
  backend.SetDeferred(true);
  std::optional<OpResult> res;
  loader.Load("panel-2", "/a", Capture(&res));
  store.SetGridLayout({.rows = 1, .cols = 1});
  backend.CompleteAll();
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->code, OpCode::Skipped);
  EXPECT_EQ(loader.InFlight(), 0);
}

}  // namespace
}  // namespace mosaic
