#include "TestWorkspace.h"

namespace mosaic {
namespace {

using testing::WorkspaceTest;

class FileCommandsTest : public WorkspaceTest {
protected:
  void SetUp() override {
    backend.AddFile("/a/x.txt", 10);
    backend.AddFile("/a/y.txt", 20);
    backend.AddDir("/a/Docs");
    backend.AddDir("/b");
    Open({"/a", "/b"});
  }

  void Select(const std::vector<std::string>& names) { Store().SelectFiles("panel-1", names, false); }
};

TEST_F(FileCommandsTest, CreateFileFromPrompt) {
  dialogs.promptAnswers = {std::string("notes.txt")};
  EXPECT_EQ(Run("create-file").code, OpCode::Ok);

  ASSERT_EQ(dialogs.prompts.size(), 1u);
  EXPECT_EQ(dialogs.prompts[0], "Enter file name:");
  EXPECT_EQ(dialogs.defaults[0], "untitled.txt");
  const auto creates = backend.CallsOf("Create");
  ASSERT_EQ(creates.size(), 1u);
  EXPECT_EQ(creates[0].a, "/a/notes.txt");
  EXPECT_EQ(creates[0].b, "file");
  EXPECT_EQ(Names("panel-1"), (std::vector<std::string>{"Docs", "notes.txt", "x.txt", "y.txt"}));
  EXPECT_EQ(LastNotification().message, "Created file notes.txt");
  EXPECT_EQ(LastNotification().panelId, "panel-1");
}

TEST_F(FileCommandsTest, CreateFolderWithPresetNameSkipsPrompt) {
  EXPECT_EQ(Run("create-folder", {.name = "Music"}).code, OpCode::Ok);
  EXPECT_TRUE(dialogs.prompts.empty());
  EXPECT_TRUE(backend.Exists("/a/Music"));
  EXPECT_EQ(LastNotification().message, "Created folder Music");
}

TEST_F(FileCommandsTest, CreateInAnotherFolderRefreshesPanelsShowingIt) {
  const auto res = Run("create-file", {.name = "/b/new.txt"});
  EXPECT_EQ(res.code, OpCode::Ok);
  EXPECT_EQ(Names("panel-2"), (std::vector<std::string>{"new.txt"}));
  EXPECT_EQ(PanelAt("panel-1").currentPath, "/a");
}

TEST_F(FileCommandsTest, CreateAndNavigate) {
  EXPECT_EQ(Run("create-file", {.name = "Docs/todo.md", .navigateToTarget = true}).code, OpCode::Ok);
  EXPECT_EQ(PanelAt("panel-1").currentPath, "/a/Docs");
  EXPECT_EQ(Names("panel-1"), (std::vector<std::string>{"todo.md"}));
}

TEST_F(FileCommandsTest, CreateExistingFolderFails) {
  const auto res = Run("create-folder", {.name = "Docs"});
  EXPECT_EQ(res.kind, ErrorKind::AlreadyExists);
  EXPECT_EQ(LastNotification().severity, Severity::Error);
  EXPECT_EQ(LastNotification().message, "Failed to create folder: Docs already exists");
  EXPECT_EQ(LastNotification().panelId, "panel-1");
}

TEST_F(FileCommandsTest, CreateDismissedIsACancellation) {
  dialogs.promptAnswers = {std::nullopt};
  const auto res = Run("create-file");
  EXPECT_TRUE(res.cancelled());
  EXPECT_TRUE(backend.CallsOf("Create").empty());
  EXPECT_EQ(LastNotification().severity, Severity::Info);
  EXPECT_EQ(LastNotification().message, "File creation cancelled");
}

TEST_F(FileCommandsTest, CreateWithBlankNameWarns) {
  dialogs.promptAnswers = {std::string("   ")};
  const auto res = Run("create-folder");
  EXPECT_EQ(res.kind, ErrorKind::Validation);
  EXPECT_TRUE(backend.CallsOf("Create").empty());
  EXPECT_EQ(LastNotification().severity, Severity::Warning);
  EXPECT_EQ(LastNotification().message, "Name cannot be empty");
}

TEST_F(FileCommandsTest, DeleteSelection) {
  Select({"x.txt", "y.txt"});
  dialogs.confirmAnswers = {true};
  EXPECT_EQ(Run("delete-files").code, OpCode::Ok);

  ASSERT_EQ(dialogs.confirms.size(), 1u);
  EXPECT_EQ(dialogs.confirms[0], "Delete 2 items? This cannot be undone.");
  EXPECT_EQ(backend.CallsOf("Delete").size(), 2u);
  EXPECT_EQ(Names("panel-1"), (std::vector<std::string>{"Docs"}));
  EXPECT_TRUE(PanelAt("panel-1").selectedFiles.empty());
  EXPECT_EQ(LastNotification().message, "Deleted 2 items");
}

TEST_F(FileCommandsTest, DeleteSingleAsksByName) {
  Select({"x.txt"});
  dialogs.confirmAnswers = {true};
  Run("delete-files");
  ASSERT_EQ(dialogs.confirms.size(), 1u);
  EXPECT_EQ(dialogs.confirms[0], "Delete \"x.txt\"? This cannot be undone.");
}

TEST_F(FileCommandsTest, DeleteDeclined) {
  Select({"x.txt"});
  dialogs.confirmAnswers = {false};
  const auto res = Run("delete-files");
  EXPECT_TRUE(res.cancelled());
  EXPECT_TRUE(backend.CallsOf("Delete").empty());
  EXPECT_TRUE(backend.Exists("/a/x.txt"));
  EXPECT_EQ(LastNotification().message, "Delete operation cancelled");
}

TEST_F(FileCommandsTest, DeleteNeedsASelection) {
  const auto res = Run("delete-files");
  EXPECT_EQ(res.kind, ErrorKind::Validation);
  EXPECT_TRUE(dialogs.confirms.empty());
  EXPECT_EQ(LastNotification().message, "Delete Files is not available right now");
}

TEST_F(FileCommandsTest, DeleteContinuesPastFailures) {
  backend.FailOn("Delete", "/a/x.txt", "busy");
  Select({"x.txt", "y.txt"});
  dialogs.confirmAnswers = {true};
  const auto res = Run("delete-files");

  EXPECT_TRUE(res.failed());
  EXPECT_TRUE(res.reported);
  EXPECT_FALSE(backend.Exists("/a/y.txt"));
  EXPECT_EQ(LastNotification().severity, Severity::Warning);
  EXPECT_EQ(LastNotification().message, "Deleted 1 of 2 items, 1 failed: x.txt: busy");
}

TEST_F(FileCommandsTest, DeleteKeepsTheSelectionOfAFolderOpenedMeanwhile) {
  backend.AddFile("/c/z.txt");
  Select({"x.txt"});
  dialogs.confirmAnswers = {true};
  backend.SetDeferred(true);

  std::optional<OpResult> res;
  ws->Dispatch("delete-files", {}, [&](const OpResult& r) { res = r; });
  scheduler.RunPending();
  ASSERT_EQ(backend.PendingCount(), 1u);

  ShowElsewhere("panel-1", "/c", {"z.txt"}, {"z.txt"});
  Drain();

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->ok());
  EXPECT_FALSE(backend.Exists("/a/x.txt"));
  EXPECT_EQ(PanelAt("panel-1").currentPath, "/c");
  EXPECT_EQ(PanelAt("panel-1").selectedFiles, (std::set<std::string>{"z.txt"}));
}

TEST_F(FileCommandsTest, DeleteDeselectsOnlyWhatWasDeleted) {
  backend.FailOn("Delete", "/a/x.txt", "busy");
  Select({"x.txt", "y.txt"});
  dialogs.confirmAnswers = {true};
  Run("delete-files");
  EXPECT_EQ(PanelAt("panel-1").selectedFiles, (std::set<std::string>{"x.txt"}));
}

TEST_F(FileCommandsTest, RenameDoesNotSelectInAFolderOpenedMeanwhile) {
  backend.AddFile("/c/z.txt");
  backend.AddFile("/c/w.txt");
  Select({"x.txt"});
  backend.SetDeferred(true);

  std::optional<OpResult> res;
  ws->Dispatch("rename-file", {.newName = "z.txt"}, [&](const OpResult& r) { res = r; });
  scheduler.RunPending();
  ASSERT_EQ(backend.PendingCount(), 1u);

  ShowElsewhere("panel-1", "/c", {"w.txt", "z.txt"}, {"w.txt"});
  Drain();

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->ok());
  EXPECT_TRUE(backend.Exists("/a/z.txt"));
  EXPECT_EQ(PanelAt("panel-1").selectedFiles, (std::set<std::string>{"w.txt"}));
  EXPECT_EQ(LastNotification().message, "Renamed x.txt to z.txt");
}

TEST_F(FileCommandsTest, RenameSelectsTheNewName) {
  Select({"x.txt"});
  EXPECT_EQ(Run("rename-file", {.newName = "z.txt"}).code, OpCode::Ok);

  const auto renames = backend.CallsOf("Rename");
  ASSERT_EQ(renames.size(), 1u);
  EXPECT_EQ(renames[0].a, "/a/x.txt");
  EXPECT_EQ(renames[0].b, "z.txt");
  EXPECT_EQ(Names("panel-1"), (std::vector<std::string>{"Docs", "y.txt", "z.txt"}));
  EXPECT_EQ(PanelAt("panel-1").selectedFiles, (std::set<std::string>{"z.txt"}));
  EXPECT_EQ(LastNotification().message, "Renamed x.txt to z.txt");
}

TEST_F(FileCommandsTest, RenamePromptDefaultsToCurrentName) {
  Select({"y.txt"});
  dialogs.promptAnswers = {std::string("y.txt")};
  const auto res = Run("rename-file");
  EXPECT_EQ(dialogs.defaults.at(0), "y.txt");
  EXPECT_TRUE(res.cancelled());
  EXPECT_TRUE(backend.CallsOf("Rename").empty());
  EXPECT_EQ(LastNotification().message, "Name unchanged");
}

TEST_F(FileCommandsTest, RenameRejectsBadNames) {
  Select({"x.txt"});
  const auto res = Run("rename-file", {.newName = "a/b"});
  EXPECT_EQ(res.kind, ErrorKind::Validation);
  EXPECT_EQ(LastNotification().message, "Invalid name: a/b");
  EXPECT_TRUE(backend.CallsOf("Rename").empty());
}

TEST_F(FileCommandsTest, RenameOntoExistingNameFails) {
  Select({"x.txt"});
  const auto res = Run("rename-file", {.newName = "y.txt"});
  EXPECT_EQ(res.kind, ErrorKind::AlreadyExists);
  EXPECT_EQ(LastNotification().message, "Failed to rename: y.txt already exists");
  EXPECT_TRUE(backend.Exists("/a/x.txt"));
}

TEST_F(FileCommandsTest, RenameNeedsExactlyOneItem) {
  Select({"x.txt", "y.txt"});
  EXPECT_EQ(Run("rename-file", {.newName = "q"}).kind, ErrorKind::Validation);
  Select({});
  EXPECT_EQ(Run("rename-file", {.newName = "q"}).kind, ErrorKind::Validation);
}

TEST_F(FileCommandsTest, CopyThenCutKeepsOnlyTheCut) {
  Select({"x.txt", "y.txt"});
  ASSERT_TRUE(Run("copy-files").ok());
  EXPECT_EQ(LastNotification().message, "Copied 2 item(s) to clipboard");

  Select({"y.txt"});
  ASSERT_TRUE(Run("cut-files").ok());
  EXPECT_EQ(LastNotification().message, "Cut 1 item(s) to clipboard");

  const auto& clip = Store().Clipboard();
  EXPECT_TRUE(clip.hasFiles);
  EXPECT_EQ(clip.operation, ClipboardOp::Cut);
  ASSERT_EQ(clip.files.size(), 1u);
  EXPECT_EQ(clip.files[0].path, "/a/y.txt");
}

TEST_F(FileCommandsTest, SelectAllAndClear) {
  ASSERT_TRUE(Run("select-all").ok());
  EXPECT_EQ(PanelAt("panel-1").selectedFiles, (std::set<std::string>{"Docs", "x.txt", "y.txt"}));
  ASSERT_TRUE(Run("clear-selection").ok());
  EXPECT_TRUE(PanelAt("panel-1").selectedFiles.empty());
}

TEST_F(FileCommandsTest, LoadDirectory) {
  EXPECT_EQ(Run("load-directory", {.path = "/b"}).code, OpCode::Ok);
  EXPECT_EQ(PanelAt("panel-1").currentPath, "/b");

  dialogs.promptAnswers = {std::nullopt};
  EXPECT_TRUE(Run("load-directory").cancelled());
  EXPECT_EQ(dialogs.defaults.at(0), "/b");
  EXPECT_EQ(LastNotification().message, "Load directory cancelled");
}

TEST_F(FileCommandsTest, LoadMissingDirectoryReportsError) {
  const auto res = Run("load-directory", {.path = "/nowhere"});
  EXPECT_EQ(res.kind, ErrorKind::NotFound);
  EXPECT_TRUE(PanelAt("panel-1").error.has_value());
  EXPECT_EQ(LastNotification().message, "Failed to load directory: Not a directory: /nowhere");
}

TEST_F(FileCommandsTest, RefreshPicksUpExternalChanges) {
  backend.AddFile("/a/late.txt");
  ASSERT_TRUE(Run("refresh-panel").ok());
  EXPECT_EQ(Names("panel-1"), (std::vector<std::string>{"Docs", "late.txt", "x.txt", "y.txt"}));
}

}  // namespace
}  // namespace mosaic
