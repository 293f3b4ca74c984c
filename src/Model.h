#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mosaic {

enum class FileType { File, Directory, Symlink };
enum class ViewMode { List, Grid, Details };
enum class SortBy { Name, Size, Modified, Type };
enum class SortOrder { Asc, Desc };

struct FileInfo {
  std::string name;
  std::string path;
  std::uintmax_t size{0};
  std::string modified;
  FileType type{FileType::File};

  bool IsDir() const { return type == FileType::Directory; }
};

struct Panel {
  std::string id;
  std::string currentPath{"/"};
  std::vector<FileInfo> files;
  std::set<std::string> selectedFiles;
  bool isLoading{false};
  std::optional<std::string> error;
  ViewMode viewMode{ViewMode::List};
  SortBy sortBy{SortBy::Name};
  SortOrder sortOrder{SortOrder::Asc};
  bool isAddressBarActive{false};
};

struct GridLayout {
  int rows{1};
  int cols{2};
  std::string name;

  int Cells() const { return rows * cols; }
};

enum class ClipboardOp { None, Copy, Cut };
enum class TransferOp { Copy, Move };

struct ClipboardState {
  bool hasFiles{false};
  std::vector<FileInfo> files;
  ClipboardOp operation{ClipboardOp::None};
  std::string sourcePanelId;
  // Bumped on every stage so an in-flight paste can tell whether it still owns the clipboard.
  std::uint64_t stamp{0};
};

struct DragState {
  bool isDragging{false};
  std::vector<std::string> draggedFiles;
  std::string sourcePanelId;
  TransferOp operation{TransferOp::Move};
};

const char* ViewModeName(ViewMode mode);
const char* SortByName(SortBy sortBy);
const char* TransferOpName(TransferOp op);

}  // namespace mosaic
