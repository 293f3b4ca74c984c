#include "Model.h"

namespace mosaic {

const char* ViewModeName(ViewMode mode) {
  switch (mode) {
    case ViewMode::List: return "list";
    case ViewMode::Grid: return "grid";
    case ViewMode::Details: return "details";
  }
  return "list";
}

const char* SortByName(SortBy sortBy) {
  switch (sortBy) {
    case SortBy::Name: return "name";
    case SortBy::Size: return "size";
    case SortBy::Modified: return "modified";
    case SortBy::Type: return "type";
  }
  return "name";
}

const char* TransferOpName(TransferOp op) {
  return op == TransferOp::Copy ? "copy" : "move";
}

}  // namespace mosaic
