#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Model.h"
#include "util.h"

namespace mosaic {

enum class EntryKind { File, Folder };

// Asynchronous storage operations. Every completion must run on the core
// thread; implementations that work elsewhere marshal back before calling it.
class StorageBackend {
public:
  using ListDone = std::function<void(const OpResult& result, std::vector<FileInfo> files)>;
  using PathDone = std::function<void(const OpResult& result, std::string path)>;

  virtual ~StorageBackend() = default;

  virtual void List(const std::string& path, ListDone done) = 0;
  virtual void Create(const std::string& dir, const std::string& name, EntryKind kind,
                      Completion done) = 0;
  // Copy and Move never overwrite an existing destination.
  virtual void Copy(const std::string& src, const std::string& dst, Completion done) = 0;
  virtual void Move(const std::string& src, const std::string& dst, Completion done) = 0;
  virtual void Delete(const std::string& path, Completion done) = 0;
  virtual void Rename(const std::string& path, const std::string& newName, Completion done) = 0;
  // Turns user input (absolute path or alias such as "~" or "Documents") into a directory.
  virtual void ResolvePath(const std::string& input, PathDone done) = 0;
};

}  // namespace mosaic
