#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "StorageBackend.h"

namespace mosaic {

namespace localfs {

// Synchronous filesystem routines used by the backend's worker thread.
OpResult ListDir(const std::string& dir, std::vector<FileInfo>* out);
OpResult CreateEntry(const std::string& dir, const std::string& name, EntryKind kind);
OpResult CopyPath(const std::string& src, const std::string& dst);
OpResult MovePath(const std::string& src, const std::string& dst);
// Copy then delete, for moves across filesystems. Keeps the source when any
// part of it, special files included, could not be copied.
OpResult MoveByCopy(const std::string& src, const std::string& dst);
OpResult DeletePath(const std::string& path);
OpResult RenamePath(const std::string& path, const std::string& newName);
OpResult ResolveUserPath(const std::string& input, std::string* out);

// Looks up XDG_<KEY>_DIR in a user-dirs.dirs file. NotFound when the file
// or the key is missing.
OpResult ReadXdgUserDir(const std::string& dirsFile, const std::string& key, std::string* out);
std::string HomeDir();

}  // namespace localfs

// Runs every request on one worker thread, in submission order, and hands
// the completion to `post` so it runs on the core thread.
class LocalStorageBackend final : public StorageBackend {
public:
  using PostFn = std::function<void(std::function<void()> fn)>;

  explicit LocalStorageBackend(PostFn post);
  ~LocalStorageBackend() override;

  LocalStorageBackend(const LocalStorageBackend&) = delete;
  LocalStorageBackend& operator=(const LocalStorageBackend&) = delete;

  void List(const std::string& path, ListDone done) override;
  void Create(const std::string& dir, const std::string& name, EntryKind kind, Completion done) override;
  void Copy(const std::string& src, const std::string& dst, Completion done) override;
  void Move(const std::string& src, const std::string& dst, Completion done) override;
  void Delete(const std::string& path, Completion done) override;
  void Rename(const std::string& path, const std::string& newName, Completion done) override;
  void ResolvePath(const std::string& input, PathDone done) override;

private:
  void Enqueue(std::function<void()> job);
  void RunSimple(std::function<OpResult()> op, Completion done);
  void WorkerLoop();

  PostFn post_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace mosaic
