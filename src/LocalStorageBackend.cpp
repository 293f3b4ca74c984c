#include "LocalStorageBackend.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <wx/fileconf.h>
#include <wx/log.h>
#include <wx/utils.h>

namespace fs = std::filesystem;

namespace mosaic {

namespace localfs {

namespace {

OpResult FromErrorCode(const std::error_code& ec) {
  if (ec == std::errc::no_such_file_or_directory) {
    return ErrorResult(ErrorKind::NotFound, wxString::FromUTF8(ec.message()));
  }
  if (ec == std::errc::file_exists) {
    return ErrorResult(ErrorKind::AlreadyExists, wxString::FromUTF8(ec.message()));
  }
  return ErrorResult(ErrorKind::Backend, wxString::FromUTF8(ec.message()));
}

bool Exists(const fs::path& p) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(p, ec));
}

OpResult AlreadyExists(const fs::path& p) {
  return ErrorResult(ErrorKind::AlreadyExists,
                     wxString::Format("%s already exists", wxString::FromUTF8(p.filename().string())));
}

// Copying or moving a folder into itself would never terminate.
bool IsInside(const fs::path& src, const fs::path& dst) {
  std::error_code ec;
  const auto srcCanon = fs::weakly_canonical(src, ec);
  if (ec) return false;
  const auto dstCanon = fs::weakly_canonical(dst, ec);
  if (ec) return false;
  const auto srcStr = srcCanon.native();
  const auto dstStr = dstCanon.native();
  return dstStr.size() > srcStr.size() && dstStr.compare(0, srcStr.size(), srcStr) == 0 &&
         dstStr[srcStr.size()] == '/';
}

OpResult CopyOne(const fs::path& src, const fs::path& dst, const fs::file_status& st) {
  std::error_code ec;
  if (fs::is_symlink(st)) {
    fs::copy_symlink(src, dst, ec);
  } else if (fs::is_regular_file(st)) {
    fs::copy_file(src, dst, fs::copy_options::none, ec);
  } else {
    // Sockets, fifos and devices are skipped.
    return SkippedResult("Special file skipped");
  }
  if (ec) return FromErrorCode(ec);
  return OkResult();
}

// Special entries that cannot be copied are appended to `skipped` when given.
OpResult CopyRecursive(const fs::path& src, const fs::path& dst, std::vector<fs::path>* skipped = nullptr) {
  std::error_code ec;
  const auto st = fs::symlink_status(src, ec);
  if (ec) return FromErrorCode(ec);

  if (!fs::is_directory(st)) {
    const auto res = CopyOne(src, dst, st);
    if (res.code == OpCode::Skipped && skipped) skipped->push_back(src);
    return res;
  }

  fs::create_directory(dst, ec);
  if (ec) return FromErrorCode(ec);

  fs::recursive_directory_iterator it(src, fs::directory_options::skip_permission_denied, ec);
  if (ec) return FromErrorCode(ec);

  for (const auto& entry : it) {
    const auto rel = entry.path().lexically_relative(src);
    if (rel.empty()) continue;
    const auto out = dst / rel;

    const auto entrySt = entry.symlink_status(ec);
    if (ec) return FromErrorCode(ec);

    if (fs::is_directory(entrySt)) {
      fs::create_directories(out, ec);
      if (ec) return FromErrorCode(ec);
      continue;
    }
    const auto res = CopyOne(entry.path(), out, entrySt);
    if (res.failed()) return res;
    if (res.code == OpCode::Skipped && skipped) skipped->push_back(entry.path());
  }
  return OkResult();
}

FileType TypeOf(const fs::directory_entry& de) {
  std::error_code ec;
  // Symlinks to folders stay navigable.
  if (de.is_directory(ec)) return FileType::Directory;
  if (de.is_symlink(ec)) return FileType::Symlink;
  return FileType::File;
}

}  // namespace

std::string HomeDir() { return wxGetHomeDir().ToStdString(); }

OpResult ReadXdgUserDir(const std::string& dirsFile, const std::string& key, std::string* out) {
  std::error_code ec;
  if (!fs::is_regular_file(dirsFile, ec)) {
    return ErrorResult(ErrorKind::NotFound, wxString::Format("No %s", dirsFile));
  }

  // user-dirs.dirs is KEY="value" lines; wxFileConfig strips the quotes and
  // expands $HOME.
  wxFileConfig dirs(wxEmptyString, wxEmptyString, wxString::FromUTF8(dirsFile), wxEmptyString,
                    wxCONFIG_USE_LOCAL_FILE);
  wxString value;
  if (!dirs.Read(wxString::Format("XDG_%s_DIR", key), &value) || value.empty()) {
    return ErrorResult(ErrorKind::NotFound, wxString::Format("XDG_%s_DIR is not set", key));
  }
  if (out) *out = value.ToStdString();
  return OkResult();
}

OpResult ListDir(const std::string& dir, std::vector<FileInfo>* out) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return ErrorResult(ErrorKind::NotFound, wxString::Format("Not a directory: %s", dir));
  }

  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return FromErrorCode(ec);

  std::vector<FileInfo> entries;
  for (const auto& de : it) {
    const auto type = TypeOf(de);
    std::uintmax_t size = 0;
    if (type == FileType::File) {
      size = de.file_size(ec);
      if (ec) size = 0;
    }

    entries.push_back(FileInfo{
        .name = de.path().filename().string(),
        .path = de.path().string(),
        .size = size,
        .modified = FormatFileTime(de.last_write_time(ec)),
        .type = type,
    });
  }

  if (out) *out = std::move(entries);
  return OkResult();
}

OpResult CreateEntry(const std::string& dir, const std::string& name, EntryKind kind) {
  if (!IsValidEntryName(name)) {
    return ErrorResult(ErrorKind::Validation, wxString::Format("Invalid name: %s", name));
  }
  const auto target = fs::path(dir) / name;
  if (Exists(target)) return AlreadyExists(target);

  std::error_code ec;
  if (kind == EntryKind::Folder) {
    fs::create_directories(target, ec);
    if (ec) return FromErrorCode(ec);
    return OkResult();
  }

  fs::create_directories(target.parent_path(), ec);
  if (ec) return FromErrorCode(ec);
  std::ofstream f(target, std::ios::binary);
  if (!f.is_open()) {
    return ErrorResult(ErrorKind::Backend, wxString::Format("Unable to create %s", name));
  }
  return OkResult();
}

OpResult CopyPath(const std::string& src, const std::string& dst) {
  if (!Exists(src)) return ErrorResult(ErrorKind::NotFound, wxString::Format("%s does not exist", src));
  if (Exists(dst)) return AlreadyExists(dst);
  if (IsInside(src, dst)) {
    return ErrorResult(ErrorKind::Validation, "Destination is inside the source folder.");
  }
  const auto res = CopyRecursive(src, dst);
  if (res.failed()) wxLogWarning("Copy %s -> %s failed: %s", src, dst, res.message);
  return res;
}

OpResult MovePath(const std::string& src, const std::string& dst) {
  if (!Exists(src)) return ErrorResult(ErrorKind::NotFound, wxString::Format("%s does not exist", src));
  if (Exists(dst)) return AlreadyExists(dst);
  if (IsInside(src, dst)) {
    return ErrorResult(ErrorKind::Validation, "Destination is inside the source folder.");
  }

  std::error_code ec;
  fs::rename(src, dst, ec);
  if (!ec) return OkResult();

  // Cross-device moves can fail; fall back to copy+delete.
  if (ec != std::errc::cross_device_link) return FromErrorCode(ec);
  return MoveByCopy(src, dst);
}

OpResult MoveByCopy(const std::string& src, const std::string& dst) {
  if (Exists(dst)) return AlreadyExists(dst);
  std::vector<fs::path> skipped;
  auto res = CopyRecursive(src, dst, &skipped);
  if (res.ok() && !skipped.empty()) {
    res = ErrorResult(ErrorKind::Backend,
                      wxString::Format("Cannot move special file %s",
                                       wxString::FromUTF8(skipped.front().filename().string())));
  }
  if (res.failed()) {
    // The source stays whole; drop the partial copy this move created.
    std::error_code ec;
    fs::remove_all(dst, ec);
    if (ec) wxLogWarning("Could not remove partial copy %s: %s", dst, ec.message());
    return res;
  }
  return DeletePath(src);
}

OpResult DeletePath(const std::string& path) {
  if (!Exists(path)) return ErrorResult(ErrorKind::NotFound, wxString::Format("%s does not exist", path));
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) return FromErrorCode(ec);
  return OkResult();
}

OpResult RenamePath(const std::string& path, const std::string& newName) {
  if (!IsValidEntryName(newName)) {
    return ErrorResult(ErrorKind::Validation, wxString::Format("Invalid name: %s", newName));
  }
  if (!Exists(path)) return ErrorResult(ErrorKind::NotFound, wxString::Format("%s does not exist", path));
  const auto target = fs::path(path).parent_path() / newName;
  if (Exists(target)) return AlreadyExists(target);

  std::error_code ec;
  fs::rename(path, target, ec);
  if (ec) return FromErrorCode(ec);
  return OkResult();
}

OpResult ResolveUserPath(const std::string& input, std::string* out) {
  const auto trimmed = Trim(input);
  if (trimmed.empty()) return ErrorResult(ErrorKind::Validation, "Path cannot be empty");

  const auto home = HomeDir();
  const auto lower = ToLower(trimmed);
  std::string resolved;

  const auto userDir = [&](const char* key, const char* fallback) -> std::string {
    std::string xdg;
    const auto dirsFile = (fs::path(home) / ".config" / "user-dirs.dirs").string();
    if (!home.empty() && ReadXdgUserDir(dirsFile, key, &xdg).ok()) return xdg;
    return (fs::path(home) / fallback).string();
  };

  if (lower == "~" || lower == "home") {
    resolved = home;
  } else if (trimmed.rfind("~/", 0) == 0) {
    resolved = (fs::path(home) / trimmed.substr(2)).string();
  } else if (lower == "documents") {
    resolved = userDir("DOCUMENTS", "Documents");
  } else if (lower == "desktop") {
    resolved = userDir("DESKTOP", "Desktop");
  } else if (lower == "downloads") {
    resolved = userDir("DOWNLOAD", "Downloads");
  } else if (lower == "music") {
    resolved = userDir("MUSIC", "Music");
  } else if (lower == "pictures") {
    resolved = userDir("PICTURES", "Pictures");
  } else if (lower == "videos") {
    resolved = userDir("VIDEOS", "Videos");
  } else if (lower == "applications") {
    resolved = "/usr/share/applications";
  } else if (IsAbsolutePath(trimmed)) {
    resolved = trimmed;
  } else {
    return ErrorResult(ErrorKind::Validation, wxString::Format("Not an absolute path: %s", trimmed));
  }

  if (resolved.empty()) return ErrorResult(ErrorKind::NotFound, "Home directory is unknown");

  std::error_code ec;
  auto canon = fs::weakly_canonical(resolved, ec);
  if (ec) canon = fs::path(resolved).lexically_normal();
  if (out) *out = NormalizeDir(canon.string());
  return OkResult();
}

}  // namespace localfs

LocalStorageBackend::LocalStorageBackend(PostFn post)
    : post_(std::move(post)), worker_([this]() { WorkerLoop(); }) {}

LocalStorageBackend::~LocalStorageBackend() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void LocalStorageBackend::Enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void LocalStorageBackend::WorkerLoop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    job();
  }
}

void LocalStorageBackend::RunSimple(std::function<OpResult()> op, Completion done) {
  Enqueue([this, op = std::move(op), done = std::move(done)]() {
    OpResult res;
    try {
      res = op();
    } catch (const std::exception& e) {
      res = ErrorResult(ErrorKind::Runtime, wxString::FromUTF8(e.what()));
    }
    post_([done, res]() { done(res); });
  });
}

void LocalStorageBackend::List(const std::string& path, ListDone done) {
  Enqueue([this, path, done = std::move(done)]() {
    auto files = std::make_shared<std::vector<FileInfo>>();
    OpResult res;
    try {
      res = localfs::ListDir(path, files.get());
    } catch (const std::exception& e) {
      res = ErrorResult(ErrorKind::Runtime, wxString::FromUTF8(e.what()));
    }
    post_([done, res, files]() { done(res, std::move(*files)); });
  });
}

void LocalStorageBackend::Create(const std::string& dir, const std::string& name, EntryKind kind,
                                 Completion done) {
  RunSimple([dir, name, kind]() { return localfs::CreateEntry(dir, name, kind); }, std::move(done));
}

void LocalStorageBackend::Copy(const std::string& src, const std::string& dst, Completion done) {
  RunSimple([src, dst]() { return localfs::CopyPath(src, dst); }, std::move(done));
}

void LocalStorageBackend::Move(const std::string& src, const std::string& dst, Completion done) {
  RunSimple([src, dst]() { return localfs::MovePath(src, dst); }, std::move(done));
}

void LocalStorageBackend::Delete(const std::string& path, Completion done) {
  RunSimple([path]() { return localfs::DeletePath(path); }, std::move(done));
}

void LocalStorageBackend::Rename(const std::string& path, const std::string& newName, Completion done) {
  RunSimple([path, newName]() { return localfs::RenamePath(path, newName); }, std::move(done));
}

void LocalStorageBackend::ResolvePath(const std::string& input, PathDone done) {
  Enqueue([this, input, done = std::move(done)]() {
    std::string resolved;
    OpResult res;
    try {
      res = localfs::ResolveUserPath(input, &resolved);
    } catch (const std::exception& e) {
      res = ErrorResult(ErrorKind::Runtime, wxString::FromUTF8(e.what()));
    }
    post_([done, res, resolved]() { done(res, resolved); });
  });
}

}  // namespace mosaic
