#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>

#include <wx/string.h>

namespace mosaic {

enum class OpCode { Ok, Error, Cancelled, Skipped };
enum class ErrorKind { None, Validation, NotFound, AlreadyExists, Backend, Runtime };

struct OpResult {
  OpCode code{OpCode::Ok};
  ErrorKind kind{ErrorKind::None};
  wxString message;
  // Set once the outcome has already been surfaced to the user.
  bool reported{false};

  bool ok() const { return code == OpCode::Ok || code == OpCode::Skipped; }
  bool failed() const { return code == OpCode::Error; }
  bool cancelled() const { return code == OpCode::Cancelled; }
};

using Completion = std::function<void(const OpResult& result)>;

OpResult OkResult();
OpResult SkippedResult(const wxString& message = {});
OpResult ErrorResult(ErrorKind kind, const wxString& message);
OpResult CanceledResult(const wxString& message = "Canceled");

const char* ErrorKindName(ErrorKind kind);

std::string HumanSize(std::uintmax_t bytes);
std::string FormatFileTime(const std::filesystem::file_time_type& ft);

std::string ToLower(std::string s);
bool ContainsNoCase(const std::string& haystack, const std::string& needleLower);
std::string Trim(const std::string& s);

// Paths are plain '/'-separated strings so remote backends can reuse them.
// A backslash is an ordinary name character here.
std::string NormalizeDir(const std::string& dir);
std::string JoinPath(const std::string& dir, const std::string& name);
std::string BaseName(const std::string& path);
std::string ParentPath(const std::string& path);
bool IsAbsolutePath(const std::string& path);
bool IsValidEntryName(const std::string& name);

// Returns "stem (N).ext" with the smallest N >= 1 not present in `taken`.
std::string UniqueName(const std::string& name, const std::set<std::string>& taken);

// Splits user input ("notes.txt", "sub/notes.txt", "/abs/notes.txt") into the
// directory to create in and the entry name. Typed backslashes separate
// folders like slashes do.
OpResult ParseFileInput(const std::string& input,
                        const std::string& currentPath,
                        std::string* targetDir,
                        std::string* fileName);

}  // namespace mosaic
