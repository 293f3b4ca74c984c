#include "util.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace fs = std::filesystem;

namespace mosaic {

OpResult OkResult() { return {.code = OpCode::Ok}; }

OpResult SkippedResult(const wxString& message) {
  return {.code = OpCode::Skipped, .message = message};
}

OpResult ErrorResult(ErrorKind kind, const wxString& message) {
  return {.code = OpCode::Error, .kind = kind, .message = message};
}

OpResult CanceledResult(const wxString& message) {
  return {.code = OpCode::Cancelled, .message = message};
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::AlreadyExists: return "already-exists";
    case ErrorKind::Backend: return "backend";
    case ErrorKind::Runtime: return "runtime";
  }
  return "unknown";
}

std::string HumanSize(std::uintmax_t bytes) {
  static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 5) {
    value /= 1024.0;
    unit++;
  }
  char buf[64];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s",
                  static_cast<unsigned long long>(bytes), units[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  }
  return std::string(buf);
}

std::string FormatFileTime(const fs::file_time_type& ft) {
  using namespace std::chrono;
  if (ft == fs::file_time_type{}) return "";

  const auto sctp = time_point_cast<system_clock::duration>(
      ft - fs::file_time_type::clock::now() + system_clock::now());

  const std::time_t tt = system_clock::to_time_t(sctp);
  std::tm tm{};
  localtime_r(&tt, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min);
  return std::string(buf);
}

std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool ContainsNoCase(const std::string& haystack, const std::string& needleLower) {
  if (needleLower.empty()) return true;
  return ToLower(haystack).find(needleLower) != std::string::npos;
}

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

std::string NormalizeDir(const std::string& dir) {
  std::string out = dir;
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
  const auto base = NormalizeDir(dir);
  if (base.empty()) return name;
  if (base.back() == '/') return base + name;
  return base + "/" + name;
}

std::string BaseName(const std::string& path) {
  const auto p = NormalizeDir(path);
  if (p == "/") return "";
  const auto slash = p.rfind('/');
  if (slash == std::string::npos) return p;
  return p.substr(slash + 1);
}

std::string ParentPath(const std::string& path) {
  const auto p = NormalizeDir(path);
  const auto slash = p.rfind('/');
  if (slash == std::string::npos) return "";
  if (slash == 0) return "/";
  return p.substr(0, slash);
}

bool IsAbsolutePath(const std::string& path) {
  if (!path.empty() && path.front() == '/') return true;
  // Drive-letter paths coming from a Windows backend.
  return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) &&
         path[1] == ':' && (path[2] == '\\' || path[2] == '/');
}

bool IsValidEntryName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string UniqueName(const std::string& name, const std::set<std::string>& taken) {
  if (taken.count(name) == 0) return name;

  // Leading dot files (".bashrc") have no extension.
  const auto dot = name.rfind('.');
  const bool hasExt = dot != std::string::npos && dot > 0;
  const auto stem = hasExt ? name.substr(0, dot) : name;
  const auto ext = hasExt ? name.substr(dot) : std::string{};

  for (int n = 1;; n++) {
    auto candidate = stem + " (" + std::to_string(n) + ")" + ext;
    if (taken.count(candidate) == 0) return candidate;
  }
}

OpResult ParseFileInput(const std::string& input,
                        const std::string& currentPath,
                        std::string* targetDir,
                        std::string* fileName) {
  const auto trimmed = Trim(input);
  if (trimmed.empty()) return ErrorResult(ErrorKind::Validation, "Name cannot be empty");

  auto typed = trimmed;
  for (auto& c : typed) {
    if (c == '\\') c = '/';
  }
  const std::string full = IsAbsolutePath(typed) ? typed : JoinPath(currentPath, typed);

  const auto slash = full.rfind('/');
  std::string dir = currentPath;
  std::string name = full;
  if (slash != std::string::npos) {
    dir = slash == 0 ? "/" : full.substr(0, slash);
    name = full.substr(slash + 1);
  }

  if (name.empty()) return ErrorResult(ErrorKind::Validation, "Name cannot be empty");
  if (!IsValidEntryName(name)) {
    return ErrorResult(ErrorKind::Validation, wxString::Format("Invalid name: %s", name));
  }

  if (targetDir) *targetDir = dir;
  if (fileName) *fileName = name;
  return OkResult();
}

}  // namespace mosaic
