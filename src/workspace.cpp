#include "workspace.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const std::set<std::string> artifact_extensions = {
  // image
  ".png", ".jpg", ".jpeg", ".gif", ".svg", ".bmp",
  // tabular
  ".csv", ".tsv", ".xls", ".xlsx",
  // text
  ".txt", ".md", ".log",
  // structured data
  ".json", ".html", ".xml",
};

std::string lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

// is path inside of dir? both are lexically normal and absolute.
bool contained(const fs::path& dir, const fs::path& path) {
  auto d = dir.begin();
  auto p = path.begin();
  for (; d != dir.end(); ++d, ++p) {
    // a trailing separator yield an empty last component.
    if (d->empty() && std::next(d) == dir.end()) {
      break;
    }
    if (p == path.end() || *d != *p) {
      return false;
    }
  }
  return true;
}

} // namespace

bool valid_session_id(const std::string& id) {
  if (id.empty() || id.size() > max_session_id_length) {
    return false;
  }
  if (id == "." || id == "..") {
    return false;
  }
  return id.find('/') == std::string::npos && id.find('\0') == std::string::npos;
}

bool is_artifact_name(const fs::path& filename) {
  return artifact_extensions.count(lower(filename.extension().string())) != 0;
}

Snapshot snapshot(const fs::path& dir) {
  Snapshot ret;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code stat_ec;
    if (!it->is_regular_file(stat_ec)) {
      continue;
    }
    FileStamp stamp {it->file_size(stat_ec), it->last_write_time(stat_ec)};
    // the file may be gone already.
    if (!stat_ec) {
      ret.insert({it->path().filename().string(), stamp});
    }
  }
  return ret;
}

std::vector<std::string> artifacts(const fs::path& dir, const Snapshot& before) {
  std::vector<std::string> ret;
  // a std::map iterate in name order, so ret is sorted and unique.
  for (const auto& p : snapshot(dir)) {
    if (!is_artifact_name(p.first)) {
      continue;
    }
    auto it = before.find(p.first);
    if (it == before.end() || it->second != p.second) {
      ret.push_back(p.first);
    }
  }
  return ret;
}

fs::path resolve(const fs::path& workdir, const std::string& relative) {
  if (relative.find('\0') != std::string::npos) {
    throw CapabilityDenied("path contains a NUL byte");
  }
  fs::path base = fs::absolute(workdir).lexically_normal();
  fs::path path = (base / relative).lexically_normal();
  // "." and "sub/.." normalize to "base/". drop the trailing separator so it compare equal to base.
  if (path.has_relative_path() && path.filename().empty()) {
    path = path.parent_path();
  }
  if (!contained(base, path)) {
    throw CapabilityDenied("access to " + relative + " outside of the workspace is disabled for security");
  }
  // symlinks may still point outside, so check where the existing part really goes.
  std::error_code ec, base_ec;
  fs::path real = fs::weakly_canonical(path, ec);
  fs::path real_base = fs::weakly_canonical(base, base_ec);
  if (!ec && !base_ec && !contained(real_base, real)) {
    throw CapabilityDenied("access to " + relative + " outside of the workspace is disabled for security");
  }
  return path;
}

WorkspaceManager::WorkspaceManager(const fs::path& root) : root(fs::absolute(root).lexically_normal()) { }

fs::path WorkspaceManager::ensure_dir(const std::string& session_id) const {
  if (!valid_session_id(session_id)) {
    throw std::runtime_error("invalid session id '" + session_id + "'");
  }
  fs::path dir = path_for(session_id);
  std::error_code ec;
  // create_directories does not fail when another thread won the race.
  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir)) {
    throw std::runtime_error("cannot create workspace " + dir.string() + ": " + ec.message());
  }
  return dir;
}
