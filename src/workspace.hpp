#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "result.hpp"

constexpr size_t max_session_id_length = 255;

// a session id become a directory name, so it must be a single, plain path component.
bool valid_session_id(const std::string& id);

// whether a file with this name is reported back as an artifact.
bool is_artifact_name(const std::filesystem::path& filename);

struct FileStamp {
  uintmax_t size;
  std::filesystem::file_time_type mtime;
  bool operator==(const FileStamp& rhs) const {
    return size == rhs.size && mtime == rhs.mtime;
  }
  bool operator!=(const FileStamp& rhs) const {
    return !(*this == rhs);
  }
};

// regular files at the top level of a workspace, by name.
using Snapshot = std::map<std::string, FileStamp>;

Snapshot snapshot(const std::filesystem::path& dir);

// recognized files that are new, or whose size or mtime changed, since before. sorted by name.
std::vector<std::string> artifacts(const std::filesystem::path& dir, const Snapshot& before);

// resolve a path given by submitted code against its workspace.
// throw CapabilityDenied if the result lie outside of the workspace.
std::filesystem::path resolve(const std::filesystem::path& workdir, const std::string& relative);

struct WorkspaceManager {
  std::filesystem::path root;
  explicit WorkspaceManager(const std::filesystem::path& root);
  std::filesystem::path path_for(const std::string& session_id) const {
    return root / session_id;
  }
  // create root/session_id if it does not exist yet. throw std::runtime_error when it cannot be created.
  std::filesystem::path ensure_dir(const std::string& session_id) const;
};
