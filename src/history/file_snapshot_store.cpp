// Copyright 2026 The skitch Authors

#include "history/file_snapshot_store.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>
#include <utility>

#include "core/logger.h"

namespace fs = std::filesystem;

namespace skitch {
namespace internal {

namespace {

constexpr char kSnapshotExt[] = ".snap";
constexpr char kTempExt[] = ".snap.tmp";

// "<digits>.snap" -> id.  Anything else (temp files, strays) is ignored.
bool ParseSnapshotFileName(const std::string& name, SnapshotId* out) {
  const std::string ext = kSnapshotExt;
  if (name.size() <= ext.size()) return false;
  if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
    return false;
  }
  std::string stem = name.substr(0, name.size() - ext.size());
  for (char c : stem) {
    if (c < '0' || c > '9') return false;
  }
  char* end = nullptr;
  long long value = std::strtoll(stem.c_str(), &end, 10);
  if (!end || *end != '\0' || value <= 0) return false;
  *out = static_cast<SnapshotId>(value);
  return true;
}

}  // namespace

FileSnapshotStore::FileSnapshotStore(std::string dir) : dir_(std::move(dir)) {}

std::unique_ptr<FileSnapshotStore> FileSnapshotStore::Open(
    const std::string& dir) {
  if (dir.empty()) {
    SKITCH_LOG_ERROR("Snapshot store: empty directory path");
    return nullptr;
  }
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir, ec)) {
    SKITCH_LOG_ERROR("Snapshot store: cannot use directory {}: {}", dir,
                     ec ? ec.message() : "not a directory");
    return nullptr;
  }
  SKITCH_LOG_DEBUG("Snapshot store opened at {}", dir);
  return std::make_unique<FileSnapshotStore>(dir);
}

std::string FileSnapshotStore::PathFor(SnapshotId id) const {
  return dir_ + "/" + std::to_string(id) + kSnapshotExt;
}

bool FileSnapshotStore::Put(SnapshotId id, const Snapshot& snapshot) {
  std::string path = PathFor(id);
  std::string tmp = dir_ + "/" + std::to_string(id) + kTempExt;
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      SKITCH_LOG_ERROR("Snapshot store: cannot create {}", tmp);
      return false;
    }
    f.write(reinterpret_cast<const char*>(snapshot.data()),
            static_cast<std::streamsize>(snapshot.size()));
    f.flush();
    if (!f) {
      SKITCH_LOG_ERROR("Snapshot store: short write to {}", tmp);
      f.close();
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    SKITCH_LOG_ERROR("Snapshot store: rename {} failed: {}", tmp,
                     ec.message());
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

bool FileSnapshotStore::Get(SnapshotId id, Snapshot* out) {
  std::string path = PathFor(id);
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                             std::istreambuf_iterator<char>());
  if (f.bad()) {
    SKITCH_LOG_ERROR("Snapshot store: read error on {}", path);
    return false;
  }
  if (out) *out = Snapshot(std::move(bytes));
  return true;
}

bool FileSnapshotStore::Delete(SnapshotId id) {
  std::error_code ec;
  fs::remove(PathFor(id), ec);
  if (ec) {
    SKITCH_LOG_ERROR("Snapshot store: delete {} failed: {}", id,
                     ec.message());
    return false;
  }
  return true;
}

bool FileSnapshotStore::DeleteAllExcept(
    const std::unordered_set<SnapshotId>& live) {
  std::vector<SnapshotId> ids;
  if (!ListIds(&ids)) return false;
  bool ok = true;
  int removed = 0;
  for (SnapshotId id : ids) {
    if (live.count(id)) continue;
    if (Delete(id)) {
      ++removed;
    } else {
      ok = false;
    }
  }
  SKITCH_LOG_DEBUG("Snapshot store: collected {} unreferenced snapshots",
                   removed);
  return ok;
}

bool FileSnapshotStore::Clear() {
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    SKITCH_LOG_ERROR("Snapshot store: cannot list {}: {}", dir_,
                     ec.message());
    return false;
  }
  // Collect first; removing entries mid-iteration is unspecified.
  const std::string tmp_ext = kTempExt;
  std::vector<fs::path> doomed;
  while (it != fs::directory_iterator()) {
    std::string name = it->path().filename().string();
    SnapshotId id = 0;
    bool is_tmp = name.size() > tmp_ext.size() &&
                  name.compare(name.size() - tmp_ext.size(), tmp_ext.size(),
                               tmp_ext) == 0;
    if (is_tmp || ParseSnapshotFileName(name, &id)) {
      doomed.push_back(it->path());
    }
    it.increment(ec);
    if (ec) {
      SKITCH_LOG_ERROR("Snapshot store: listing {} failed: {}", dir_,
                       ec.message());
      return false;
    }
  }
  bool ok = true;
  for (const auto& path : doomed) {
    std::error_code rm_ec;
    fs::remove(path, rm_ec);
    if (rm_ec) {
      SKITCH_LOG_ERROR("Snapshot store: cannot remove {}: {}",
                       path.string(), rm_ec.message());
      ok = false;
    }
  }
  return ok;
}

bool FileSnapshotStore::ListIds(std::vector<SnapshotId>* out) {
  if (!out) return false;
  out->clear();
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    SKITCH_LOG_ERROR("Snapshot store: cannot list {}: {}", dir_,
                     ec.message());
    return false;
  }
  while (it != fs::directory_iterator()) {
    SnapshotId id = 0;
    if (ParseSnapshotFileName(it->path().filename().string(), &id)) {
      out->push_back(id);
    }
    it.increment(ec);
    if (ec) {
      SKITCH_LOG_ERROR("Snapshot store: listing {} failed: {}", dir_,
                       ec.message());
      return false;
    }
  }
  return true;
}

}  // namespace internal
}  // namespace skitch
