// Copyright 2026 The skitch Authors
//
// Session configuration, read from ~/.config/skitch/settings.ini.

#ifndef SKITCH_CORE_SKITCH_CONFIG_H_
#define SKITCH_CORE_SKITCH_CONFIG_H_

#include <cstddef>
#include <string>

#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// History engine limits and timings.
struct HistoryConfig {
  int max_undo_steps = 100;
  int cache_capacity = 20;
  int debounce_ms = 150;
  int settle_ms = 500;
  int gc_interval = 25;  // Captures between store garbage collections.
  size_t write_queue_capacity = 64;
  SkitchWritePolicy write_policy = kSkitchWritePolicyBlock;
};

struct SkitchConfig {
  HistoryConfig history;
  std::string store_dir;  // Empty = DefaultStoreDir().
  SkitchLogLevel log_level = kSkitchLogInfo;
  bool log_level_configured = false;  // log_level came from settings.ini.
  int canvas_width = 1200;
  int canvas_height = 750;

  /// Load `path` on top of the current values.  A missing file is not an
  /// error (returns false, values untouched).  Invalid values are logged
  /// and skipped.
  bool LoadFromFile(const std::string& path);

  /// Apply one `key=value` setting.  Returns false for unknown keys or
  /// values that fail validation.
  bool Apply(const std::string& key, const std::string& value);

  /// Overlay the non-zero fields of public options.
  void ApplyOptions(const SkitchOptions& options);

  /// Directory snapshots are written to (store_dir or the default).
  std::string ResolvedStoreDir() const;
};

/// $XDG_CONFIG_HOME/skitch/settings.ini (or ~/.config/..., or /tmp/...).
std::string DefaultConfigPath();

/// $XDG_CACHE_HOME/skitch/history (or ~/.cache/..., or /tmp/...).
std::string DefaultStoreDir();

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_SKITCH_CONFIG_H_
