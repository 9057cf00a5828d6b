// Copyright 2026 The skitch Authors

#include "core/skitch_config.h"

#include <cstdlib>
#include <fstream>

#include "core/logger.h"

namespace skitch {
namespace internal {

namespace {

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value && value[0]) return value;
  return fallback;
}

std::string HomeSubdir(const char* subdir) {
  const char* home = std::getenv("HOME");
  if (home && home[0]) return std::string(home) + "/" + subdir;
  return "/tmp";
}

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return std::string();
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

// Parse a decimal integer in [min_value, max_value].
bool ParseInt(const std::string& text, int min_value, int max_value,
              int* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (!end || *end != '\0') return false;
  if (value < min_value || value > max_value) return false;
  *out = static_cast<int>(value);
  return true;
}

}  // namespace

std::string DefaultConfigPath() {
  return EnvOr("XDG_CONFIG_HOME", HomeSubdir(".config")) +
         "/skitch/settings.ini";
}

std::string DefaultStoreDir() {
  return EnvOr("XDG_CACHE_HOME", HomeSubdir(".cache")) + "/skitch/history";
}

bool SkitchConfig::LoadFromFile(const std::string& path) {
  std::ifstream f(path);
  if (!f) return false;

  std::string line;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    line = Trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      SKITCH_LOG_WARN("{}:{}: expected key=value", path, line_no);
      continue;
    }
    std::string key = Trim(line.substr(0, eq));
    std::string value = Trim(line.substr(eq + 1));
    if (!Apply(key, value)) {
      SKITCH_LOG_WARN("{}:{}: ignoring setting '{}={}'", path, line_no, key,
                      value);
    }
  }
  SKITCH_LOG_DEBUG("Loaded settings from {}", path);
  return true;
}

bool SkitchConfig::Apply(const std::string& key, const std::string& value) {
  int n = 0;
  if (key == "max_undo_steps") {
    if (!ParseInt(value, 1, 10000, &n)) return false;
    history.max_undo_steps = n;
  } else if (key == "cache_capacity") {
    if (!ParseInt(value, 1, 10000, &n)) return false;
    history.cache_capacity = n;
  } else if (key == "debounce_ms") {
    if (!ParseInt(value, 0, 60000, &n)) return false;
    history.debounce_ms = n;
  } else if (key == "settle_ms") {
    if (!ParseInt(value, 0, 60000, &n)) return false;
    history.settle_ms = n;
  } else if (key == "gc_interval") {
    if (!ParseInt(value, 0, 100000, &n)) return false;
    history.gc_interval = n;
  } else if (key == "write_queue_capacity") {
    if (!ParseInt(value, 1, 100000, &n)) return false;
    history.write_queue_capacity = static_cast<size_t>(n);
  } else if (key == "write_queue_policy") {
    if (value == "block") {
      history.write_policy = kSkitchWritePolicyBlock;
    } else if (value == "drop_oldest") {
      history.write_policy = kSkitchWritePolicyDropOldest;
    } else {
      return false;
    }
  } else if (key == "store_dir") {
    if (value.empty()) return false;
    store_dir = value;
  } else if (key == "log_level") {
    if (!ParseLogLevel(value.c_str(), &log_level)) return false;
    log_level_configured = true;
  } else if (key == "canvas_width") {
    if (!ParseInt(value, 1, 32768, &n)) return false;
    canvas_width = n;
  } else if (key == "canvas_height") {
    if (!ParseInt(value, 1, 32768, &n)) return false;
    canvas_height = n;
  } else {
    return false;
  }
  return true;
}

void SkitchConfig::ApplyOptions(const SkitchOptions& options) {
  if (options.store_dir && options.store_dir[0]) store_dir = options.store_dir;
  if (options.max_undo_steps > 0) {
    history.max_undo_steps = options.max_undo_steps;
  }
  if (options.cache_capacity > 0) {
    history.cache_capacity = options.cache_capacity;
  }
  if (options.debounce_ms > 0) history.debounce_ms = options.debounce_ms;
  if (options.settle_ms > 0) {
    history.settle_ms = options.settle_ms;
  } else if (options.settle_ms < 0) {
    history.settle_ms = 0;
  }
  if (options.write_queue_capacity > 0) {
    history.write_queue_capacity =
        static_cast<size_t>(options.write_queue_capacity);
  }
  if (options.write_policy != kSkitchWritePolicyBlock) {
    history.write_policy = options.write_policy;
  }
  if (options.canvas_width > 0) canvas_width = options.canvas_width;
  if (options.canvas_height > 0) canvas_height = options.canvas_height;
}

std::string SkitchConfig::ResolvedStoreDir() const {
  return store_dir.empty() ? DefaultStoreDir() : store_dir;
}

}  // namespace internal
}  // namespace skitch
