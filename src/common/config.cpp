#include "nscache/config.hpp"
#include "nscache/logger.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace nscache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = std::stoll(m[1].str());
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
} // namespace

NamespaceConfig merge_config(const NamespaceConfig &base,
                             const NamespaceOptions &overrides) {
  NamespaceConfig cfg = base;
  if (overrides.max_entries)
    cfg.max_entries = *overrides.max_entries;
  if (overrides.default_ttl_ms) {
    if (*overrides.default_ttl_ms > 0)
      cfg.default_ttl_ms = overrides.default_ttl_ms;
    else
      cfg.default_ttl_ms.reset();
  }
  if (overrides.strategy)
    cfg.strategy = *overrides.strategy;
  if (overrides.enable_stats)
    cfg.enable_stats = *overrides.enable_stats;
  if (overrides.event_capacity)
    cfg.event_capacity = *overrides.event_capacity;
  if (overrides.on_evict)
    cfg.on_evict = overrides.on_evict;
  if (overrides.on_stale)
    cfg.on_stale = overrides.on_stale;
  return cfg;
}

bool validate_config(const NamespaceConfig &cfg, Error *err) {
  if (cfg.max_entries == 0) {
    fail(err, ErrorCode::InvalidConfig, "max_entries must be greater than 0");
    return false;
  }
  if (cfg.max_entries > kMaxEntriesLimit) {
    fail(err, ErrorCode::InvalidConfig,
         "max_entries must not exceed " + std::to_string(kMaxEntriesLimit));
    return false;
  }
  if (cfg.strategy.empty()) {
    fail(err, ErrorCode::InvalidConfig, "strategy name must not be empty");
    return false;
  }
  return true;
}

bool load_namespace_defaults(const std::string &path, NamespaceConfig &cfg,
                             std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  NamespaceConfig next = cfg;
  std::int64_t i;
  bool b;
  std::string s;
  if (extract_i64(text, "max_entries", i))
    next.max_entries = static_cast<std::size_t>(
        std::clamp<std::int64_t>(
            i, 1, static_cast<std::int64_t>(kMaxEntriesLimit)));
  if (extract_i64(text, "default_ttl_ms", i)) {
    if (i > 0)
      next.default_ttl_ms = std::min<std::int64_t>(i, 365LL * 24 * 3600 * 1000);
    else
      next.default_ttl_ms.reset();
  }
  if (extract_i64(text, "event_capacity", i))
    next.event_capacity =
        static_cast<std::size_t>(std::clamp<std::int64_t>(i, 0, 1000000));
  if (extract_bool(text, "enable_stats", b))
    next.enable_stats = b;
  if (extract_string(text, "strategy", s)) {
    if (s.empty()) {
      if (err)
        *err = "strategy must not be empty";
      return false;
    }
    next.strategy = s;
  }

  cfg = std::move(next);
  NSCACHE_INFO("nscache: loaded namespace defaults from {} (max_entries={}, "
               "strategy={})",
               path, cfg.max_entries, cfg.strategy);
  return true;
}

} // namespace nscache
