#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace nscache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using Tags = std::map<std::string, std::string>;

struct CacheEntry {
  std::any value;
  std::string key;
  std::string ns;
  TimePoint created_at{};
  TimePoint accessed_at{};
  std::optional<TimePoint> expires_at;
  std::uint64_t access_count{0};
  std::size_t approx_size_bytes{0};
  // Insertion order within the owning store; refreshed on overwrite.
  std::uint64_t sequence{0};
  Tags tags;
};

using EntryTable = std::unordered_map<std::string, CacheEntry>;

struct SetOptions {
  std::optional<std::int64_t> ttl_ms;
  // Reserved; none of the built-in strategies read it.
  double priority{0.0};
  Tags metadata;
};

enum class ErrorCode {
  None,
  InvalidNamespace,
  UnknownStrategy,
  InvalidConfig,
  ParseError,
  FetchError,
};

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

const char *to_string(ErrorCode code);

inline void fail(Error *err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
}

} // namespace nscache
