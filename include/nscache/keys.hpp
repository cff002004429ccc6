#pragma once

#include "nscache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace nscache {

using KeyParams = std::map<std::string, std::string>;

struct ParsedKey {
  std::string entity_type;
  std::string entity_id;
  KeyParams params;

  bool operator==(const ParsedKey &) const = default;
};

// <type>:<id>[:<k1>=<v1>&<k2>=<v2>...], params ordered by name and every
// component percent-encoded for the reserved characters % : & =.
std::string generate_key(const std::string &entity_type,
                         const std::string &entity_id,
                         const KeyParams &params = {});

std::optional<ParsedKey> parse_key(const std::string &key,
                                   Error *err = nullptr);

// [A-Za-z0-9_-]{1,50}
bool validate_namespace(std::string_view name);

std::optional<TimePoint>
calculate_expiry(std::optional<std::int64_t> ttl_ms,
                 std::optional<std::int64_t> default_ttl_ms,
                 TimePoint now = Clock::now());

bool is_expired(const CacheEntry &entry, TimePoint now = Clock::now());

inline constexpr std::size_t kMaxNamespaceLength = 50;

// Returned by estimate_size for values it cannot measure.
inline constexpr std::size_t kUnknownSizeBytes = 1024;

namespace detail {
template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};
} // namespace detail

template <typename T> std::size_t estimate_size(const T &value) noexcept {
  if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
    return sizeof(T);
  } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
    return std::string_view(value).size();
  } else if constexpr (detail::is_pair<T>::value) {
    return estimate_size(value.first) + estimate_size(value.second);
  } else if constexpr (std::ranges::range<const T>) {
    std::size_t total = 0;
    for (const auto &item : value)
      total += estimate_size(item);
    return total;
  } else if constexpr (std::is_trivially_copyable_v<T>) {
    return sizeof(T);
  } else {
    return kUnknownSizeBytes;
  }
}

} // namespace nscache
