#include "nscache/keys.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <vector>

namespace nscache {
namespace {

bool reserved(char c) { return c == '%' || c == ':' || c == '&' || c == '='; }

std::string encode(const std::string &s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (reserved(c)) {
      const auto u = static_cast<unsigned char>(c);
      out.push_back('%');
      out.push_back(kHex[u >> 4]);
      out.push_back(kHex[u & 0x0F]);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

std::optional<std::string> decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      out.push_back(s[i]);
      continue;
    }
    if (i + 2 >= s.size())
      return std::nullopt;
    const int hi = hex_value(s[i + 1]);
    const int lo = hex_value(s[i + 2]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// Saturates at TimePoint::max() instead of overflowing the clock's rep.
TimePoint deadline_after(TimePoint now, std::int64_t ttl_ms) {
  const auto headroom =
      std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() -
                                                            now)
          .count();
  if (ttl_ms >= headroom)
    return TimePoint::max();
  return now + std::chrono::milliseconds(ttl_ms);
}

} // namespace

std::string generate_key(const std::string &entity_type,
                         const std::string &entity_id,
                         const KeyParams &params) {
  std::string key = encode(entity_type) + ":" + encode(entity_id);
  if (params.empty())
    return key;
  key.push_back(':');
  bool first = true;
  for (const auto &[name, value] : params) {
    if (!first)
      key.push_back('&');
    first = false;
    key += encode(name) + "=" + encode(value);
  }
  return key;
}

std::optional<ParsedKey> parse_key(const std::string &key, Error *err) {
  const auto segments = split(key, ':');
  if (segments.size() < 2 || segments.size() > 3) {
    fail(err, ErrorCode::ParseError,
         "expected 2 or 3 ':'-separated segments in key: " + key);
    return std::nullopt;
  }
  ParsedKey out;
  auto type = decode(segments[0]);
  auto id = decode(segments[1]);
  if (!type || !id) {
    fail(err, ErrorCode::ParseError, "malformed escape in key: " + key);
    return std::nullopt;
  }
  if (type->empty() || id->empty()) {
    fail(err, ErrorCode::ParseError, "empty entity type or id in key: " + key);
    return std::nullopt;
  }
  out.entity_type = std::move(*type);
  out.entity_id = std::move(*id);

  if (segments.size() == 3) {
    for (const auto pair : split(segments[2], '&')) {
      const auto eq = pair.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        fail(err, ErrorCode::ParseError, "malformed parameter in key: " + key);
        return std::nullopt;
      }
      auto name = decode(pair.substr(0, eq));
      auto value = decode(pair.substr(eq + 1));
      if (!name || !value) {
        fail(err, ErrorCode::ParseError, "malformed escape in key: " + key);
        return std::nullopt;
      }
      out.params[std::move(*name)] = std::move(*value);
    }
  }
  return out;
}

bool validate_namespace(std::string_view name) {
  if (name.empty() || name.size() > kMaxNamespaceLength)
    return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
}

std::optional<TimePoint>
calculate_expiry(std::optional<std::int64_t> ttl_ms,
                 std::optional<std::int64_t> default_ttl_ms, TimePoint now) {
  if (ttl_ms.has_value() && *ttl_ms > 0)
    return deadline_after(now, *ttl_ms);
  if (default_ttl_ms.has_value() && *default_ttl_ms > 0)
    return deadline_after(now, *default_ttl_ms);
  return std::nullopt;
}

bool is_expired(const CacheEntry &entry, TimePoint now) {
  return entry.expires_at.has_value() && now > *entry.expires_at;
}

} // namespace nscache
