#include "nscache/types.hpp"

namespace nscache {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidNamespace:
    return "invalid_namespace";
  case ErrorCode::UnknownStrategy:
    return "unknown_strategy";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::ParseError:
    return "parse_error";
  case ErrorCode::FetchError:
    return "fetch_error";
  }
  return "unknown";
}

} // namespace nscache
