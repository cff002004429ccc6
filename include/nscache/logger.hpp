#pragma once

#include <spdlog/spdlog.h>

namespace nscache {

class Logger {
public:
  static void init();
  static void set_level(spdlog::level::level_enum level);
};

} // namespace nscache

#define NSCACHE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define NSCACHE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define NSCACHE_INFO(...) spdlog::info(__VA_ARGS__)
#define NSCACHE_WARN(...) spdlog::warn(__VA_ARGS__)
#define NSCACHE_ERROR(...) spdlog::error(__VA_ARGS__)
#define NSCACHE_CRITICAL(...) spdlog::critical(__VA_ARGS__)
