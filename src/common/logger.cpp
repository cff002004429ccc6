#include "nscache/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>

namespace nscache {

void Logger::init() {
  try {
    auto console = spdlog::stdout_color_mt("nscache");
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::set_level(spdlog::level::info);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "nscache: log initialization failed: " << ex.what() << "\n";
  }
}

void Logger::set_level(spdlog::level::level_enum level) {
  spdlog::set_level(level);
}

} // namespace nscache
