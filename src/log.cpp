#include <cstdlib>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <flatdata/log.hpp>

namespace flatdata {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
  auto existing = spdlog::get("flatdata");
  auto log = existing ? existing : spdlog::stderr_color_mt("flatdata");

  log->set_level(spdlog::level::warn);
  if (const char *env = std::getenv("FLATDATA_LOG_LEVEL"); env) {
    // from_str maps unknown names to off, keep the default instead
    auto level = spdlog::level::from_str(env);
    if (level != spdlog::level::off || std::string_view(env) == "off") {
      log->set_level(level);
    }
  }
  return log;
}

} // namespace

spdlog::logger &logger() {
  static std::shared_ptr<spdlog::logger> instance = createLogger();
  return *instance;
}

void setLogLevel(spdlog::level::level_enum level) {
  logger().set_level(level);
}

} // namespace flatdata
