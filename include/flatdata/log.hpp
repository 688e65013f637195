#pragma once

#include <spdlog/spdlog.h>

namespace flatdata {

// Library logger named "flatdata", writing to stderr.
// The initial level comes from FLATDATA_LOG_LEVEL (trace, debug, info, warn,
// error, critical, off) and defaults to warn.
spdlog::logger &logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace flatdata
