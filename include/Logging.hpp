#pragma once

#include "Config.hpp"
#include <spdlog/common.h>
#include <string>

namespace dbscope {

// Install the default logger: colored console sink and/or a file sink
void setupLogging(const LoggingConfig& config);

// "trace".."off"; unknown names map to info
spdlog::level::level_enum levelFromString(const std::string& name);

}  // namespace dbscope
