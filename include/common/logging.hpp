#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace mpmm {

// Installs the colored stdout "mpmm" logger as spdlog's default.
// level: trace, debug, info, warn, error, off. Unknown names fall back to info.
void init_logging(const std::string& level = "info");

std::shared_ptr<spdlog::logger> logger();

} // namespace mpmm
