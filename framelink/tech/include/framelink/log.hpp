#pragma once

// Logging goes through spdlog. Placeholders are fmt-style: log::debug("fd # {} closed", fd);
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace framelink {

namespace log = spdlog;

}  // namespace framelink
