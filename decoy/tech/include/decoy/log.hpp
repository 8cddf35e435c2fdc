#pragma once

// Logging abstraction, backed by spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace decoy {

namespace log = spdlog;

}  // namespace decoy
