#pragma once

// Logging facade of the library, a thin alias over spdlog.
// Link against the compiled spdlog target (with external fmt) rather than forcing header-only mode,
// so that consumers configuring spdlog themselves share the same registry.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace routepat {

namespace log = spdlog;

}  // namespace routepat
