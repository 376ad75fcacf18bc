#pragma once

// Logging facade. The library logs exclusively through spdlog; header-only mode is forced locally so that the
// compiled spdlog variant can still be linked by consumers without redefinition warnings.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace trellis {

namespace log = spdlog;

}  // namespace trellis
