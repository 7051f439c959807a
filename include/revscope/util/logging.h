#ifndef REVSCOPE_UTIL_LOGGING_H
#define REVSCOPE_UTIL_LOGGING_H

#include <revscope/revscope_export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace revscope {
    /**
     * The library logger, named ``revscope``. It is created on first use with the level from ``config()`` and
     * registered with spdlog so applications can re-route it with ``spdlog::get("revscope")``.
     */
    REVSCOPE_EXPORT std::shared_ptr<spdlog::logger> logger();
} // namespace revscope

#endif  // REVSCOPE_UTIL_LOGGING_H
