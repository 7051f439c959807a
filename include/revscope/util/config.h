#ifndef REVSCOPE_UTIL_CONFIG_H
#define REVSCOPE_UTIL_CONFIG_H

#include <revscope/revscope_export.h>

#include <spdlog/common.h>

#include <string>

namespace revscope {
    /**
     * Process wide settings. The initial values are read from the environment the first time ``config()`` is
     * called:
     *
     * * ``REVSCOPE_LOG_LEVEL`` - one of trace, debug, info, warning, error, critical, off (default: warning)
     * * ``REVSCOPE_DEFAULT_DB`` - alias of the transactional resource used when none is selected (default: default)
     * * ``REVSCOPE_WARN_MISSING_RELATIONS`` - when set to 1/true/yes/on a followed relation that no longer resolves
     *   is logged as a warning instead of being skipped silently.
     */
    struct REVSCOPE_EXPORT RevscopeConfig {
        spdlog::level::level_enum log_level{spdlog::level::warn};
        std::string default_db{"default"};
        bool warn_on_missing_relations{false};

        static RevscopeConfig from_environment();
    };

    // A copy of the process configuration, safe to hold while another thread calls ``set_config``.
    REVSCOPE_EXPORT RevscopeConfig config();

    // Replaces the process configuration and re-applies the log level.
    REVSCOPE_EXPORT void set_config(RevscopeConfig cfg);

    REVSCOPE_EXPORT spdlog::level::level_enum parse_log_level(const std::string &value);

    REVSCOPE_EXPORT bool parse_flag(const std::string &value);
} // namespace revscope

#endif  // REVSCOPE_UTIL_CONFIG_H
