#include <revscope/util/config.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace revscope {
    namespace {
        std::string lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::mutex &config_lock() {
            static std::mutex lock;
            return lock;
        }

        RevscopeConfig &mutable_config() {
            static RevscopeConfig cfg{RevscopeConfig::from_environment()};
            return cfg;
        }
    }

    spdlog::level::level_enum parse_log_level(const std::string &value) {
        auto v{lower(value)};
        if (v == "warn") { v = "warning"; }
        if (v == "err") { v = "error"; }
        auto level{spdlog::level::from_str(v)};
        // from_str maps anything it does not understand to off, so only accept off when it was asked for.
        if (level == spdlog::level::off && v != "off") {
            throw_error<RevscopeError>("Invalid log level '{}'", value);
        }
        return level;
    }

    bool parse_flag(const std::string &value) {
        auto v{lower(value)};
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }

    RevscopeConfig RevscopeConfig::from_environment() {
        RevscopeConfig cfg;
        if (const char *level = std::getenv("REVSCOPE_LOG_LEVEL"); level != nullptr) {
            cfg.log_level = parse_log_level(level);
        }
        if (const char *db = std::getenv("REVSCOPE_DEFAULT_DB"); db != nullptr && *db != '\0') {
            cfg.default_db = db;
        }
        if (const char *warn = std::getenv("REVSCOPE_WARN_MISSING_RELATIONS"); warn != nullptr) {
            cfg.warn_on_missing_relations = parse_flag(warn);
        }
        return cfg;
    }

    RevscopeConfig config() {
        std::lock_guard guard{config_lock()};
        return mutable_config();
    }

    void set_config(RevscopeConfig cfg) {
        const auto level{cfg.log_level};
        {
            std::lock_guard guard{config_lock()};
            mutable_config() = std::move(cfg);
        }
        logger()->set_level(level);
    }
} // namespace revscope
