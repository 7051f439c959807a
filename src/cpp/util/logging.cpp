#include <revscope/util/config.h>
#include <revscope/util/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>


namespace revscope {
    namespace {
        constexpr const char *LOGGER_NAME = "revscope";
    }

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(LOGGER_NAME); existing) { return existing; }
            auto created = spdlog::stderr_color_mt(LOGGER_NAME);
            created->set_level(config().log_level);
            return created;
        }();
        return instance;
    }
} // namespace revscope
