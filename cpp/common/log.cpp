#include "lenia/log.hpp"
#include "lenia/errors.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lenia {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get("lenia")) {
            spdlog::stdout_color_mt("lenia");
        }
    });
    return spdlog::get("lenia");
}

void set_log_level(const std::string& level) {
    const spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    // from_str maps anything unknown to "off"
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigurationError("unknown log level '" + level + "'");
    }
    logger()->set_level(lvl);
}

}
