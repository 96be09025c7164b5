#include "twosum/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace twosum {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        const std::string name(LOGGER_NAME);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

} // namespace twosum
