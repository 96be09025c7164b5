#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace twosum {

constexpr std::string_view LOGGER_NAME = "twosum";

/// Library-wide diagnostic logger. Always writes to stderr because stdout
/// is reserved for protocol records. Created on first use at warn level.
std::shared_ptr<spdlog::logger> logger();

} // namespace twosum
