#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gc::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process-wide logger configured from the --log_* flags.
void init();

void shutdown();

/// Log `event` followed by space-separated key=value pairs at info level.
void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace gc::log
