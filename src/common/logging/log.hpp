#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tuid::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the default logger from the `--log_*` flags. Safe to call twice.
void init();

void shutdown();

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace tuid::log
