#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "spdlog/spdlog.h"

namespace tfold::logging
{

inline constexpr const char *kLoggerName = "tfold";

struct LogSettings
{
    std::string level = "warn";
    std::filesystem::path file; // empty: no file sink
    bool toStderr = false;
};

spdlog::level::level_enum parseLevel(std::string_view name,
                                     spdlog::level::level_enum fallback = spdlog::level::warn);

// Replaces any previously registered "tfold" logger.
bool initialize(const LogSettings &settings);

// Never null. Falls back to a silent logger when initialize() was not called.
std::shared_ptr<spdlog::logger> logger();

void shutdown();

} // namespace tfold::logging
