#include "tfold/logging.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

#include "spdlog/sinks/null_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"

namespace tfold::logging
{
namespace
{

constexpr std::size_t kMaxLogFileSize = 1048576 * 5;
constexpr std::size_t kMaxLogFiles = 3;

std::string lower(std::string_view view)
{
    std::string result(view.begin(), view.end());
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

} // namespace

spdlog::level::level_enum parseLevel(std::string_view name, spdlog::level::level_enum fallback)
{
    const std::string value = lower(name);
    if (value == "trace")
        return spdlog::level::trace;
    if (value == "debug")
        return spdlog::level::debug;
    if (value == "info")
        return spdlog::level::info;
    if (value == "warn" || value == "warning")
        return spdlog::level::warn;
    if (value == "error")
        return spdlog::level::err;
    if (value == "critical")
        return spdlog::level::critical;
    if (value == "off")
        return spdlog::level::off;
    return fallback;
}

bool initialize(const LogSettings &settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    try
    {
        if (!settings.file.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(settings.file.parent_path(), ec);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.file.string(),
                                                                                   kMaxLogFileSize, kMaxLogFiles));
        }
        if (settings.toStderr)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        if (sinks.empty())
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    catch (const spdlog::spdlog_ex &)
    {
        return false;
    }

    spdlog::drop(kLoggerName);
    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_pattern("%Y-%m-%d %H:%M:%S.%e %l: %v");
    created->set_level(parseLevel(settings.level));
    created->flush_on(spdlog::level::warn);
    spdlog::register_logger(created);
    return true;
}

std::shared_ptr<spdlog::logger> logger()
{
    if (auto existing = spdlog::get(kLoggerName))
        return existing;
    auto silent = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    silent->set_level(spdlog::level::off);
    try
    {
        spdlog::register_logger(silent);
    }
    catch (const spdlog::spdlog_ex &)
    {
        // Lost a registration race; whichever logger won is the one to use.
        if (auto registered = spdlog::get(kLoggerName))
            return registered;
    }
    return silent;
}

void shutdown()
{
    if (auto existing = spdlog::get(kLoggerName))
        existing->flush();
    spdlog::drop(kLoggerName);
}

} // namespace tfold::logging
