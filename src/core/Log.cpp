#include "core/Log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string_view>
#include <system_error>
#include <vector>

namespace nooku::core {

static std::mutex g_mutex;
static std::shared_ptr<spdlog::logger> g_logger;

static spdlog::level::level_enum ToSpd(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::Trace:    return spdlog::level::trace;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warn:     return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void LogInit(const std::filesystem::path& logDir)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    const auto file = (logDir / "nooku.log").string();
    if (!ec)
    {
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Console-only logging is still usable.
            std::fprintf(stderr, "LogInit: cannot open %s: %s\n", file.c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("nooku", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);

    LogMessage(LogLevel::Info, "Logger initialized at %s", ec ? "<console only>" : file.c_str());
}

void LogShutdown()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
    {
        g_logger->flush();
        g_logger.reset();
    }
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger ? g_logger : spdlog::default_logger();
}

void LogMessageV(LogLevel level, const char* fmt, va_list args)
{
    if (!fmt)
        return;

    char msg[2048]{};

    va_list copy;
    va_copy(copy, args);
    const int n = std::vsnprintf(msg, sizeof(msg), fmt, copy);
    va_end(copy);
    if (n < 0)
        msg[0] = '\0';

    Logger()->log(ToSpd(level), std::string_view(msg));
}

void LogMessage(LogLevel level, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    LogMessageV(level, fmt, ap);
    va_end(ap);
}

} // namespace nooku::core
