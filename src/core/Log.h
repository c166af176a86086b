// src/core/Log.h
#pragma once

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <memory>

#include <spdlog/spdlog.h>

#if defined(__GNUC__) || defined(__clang__)
  #define NOOKU_PRINTF_ATTR(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
  #define NOOKU_PRINTF_ATTR(fmtIdx, argIdx)
#endif

namespace nooku::core {

enum class LogLevel { Trace, Info, Warn, Error, Critical };

// Initialize/shutdown logging; writes a rotating nooku.log under `logDir` and mirrors to stdout.
void LogInit(const std::filesystem::path& logDir);
void LogShutdown();

// Printf-style logging entry point (thread-safe).
void LogMessage(LogLevel level, const char* fmt, ...) NOOKU_PRINTF_ATTR(2, 3);

// va_list variant to enable adapter wrappers and forwarding
void LogMessageV(LogLevel level, const char* fmt, va_list args);

// The installed logger, or spdlog's default logger before LogInit.
std::shared_ptr<spdlog::logger> Logger();

} // namespace nooku::core

#ifndef LOG_TRACE
  #define LOG_TRACE(...)    ::nooku::core::LogMessage(::nooku::core::LogLevel::Trace,    __VA_ARGS__)
#endif
#ifndef LOG_INFO
  #define LOG_INFO(...)     ::nooku::core::LogMessage(::nooku::core::LogLevel::Info,     __VA_ARGS__)
#endif
#ifndef LOG_WARN
  #define LOG_WARN(...)     ::nooku::core::LogMessage(::nooku::core::LogLevel::Warn,     __VA_ARGS__)
#endif
#ifndef LOG_ERROR
  #define LOG_ERROR(...)    ::nooku::core::LogMessage(::nooku::core::LogLevel::Error,    __VA_ARGS__)
#endif
#ifndef LOG_CRITICAL
  #define LOG_CRITICAL(...) ::nooku::core::LogMessage(::nooku::core::LogLevel::Critical, __VA_ARGS__)
#endif
