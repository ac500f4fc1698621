#pragma once

#if defined(LANDGEM_LOG_LEVEL)
#define SPDLOG_ACTIVE_LEVEL LANDGEM_LOG_LEVEL
#else
// compile in everything down to debug; runtime level decides what is emitted
#define SPDLOG_ACTIVE_LEVEL 1
#endif

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

#define LOG_TRACE(msg, ...) \
    spdlog::trace(landgem::packLogMsg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define LOG_DEBUG(msg, ...) \
    spdlog::debug(landgem::packLogMsg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define LOG_INFO(msg, ...) \
    spdlog::info(landgem::packLogMsg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define LOG_WARN(msg, ...) \
    spdlog::warn(landgem::packLogMsg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) \
    spdlog::error(landgem::packLogMsg(__FILE__, __LINE__, msg), ##__VA_ARGS__)

namespace landgem {

const std::string DefaultLogName = "landgem";

// Install a stderr logger as the spdlog default.
// level: one of trace, debug, info, warn, error, off
void initLogging(const std::string& level = "warn");

// Install a file logger as the spdlog default
void initLogging(const std::string& level, const std::string& logFilePath);

// True if level names a spdlog level initLogging accepts
bool isLogLevel(const std::string& level);

// Prefix msg with "[file:line] " (basename only)
std::string packLogMsg(const char* file, int line, const std::string& msg);

} // namespace landgem
