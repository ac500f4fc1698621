#include "utils/Logging.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace landgem {

std::string packLogMsg(const char* file, int line, const std::string& msg) {
    std::string path(file);
    size_t pos = path.find_last_of("\\/");
    if (pos != std::string::npos) {
        path = path.substr(pos + 1);
    }
    return "[" + path + ":" + std::to_string(line) + "] " + msg;
}

// from_str maps unknown names to off
bool isLogLevel(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

static spdlog::level::level_enum parseLevel(const std::string& level) {
    if (!isLogLevel(level)) {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    return spdlog::level::from_str(level);
}

// set_default_logger replaces any registered logger of the same name,
// so re-initializing never leaves the default logger empty
static void install(spdlog::sink_ptr sink, spdlog::level::level_enum lvl) {
    auto logger = std::make_shared<spdlog::logger>(DefaultLogName, std::move(sink));
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%n %l] %v");
    spdlog::set_level(lvl);
    spdlog::flush_on(spdlog::level::warn);
}

void initLogging(const std::string& level) {
    auto lvl = parseLevel(level);
    install(std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), lvl);
}

void initLogging(const std::string& level, const std::string& logFilePath) {
    auto lvl = parseLevel(level);
    spdlog::sink_ptr sink;
    try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error("Cannot open log file " + logFilePath + ": " + ex.what());
    }
    install(std::move(sink), lvl);
}

} // namespace landgem
