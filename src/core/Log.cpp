#include "core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <mutex>

namespace trellis {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_renderLogger;

namespace {

std::mutex s_initMutex;

// Used until init() runs so library code never dereferences a null logger.
const std::shared_ptr<spdlog::logger>& fallbackLogger() {
    static const auto logger = std::make_shared<spdlog::logger>(
        "trellis", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return logger;
}

} // namespace

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

void Log::init(const std::string& logFile, const std::string& level) {
    std::lock_guard<std::mutex> lock(s_initMutex);

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%t] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-initialising replaces the previous registrations.
    spdlog::drop("CORE");
    spdlog::drop("RENDER");

    s_coreLogger = std::make_shared<spdlog::logger>("CORE", sinks.begin(), sinks.end());
    s_renderLogger = std::make_shared<spdlog::logger>("RENDER", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_renderLogger->set_level(spdLevel);

    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_renderLogger);
}

void Log::shutdown() {
    std::lock_guard<std::mutex> lock(s_initMutex);
    if (s_coreLogger) s_coreLogger->flush();
    if (s_renderLogger) s_renderLogger->flush();
    s_coreLogger.reset();
    s_renderLogger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Log::getCoreLogger() {
    std::lock_guard<std::mutex> lock(s_initMutex);
    return s_coreLogger ? s_coreLogger : fallbackLogger();
}

std::shared_ptr<spdlog::logger> Log::getRenderLogger() {
    std::lock_guard<std::mutex> lock(s_initMutex);
    return s_renderLogger ? s_renderLogger : fallbackLogger();
}

} // namespace trellis
