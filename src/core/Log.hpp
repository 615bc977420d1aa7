#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace trellis {

class Log {
public:
    /// Create the CORE and RENDER loggers. Both share a colored console
    /// sink and, when logFile is non-empty, a file sink. The sinks are
    /// thread-safe because repaint workers log through RENDER.
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// Tree mutation, dispatch and configuration.
    static std::shared_ptr<spdlog::logger> getCoreLogger();
    /// Repaint threads, composers and sections.
    static std::shared_ptr<spdlog::logger> getRenderLogger();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_renderLogger;
};

} // namespace trellis

// Core logging macros
#define LOG_TRACE(...)    ::trellis::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::trellis::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::trellis::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::trellis::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::trellis::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::trellis::Log::getCoreLogger()->critical(__VA_ARGS__)

// Render thread logging macros
#define RENDER_LOG_TRACE(...)    ::trellis::Log::getRenderLogger()->trace(__VA_ARGS__)
#define RENDER_LOG_DEBUG(...)    ::trellis::Log::getRenderLogger()->debug(__VA_ARGS__)
#define RENDER_LOG_INFO(...)     ::trellis::Log::getRenderLogger()->info(__VA_ARGS__)
#define RENDER_LOG_WARN(...)     ::trellis::Log::getRenderLogger()->warn(__VA_ARGS__)
#define RENDER_LOG_ERROR(...)    ::trellis::Log::getRenderLogger()->error(__VA_ARGS__)
#define RENDER_LOG_CRITICAL(...) ::trellis::Log::getRenderLogger()->critical(__VA_ARGS__)
