#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tenfoot {

/// Process-wide loggers for the input engine ("INPUT") and the UI layer
/// consuming it ("UI"). Both are usable before init(): until then they
/// point at a logger with no sinks.
class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& getInputLogger();
    static std::shared_ptr<spdlog::logger>& getUILogger();

    /// Parse a level name ("trace" .. "critical", "off"). Unknown names give info.
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_inputLogger;
    static std::shared_ptr<spdlog::logger> s_uiLogger;
};

} // namespace tenfoot

// Input engine logging macros
#define LOG_TRACE(...)    ::tenfoot::Log::getInputLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::tenfoot::Log::getInputLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::tenfoot::Log::getInputLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::tenfoot::Log::getInputLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::tenfoot::Log::getInputLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::tenfoot::Log::getInputLogger()->critical(__VA_ARGS__)

// UI layer logging macros
#define UI_LOG_TRACE(...)    ::tenfoot::Log::getUILogger()->trace(__VA_ARGS__)
#define UI_LOG_DEBUG(...)    ::tenfoot::Log::getUILogger()->debug(__VA_ARGS__)
#define UI_LOG_INFO(...)     ::tenfoot::Log::getUILogger()->info(__VA_ARGS__)
#define UI_LOG_WARN(...)     ::tenfoot::Log::getUILogger()->warn(__VA_ARGS__)
#define UI_LOG_ERROR(...)    ::tenfoot::Log::getUILogger()->error(__VA_ARGS__)
