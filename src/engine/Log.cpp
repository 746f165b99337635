#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace tenfoot {

namespace {

std::shared_ptr<spdlog::logger> makeSilentLogger(const std::string& name) {
    // No sinks: every message is dropped, but callers never see a null logger.
    return std::make_shared<spdlog::logger>(name);
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Log::s_inputLogger;
std::shared_ptr<spdlog::logger> Log::s_uiLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Replace any loggers registered by a previous init()
    spdlog::drop("INPUT");
    spdlog::drop("UI");

    s_inputLogger = std::make_shared<spdlog::logger>("INPUT", sinks.begin(), sinks.end());
    s_uiLogger = std::make_shared<spdlog::logger>("UI", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_inputLogger->set_level(spdLevel);
    s_uiLogger->set_level(spdLevel);

    spdlog::register_logger(s_inputLogger);
    spdlog::register_logger(s_uiLogger);
}

void Log::shutdown() {
    if (s_inputLogger) s_inputLogger->flush();
    if (s_uiLogger) s_uiLogger->flush();
    spdlog::shutdown();
    s_inputLogger.reset();
    s_uiLogger.reset();
}

std::shared_ptr<spdlog::logger>& Log::getInputLogger() {
    if (!s_inputLogger) {
        s_inputLogger = makeSilentLogger("INPUT");
    }
    return s_inputLogger;
}

std::shared_ptr<spdlog::logger>& Log::getUILogger() {
    if (!s_uiLogger) {
        s_uiLogger = makeSilentLogger("UI");
    }
    return s_uiLogger;
}

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

} // namespace tenfoot
