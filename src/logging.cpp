#include "linkfetch/logging.hpp"

#include "linkfetch/errors.hpp"

#include <mutex>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace linkfetch {

namespace {

constexpr const char* kLoggerName = "linkfetch";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& currentLogger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(kLoggerName, console);
    log->set_pattern(kPattern);
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

void initLogging(const LogOptions& options) {
    const auto level = spdlog::level::from_str(options.level);
    if (level == spdlog::level::off && options.level != "off") {
        throw ConfigError(fmt::format("Unknown log level: {}", options.level));
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!options.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, options.max_file_bytes, options.max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            throw ConfigError(fmt::format("Cannot open log file {}: {}", options.file, ex.what()));
        }
    }

    auto log = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    log->set_pattern(kPattern);
    log->set_level(level);
    log->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(loggerMutex());
    currentLogger() = std::move(log);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto& instance = currentLogger();
    if (!instance) {
        instance = makeConsoleLogger();
    }
    return instance;
}

} // namespace linkfetch
