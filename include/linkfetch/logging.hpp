#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace linkfetch {

struct LogOptions {
    // trace, debug, info, warn, error, critical, off
    std::string level{"info"};
    // Empty keeps logging on the console only.
    std::string file;
    std::size_t max_file_bytes{5 * 1024 * 1024};
    std::size_t max_files{3};
};

// (Re)creates the "linkfetch" logger. Throws ConfigError on an unknown level
// or an unusable log file.
void initLogging(const LogOptions& options);

// The shared logger; a console logger at info level until initLogging runs.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace linkfetch
