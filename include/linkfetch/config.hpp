#pragma once

#include "logging.hpp"
#include "retry_policy.hpp"
#include "transfer_stream_reader.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace linkfetch {

struct RetryConfig {
    int max_attempts{5};
    BackoffKind backoff{BackoffKind::Exponential};
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{30000};
};

struct ResolverConfig {
    std::string onefichier_api_key;
    std::string onefichier_api_base{"https://api.1fichier.com"};
};

struct NotifierConfig {
    // Empty disables library notifications.
    std::string plex_base_url;
    std::string plex_token;
    std::string plex_section_id;
};

struct EngineConfig {
    std::vector<std::string> allowed_hosts{"1fichier.com", "www.1fichier.com"};
    bool require_https{true};

    std::vector<std::filesystem::path> allowed_roots{"/downloads"};
    std::filesystem::path default_destination{"/downloads/movies"};

    int max_concurrent_jobs{2};
    RetryConfig retry;
    TransferTimeouts timeouts;
    std::uint64_t flush_interval_bytes{4 * 1024 * 1024};

    ResolverConfig resolver;
    NotifierConfig notifier;

    // Empty disables the corresponding file.
    std::filesystem::path audit_log;
    std::filesystem::path state_file;

    LogOptions log;

    // Fails fast with ConfigError: roots must exist and be writable, the
    // default destination must sit inside a root, numbers must be sane.
    // Roots and the default destination are canonicalized in place.
    void validate();
};

// Reads a JSON config file; missing keys keep their defaults. Secrets can be
// supplied through LINKFETCH_ONEFICHIER_API_KEY and LINKFETCH_PLEX_TOKEN.
// Throws ConfigError. The result is not validated yet.
[[nodiscard]] EngineConfig loadConfig(const std::filesystem::path& path);
[[nodiscard]] EngineConfig parseConfig(const std::string& json_text);

void applyEnvironment(EngineConfig& config);

} // namespace linkfetch
