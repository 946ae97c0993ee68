#include "linkfetch/config.hpp"

#include "linkfetch/errors.hpp"
#include "linkfetch/validation.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace linkfetch {

namespace {

using nlohmann::json;

template <typename T>
void readValue(const json& object, const char* key, T& out) {
    const auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void readMillis(const json& object, const char* key, std::chrono::milliseconds& out) {
    const auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        out = std::chrono::milliseconds(it->get<std::int64_t>());
    }
}

void readPath(const json& object, const char* key, std::filesystem::path& out) {
    const auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        out = it->get<std::string>();
    }
}

BackoffKind backoffFromString(const std::string& text) {
    if (text == "fixed") {
        return BackoffKind::Fixed;
    }
    if (text == "exponential") {
        return BackoffKind::Exponential;
    }
    throw ConfigError(fmt::format("Unknown retry backoff '{}' (expected fixed or exponential)", text));
}

void fillConfig(const json& root, EngineConfig& config) {
    readValue(root, "allowed_hosts", config.allowed_hosts);
    readValue(root, "require_https", config.require_https);

    if (const auto roots = root.find("allowed_roots"); roots != root.end()) {
        config.allowed_roots.clear();
        for (const auto& entry : *roots) {
            config.allowed_roots.emplace_back(entry.get<std::string>());
        }
    }
    readPath(root, "default_destination", config.default_destination);
    readValue(root, "max_concurrent_jobs", config.max_concurrent_jobs);
    readValue(root, "flush_interval_bytes", config.flush_interval_bytes);

    if (const auto retry = root.find("retry"); retry != root.end()) {
        readValue(*retry, "max_attempts", config.retry.max_attempts);
        std::string backoff;
        readValue(*retry, "backoff", backoff);
        if (!backoff.empty()) {
            config.retry.backoff = backoffFromString(backoff);
        }
        readMillis(*retry, "base_delay_ms", config.retry.base_delay);
        readMillis(*retry, "max_delay_ms", config.retry.max_delay);
    }

    if (const auto timeouts = root.find("timeouts"); timeouts != root.end()) {
        readMillis(*timeouts, "connect_ms", config.timeouts.connect);
        readMillis(*timeouts, "read_ms", config.timeouts.read);
    }

    if (const auto onefichier = root.find("onefichier"); onefichier != root.end()) {
        readValue(*onefichier, "api_key", config.resolver.onefichier_api_key);
        readValue(*onefichier, "api_base", config.resolver.onefichier_api_base);
    }

    if (const auto plex = root.find("plex"); plex != root.end()) {
        readValue(*plex, "base_url", config.notifier.plex_base_url);
        readValue(*plex, "token", config.notifier.plex_token);
        readValue(*plex, "section_id", config.notifier.plex_section_id);
    }

    readPath(root, "audit_log", config.audit_log);
    readPath(root, "state_file", config.state_file);

    if (const auto log = root.find("log"); log != root.end()) {
        readValue(*log, "level", config.log.level);
        readValue(*log, "file", config.log.file);
    }
}

} // namespace

EngineConfig parseConfig(const std::string& json_text) {
    const json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw ConfigError("Configuration is not a JSON object");
    }

    EngineConfig config;
    try {
        fillConfig(root, config);
    } catch (const json::exception& ex) {
        throw ConfigError(fmt::format("Invalid configuration value: {}", ex.what()));
    }
    return config;
}

EngineConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("Cannot read configuration file {}", path.string()));
    }
    std::ostringstream text;
    text << in.rdbuf();

    EngineConfig config = parseConfig(text.str());
    applyEnvironment(config);
    return config;
}

void applyEnvironment(EngineConfig& config) {
    if (const char* key = std::getenv("LINKFETCH_ONEFICHIER_API_KEY"); key && *key) {
        config.resolver.onefichier_api_key = key;
    }
    if (const char* token = std::getenv("LINKFETCH_PLEX_TOKEN"); token && *token) {
        config.notifier.plex_token = token;
    }
}

void EngineConfig::validate() {
    if (allowed_hosts.empty()) {
        throw ConfigError("allowed_hosts must name at least one host");
    }
    if (allowed_roots.empty()) {
        throw ConfigError("allowed_roots must name at least one folder");
    }
    if (max_concurrent_jobs < 1 || max_concurrent_jobs > 64) {
        throw ConfigError(fmt::format("max_concurrent_jobs must be within 1..64, got {}",
                                      max_concurrent_jobs));
    }
    if (retry.max_attempts < 1) {
        throw ConfigError("retry.max_attempts must be at least 1");
    }
    if (retry.base_delay.count() < 0 || retry.max_delay < retry.base_delay) {
        throw ConfigError("retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
    }
    if (timeouts.connect.count() <= 0 || timeouts.read.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (flush_interval_bytes == 0) {
        throw ConfigError("flush_interval_bytes must be positive");
    }

    for (auto& root : allowed_roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw ConfigError(fmt::format("Allowed root {} does not exist", root.string()));
        }
        if (::access(root.c_str(), W_OK) != 0) {
            throw ConfigError(fmt::format("Allowed root {} is not writable", root.string()));
        }
        root = canonicalizeLoose(root);
    }

    try {
        default_destination = validateDestination(default_destination, allowed_roots);
    } catch (const ValidationError& ex) {
        throw ConfigError(fmt::format("default_destination: {}", ex.what()));
    }
    std::error_code ec;
    std::filesystem::create_directories(default_destination, ec);
    if (ec) {
        throw ConfigError(fmt::format("Cannot create default destination {}: {}",
                                      default_destination.string(), ec.message()));
    }
}

} // namespace linkfetch
