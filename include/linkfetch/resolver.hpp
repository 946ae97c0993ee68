#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace linkfetch {

struct ResolvedLink {
    std::string direct_url;
    std::optional<std::string> suggested_file_name;
    std::optional<std::uint64_t> total_bytes;
};

// Turns a user-submitted link into a direct, possibly time-limited, download
// URL. Failures are reported as ResolutionError (see transient()).
class Resolver {
public:
    virtual ~Resolver() = default;

    [[nodiscard]] virtual ResolvedLink resolve(const std::string& source_url) = 0;
};

using ResolverPtr = std::shared_ptr<Resolver>;

// The source URL already is the download URL.
class DirectResolver final : public Resolver {
public:
    [[nodiscard]] ResolvedLink resolve(const std::string& source_url) override;
};

// 1fichier token API. Without an API key every link goes through the direct
// flow.
class OneFichierResolver final : public Resolver {
public:
    struct Options {
        std::string api_key;
        std::string api_base{"https://api.1fichier.com"};
        std::chrono::milliseconds timeout{30000};
    };

    explicit OneFichierResolver(Options options);

    [[nodiscard]] ResolvedLink resolve(const std::string& source_url) override;

    // Exposed for tests: interprets a get_token.cgi reply body.
    [[nodiscard]] static ResolvedLink parseTokenReply(const std::string& body,
                                                      const std::string& source_url);

private:
    [[nodiscard]] static ResolvedLink linkFromReply(const nlohmann::json& reply,
                                                    const std::string& source_url);

    Options options_;
    DirectResolver direct_;
};

} // namespace linkfetch
