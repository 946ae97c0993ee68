#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace linkfetch {

struct NotifyResult {
    bool success{false};
    std::optional<std::string> message;
};

// Tells the media library about a newly saved file. Implementations report
// failures in the result instead of throwing.
class Notifier {
public:
    virtual ~Notifier() = default;

    [[nodiscard]] virtual NotifyResult notify(const std::string& saved_path) = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

class PlexNotifier final : public Notifier {
public:
    struct Options {
        std::string base_url;
        std::string token;
        // Empty rescans every section.
        std::string section_id;
        std::chrono::milliseconds timeout{20000};
    };

    explicit PlexNotifier(Options options);

    [[nodiscard]] NotifyResult notify(const std::string& saved_path) override;

    [[nodiscard]] std::string refreshEndpoint() const;

private:
    // Throws NotifyError when Plex cannot be reached or rejects the request.
    void requestRefresh() const;

    Options options_;
};

} // namespace linkfetch
