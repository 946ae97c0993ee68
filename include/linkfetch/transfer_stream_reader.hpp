#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace linkfetch {

class CancellationSignal;
class DestinationFile;

enum class TransferOutcome {
    Completed,
    Stalled,
    ConnectionError,
    HttpError,
    Canceled,
    WriteError,
    RejectedContent
};

struct TransferTimeouts {
    std::chrono::milliseconds connect{30000};
    // No body byte within this window ends the attempt as Stalled.
    std::chrono::milliseconds read{60000};
};

struct TransferRequest {
    std::string url;
    std::uint64_t offset{0};
    TransferTimeouts timeouts;
};

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::ConnectionError};
    long http_status{0};
    std::string message;
    std::optional<std::uint64_t> total_bytes;
    // Name announced by the server in Content-Disposition.
    std::optional<std::string> suggested_file_name;
    // The source ignored the range request and the file was restarted at 0.
    bool restarted{false};
};

// Called with the absolute number of bytes in the destination file.
using ProgressCallback =
    std::function<void(std::uint64_t bytes, std::optional<std::uint64_t> total)>;

// One streaming GET of a resolved direct URL into a destination file.
class TransferStreamReader {
public:
    virtual ~TransferStreamReader() = default;

    [[nodiscard]] virtual TransferResult read(const TransferRequest& request,
                                              DestinationFile& destination,
                                              CancellationSignal& signal,
                                              const ProgressCallback& progress) = 0;
};

using TransferStreamReaderPtr = std::shared_ptr<TransferStreamReader>;

[[nodiscard]] std::string_view toString(TransferOutcome outcome);

} // namespace linkfetch
