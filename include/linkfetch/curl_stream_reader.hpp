#pragma once

#include "transfer_stream_reader.hpp"

#include <memory>
#include <string>

namespace linkfetch {

class CurlStreamReader final : public TransferStreamReader {
public:
    struct Options {
        // Comma separated, as accepted by CURLOPT_PROTOCOLS_STR.
        std::string protocols{"http,https"};
        std::string user_agent{"linkfetch/1.0"};
        long buffer_size{256 * 1024};
    };

    CurlStreamReader();
    explicit CurlStreamReader(Options options);
    ~CurlStreamReader() override;

    [[nodiscard]] TransferResult read(const TransferRequest& request,
                                      DestinationFile& destination,
                                      CancellationSignal& signal,
                                      const ProgressCallback& progress) override;

private:
    // Keeps libcurl out of the public header.
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace linkfetch
