#include "linkfetch/curl_stream_reader.hpp"

#include "linkfetch/cancellation.hpp"
#include "linkfetch/destination_file.hpp"
#include "linkfetch/detail/curl_utils.hpp"
#include "linkfetch/logging.hpp"
#include "linkfetch/validation.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace linkfetch {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// "bytes 100-199/1000" -> 1000. "*" totals are unknown.
std::optional<std::uint64_t> parseContentRangeTotal(const std::string& value) {
    const auto slash = value.rfind('/');
    if (slash == std::string::npos || slash + 1 >= value.size()) {
        return std::nullopt;
    }
    const std::string total = value.substr(slash + 1);
    if (total == "*") {
        return std::nullopt;
    }
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(total.c_str(), &end, 10);
    if (end == total.c_str()) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(parsed);
}

} // namespace

class CurlStreamReader::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {}

    TransferResult read(const TransferRequest& request, DestinationFile& destination,
                        CancellationSignal& signal, const ProgressCallback& progress) {
        StreamContext ctx;
        ctx.destination = &destination;
        ctx.signal = &signal;
        ctx.progress = &progress;
        ctx.start_offset = request.offset;
        ctx.read_timeout = request.timeouts.read;
        ctx.last_data = SteadyClock::now();

        detail::CurlHandle curl = detail::makeCurlHandle();
        ctx.curl = curl.get();

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, options_.protocols.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, options_.protocols.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, options_.buffer_size);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.timeouts.connect.count()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        std::string range;
        if (request.offset > 0) {
            range = std::to_string(request.offset) + "-";
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        logger()->debug("GET {} from offset {}", request.url, request.offset);
        const CURLcode res = curl_easy_perform(curl.get());
        ctx.http_status = detail::responseCode(curl.get());

        return finish(ctx, res);
    }

private:
    struct StreamContext {
        CURL* curl{nullptr};
        DestinationFile* destination{nullptr};
        CancellationSignal* signal{nullptr};
        const ProgressCallback* progress{nullptr};

        std::uint64_t start_offset{0};
        std::chrono::milliseconds read_timeout{0};
        SteadyClock::time_point last_data;

        long http_status{0};
        std::string content_type;
        std::optional<std::uint64_t> content_range_total;
        std::optional<std::uint64_t> total_bytes;
        std::optional<std::string> disposition_name;

        bool body_started{false};
        bool restarted{false};
        bool canceled{false};
        bool stalled{false};
        bool write_failed{false};
        bool rejected{false};
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return 0;
        }

        const std::string line{buffer, total};
        if (line.rfind("HTTP/", 0) == 0) {
            // New response (first one or after a redirect).
            ctx->content_type.clear();
            ctx->content_range_total.reset();
            ctx->disposition_name.reset();
            return total;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return total;
        }
        const std::string name = lowercase(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));
        if (name == "content-type") {
            ctx->content_type = lowercase(value);
        } else if (name == "content-range") {
            ctx->content_range_total = parseContentRangeTotal(value);
        } else if (name == "content-disposition") {
            ctx->disposition_name = fileNameFromContentDisposition(value);
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        if (!ctx || !ctx->destination) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->body_started && !beginBody(*ctx)) {
            return 0;
        }

        if (total > 0 && !ctx->destination->append(ptr, total)) {
            ctx->write_failed = true;
            return 0;
        }
        ctx->last_data = SteadyClock::now();

        if (!ctx->destination->maybeFlush()) {
            ctx->write_failed = true;
            return 0;
        }
        if (*ctx->progress) {
            (*ctx->progress)(ctx->destination->offset(), ctx->total_bytes);
        }

        // Chunk boundary: the chunk is fully written, safe to stop here.
        if (ctx->signal->requested()) {
            ctx->canceled = true;
            if (!ctx->destination->flush()) {
                ctx->write_failed = true;
            }
            return 0;
        }
        return total;
    }

    // Runs once, when the first body bytes of the final response arrive.
    static bool beginBody(StreamContext& ctx) {
        ctx.body_started = true;
        ctx.http_status = detail::responseCode(ctx.curl);

        if (ctx.content_type.rfind("text/html", 0) == 0) {
            ctx.rejected = true;
            return false;
        }

        curl_off_t length = -1;
        curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

        const bool range_ignored = ctx.start_offset > 0 && ctx.http_status == 200;
        if (range_ignored) {
            logger()->warn("Source ignored range request at offset {}; restarting from 0",
                           ctx.start_offset);
            if (!ctx.destination->truncate(0)) {
                ctx.write_failed = true;
                return false;
            }
            ctx.restarted = true;
        }

        if (ctx.content_range_total) {
            ctx.total_bytes = ctx.content_range_total;
        } else if (length >= 0) {
            const std::uint64_t base = range_ignored ? 0 : ctx.start_offset;
            ctx.total_bytes = base + static_cast<std::uint64_t>(length);
        }
        return true;
    }

    static int xferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        if (!ctx) {
            return 1;
        }
        if (ctx->signal->requested()) {
            ctx->canceled = true;
            return 1;
        }
        if (SteadyClock::now() - ctx->last_data > ctx->read_timeout) {
            ctx->stalled = true;
            return 1;
        }
        return 0;
    }

    static TransferResult finish(StreamContext& ctx, CURLcode res) {
        TransferResult result;
        result.http_status = ctx.http_status;
        result.total_bytes = ctx.total_bytes;
        result.restarted = ctx.restarted;
        result.suggested_file_name = ctx.disposition_name;

        if (ctx.write_failed) {
            result.outcome = TransferOutcome::WriteError;
            result.message = ctx.destination->lastError();
            return result;
        }
        if (ctx.canceled) {
            result.outcome = TransferOutcome::Canceled;
            result.message = "Transfer interrupted by command";
            if (!ctx.destination->flush()) {
                result.outcome = TransferOutcome::WriteError;
                result.message = ctx.destination->lastError();
            }
            return result;
        }
        if (ctx.rejected) {
            result.outcome = TransferOutcome::RejectedContent;
            result.message = "Download URL resolved to HTML, not a media file";
            return result;
        }
        if (ctx.stalled) {
            result.outcome = TransferOutcome::Stalled;
            result.message = fmt::format("No data received for {} ms", ctx.read_timeout.count());
            return result;
        }

        if (res == CURLE_HTTP_RETURNED_ERROR) {
            result.outcome = TransferOutcome::HttpError;
            result.message = fmt::format("HTTP error {}", ctx.http_status);
            return result;
        }
        if (res != CURLE_OK) {
            result.outcome = TransferOutcome::ConnectionError;
            result.message = std::string{"curl error: "} + curl_easy_strerror(res);
            return result;
        }

        if (!ctx.destination->flush()) {
            result.outcome = TransferOutcome::WriteError;
            result.message = ctx.destination->lastError();
            return result;
        }

        const std::uint64_t written = ctx.destination->offset();
        if (ctx.total_bytes && written != *ctx.total_bytes) {
            result.outcome = TransferOutcome::ConnectionError;
            result.message = fmt::format("Transfer incomplete: {} of {} bytes", written,
                                         *ctx.total_bytes);
            return result;
        }

        result.outcome = TransferOutcome::Completed;
        return result;
    }

    Options options_;
};

CurlStreamReader::CurlStreamReader() : CurlStreamReader(Options{}) {}

CurlStreamReader::CurlStreamReader(Options options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlStreamReader::~CurlStreamReader() = default;

TransferResult CurlStreamReader::read(const TransferRequest& request,
                                      DestinationFile& destination,
                                      CancellationSignal& signal,
                                      const ProgressCallback& progress) {
    return impl_->read(request, destination, signal, progress);
}

} // namespace linkfetch
