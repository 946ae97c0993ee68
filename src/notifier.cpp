#include "linkfetch/notifier.hpp"

#include "linkfetch/detail/curl_utils.hpp"
#include "linkfetch/errors.hpp"
#include "linkfetch/logging.hpp"

#include <exception>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace linkfetch {

PlexNotifier::PlexNotifier(Options options) : options_(std::move(options)) {
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string PlexNotifier::refreshEndpoint() const {
    const std::string section = options_.section_id.empty() ? "all" : options_.section_id;
    return fmt::format("{}/library/sections/{}/refresh", options_.base_url, section);
}

void PlexNotifier::requestRefresh() const {
    detail::CurlHandle curl = detail::makeCurlHandle();
    const std::string url = fmt::format("{}?X-Plex-Token={}", refreshEndpoint(),
                                        detail::escapeQueryValue(curl.get(), options_.token));

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &detail::collectToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw NotifyError(fmt::format("Plex unreachable: {}", curl_easy_strerror(res)));
    }
    const long status = detail::responseCode(curl.get());
    if (status >= 400) {
        throw NotifyError(fmt::format("Plex refresh returned HTTP {}", status));
    }
}

NotifyResult PlexNotifier::notify(const std::string& saved_path) {
    NotifyResult result;
    try {
        requestRefresh();
        result.success = true;
        result.message = "Library scan requested";
        logger()->info("Requested Plex rescan for {}", saved_path);
    } catch (const std::exception& ex) {
        result.message = ex.what();
        logger()->warn("Plex rescan for {} failed: {}", saved_path, ex.what());
    }
    return result;
}

} // namespace linkfetch
