#include "linkfetch/resolver.hpp"

#include "linkfetch/detail/curl_utils.hpp"
#include "linkfetch/errors.hpp"
#include "linkfetch/logging.hpp"
#include "linkfetch/retry_policy.hpp"
#include "linkfetch/validation.hpp"

#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace linkfetch {

ResolvedLink DirectResolver::resolve(const std::string& source_url) {
    ResolvedLink link;
    link.direct_url = source_url;
    std::string name = fileNameFromUrl(source_url);
    if (!name.empty() && !isGenericFileName(name)) {
        link.suggested_file_name = std::move(name);
    }
    return link;
}

OneFichierResolver::OneFichierResolver(Options options) : options_(std::move(options)) {
    while (!options_.api_base.empty() && options_.api_base.back() == '/') {
        options_.api_base.pop_back();
    }
}

ResolvedLink OneFichierResolver::resolve(const std::string& source_url) {
    if (options_.api_key.empty()) {
        return direct_.resolve(source_url);
    }

    detail::CurlHandle curl = detail::makeCurlHandle();
    const std::string endpoint = options_.api_base + "/v1/download/get_token.cgi";
    const std::string payload = nlohmann::json{{"url", source_url}}.dump();

    detail::CurlHeaders headers;
    detail::appendHeader(headers, "Authorization: Bearer " + options_.api_key);
    detail::appendHeader(headers, "Content-Type: application/json");

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &detail::collectToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ResolutionError(
            fmt::format("1fichier API unreachable: {}", curl_easy_strerror(res)), true);
    }

    const long status = detail::responseCode(curl.get());
    if (status >= 400) {
        const bool transient = RetryPolicy::classifyHttpStatus(status) == FailureClass::Transient;
        throw ResolutionError(fmt::format("1fichier API returned HTTP {}", status), transient);
    }

    logger()->debug("1fichier token API answered HTTP {}", status);
    return parseTokenReply(body, source_url);
}

ResolvedLink OneFichierResolver::parseTokenReply(const std::string& body,
                                                 const std::string& source_url) {
    const auto reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw ResolutionError("1fichier API returned a malformed reply");
    }

    try {
        return linkFromReply(reply, source_url);
    } catch (const nlohmann::json::exception& ex) {
        throw ResolutionError(fmt::format("1fichier API returned a malformed reply: {}", ex.what()));
    }
}

ResolvedLink OneFichierResolver::linkFromReply(const nlohmann::json& reply,
                                               const std::string& source_url) {
    if (reply.value("status", std::string{}) == "KO") {
        throw ResolutionError(
            fmt::format("1fichier refused the link: {}", reply.value("message", std::string{"unknown error"})));
    }

    ResolvedLink link;
    link.direct_url = reply.value("url", std::string{});
    if (link.direct_url.empty()) {
        link.direct_url = reply.value("link", std::string{});
    }
    if (link.direct_url.empty()) {
        throw ResolutionError(fmt::format("1fichier API returned no download URL for {}", source_url));
    }

    std::string name = reply.value("filename", std::string{});
    if (name.empty()) {
        name = reply.value("name", std::string{});
    }
    if (!name.empty()) {
        link.suggested_file_name = std::move(name);
    }

    const auto size = reply.find("size");
    if (size != reply.end() && size->is_number_unsigned()) {
        link.total_bytes = size->get<std::uint64_t>();
    }
    return link;
}

} // namespace linkfetch
