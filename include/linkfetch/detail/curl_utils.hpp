#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace linkfetch::detail {

// curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

// Initializes libcurl if needed; throws std::runtime_error if no handle.
[[nodiscard]] CurlHandle makeCurlHandle();

void appendHeader(CurlHeaders& headers, const std::string& line);

// CURLOPT_WRITEFUNCTION collecting the body into a std::string.
std::size_t collectToString(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

[[nodiscard]] long responseCode(CURL* curl);

[[nodiscard]] std::string escapeQueryValue(CURL* curl, const std::string& value);

} // namespace linkfetch::detail
