#include "linkfetch/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace linkfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }
    return curl;
}

void appendHeader(CurlHeaders& headers, const std::string& line) {
    curl_slist* head = headers.release();
    curl_slist* next = curl_slist_append(head, line.c_str());
    if (!next) {
        headers.reset(head);
        throw std::runtime_error("Failed to allocate curl header list");
    }
    headers.reset(next);
}

std::size_t collectToString(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

long responseCode(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

std::string escapeQueryValue(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("Failed to escape query value");
    }
    std::string result{escaped};
    curl_free(escaped);
    return result;
}

} // namespace linkfetch::detail
