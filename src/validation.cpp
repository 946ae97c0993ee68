#include "linkfetch/validation.hpp"

#include "linkfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

namespace linkfetch {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = lowercase(url.substr(0, scheme_end));

    const auto authority_begin = scheme_end + 3;
    const auto authority_end = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(authority_begin, authority_end == std::string::npos
                                                            ? std::string::npos
                                                            : authority_end - authority_begin);
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        parsed.host = authority.substr(0, close == std::string::npos ? std::string::npos : close + 1);
    } else {
        parsed.host = authority.substr(0, authority.find(':'));
    }
    parsed.host = lowercase(parsed.host);
    if (parsed.host.empty()) {
        return std::nullopt;
    }

    if (authority_end != std::string::npos && url[authority_end] == '/') {
        const auto path_end = url.find_first_of("?#", authority_end);
        parsed.path = url.substr(authority_end, path_end == std::string::npos
                                                    ? std::string::npos
                                                    : path_end - authority_end);
    }
    return parsed;
}

void validateSourceUrl(const std::string& url, const std::vector<std::string>& allowed_hosts,
                       bool require_https) {
    const auto parsed = parseUrl(url);
    if (!parsed) {
        throw ValidationError(fmt::format("Malformed URL: {}", url));
    }
    if (require_https && parsed->scheme != "https") {
        throw ValidationError("Only HTTPS links are allowed");
    }
    if (parsed->scheme != "https" && parsed->scheme != "http") {
        throw ValidationError(fmt::format("Unsupported URL scheme: {}", parsed->scheme));
    }

    const bool allowed = std::any_of(allowed_hosts.begin(), allowed_hosts.end(),
                                     [&](const std::string& host) {
                                         return lowercase(host) == parsed->host;
                                     });
    if (!allowed) {
        throw ValidationError(fmt::format("Host not allowed: {}", parsed->host));
    }
}

std::filesystem::path canonicalizeLoose(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return canonical.lexically_normal();
}

bool isInsideRoot(const std::filesystem::path& candidate, const std::filesystem::path& root) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it) {
        // A trailing separator shows up as an empty last element.
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *cand_it != *root_it) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

std::filesystem::path validateDestination(const std::filesystem::path& destination,
                                          const std::vector<std::filesystem::path>& allowed_roots) {
    if (destination.empty()) {
        throw ValidationError("Destination folder is empty");
    }

    const auto resolved = canonicalizeLoose(destination);
    for (const auto& root : allowed_roots) {
        if (isInsideRoot(resolved, canonicalizeLoose(root))) {
            return resolved;
        }
    }
    throw ValidationError(
        fmt::format("Destination {} is outside the allowed folders", destination.string()));
}

std::string sanitizeFileName(const std::string& name) {
    std::string safe;
    safe.reserve(name.size());
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == ' ') {
            safe.push_back(c);
        }
    }

    const auto begin = safe.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return "download.bin";
    }
    safe = safe.substr(begin, safe.find_last_not_of(' ') - begin + 1);

    if (safe.find_first_not_of('.') == std::string::npos) {
        return "download.bin";
    }
    return safe;
}

std::string fileNameFromUrl(const std::string& url) {
    const auto parsed = parseUrl(url);
    if (!parsed) {
        return {};
    }
    const auto slash = parsed->path.rfind('/');
    const std::string last =
        slash == std::string::npos ? parsed->path : parsed->path.substr(slash + 1);
    return percentDecode(last);
}

std::optional<std::string> fileNameFromContentDisposition(const std::string& value) {
    const auto parameter = [&value](const std::string& key) -> std::optional<std::string> {
        const auto at = lowercase(value).find(key);
        if (at == std::string::npos) {
            return std::nullopt;
        }
        const auto begin = at + key.size();
        const auto end = value.find(';', begin);
        std::string text = value.substr(begin, end == std::string::npos ? end : end - begin);
        const auto first = text.find_first_not_of(" \t\"");
        if (first == std::string::npos) {
            return std::string{};
        }
        text = text.substr(first, text.find_last_not_of(" \t\"") - first + 1);
        return text;
    };

    if (auto encoded = parameter("filename*=")) {
        const auto quote = encoded->find("''");
        if (quote != std::string::npos) {
            encoded = encoded->substr(quote + 2);
        }
        std::string decoded = percentDecode(*encoded);
        if (!decoded.empty()) {
            return decoded;
        }
    }
    auto plain = parameter("filename=");
    if (plain && plain->empty()) {
        return std::nullopt;
    }
    return plain;
}

bool isGenericFileName(const std::string& name) {
    const std::string stem = lowercase(std::filesystem::path(name).stem().string());
    return stem.empty() || stem == "download" || stem == "file" || stem == "index";
}

std::string disambiguateFileName(const std::filesystem::path& directory, const std::string& name) {
    const auto taken = [&](const std::string& candidate) {
        std::error_code ec;
        return std::filesystem::exists(directory / candidate, ec) ||
               std::filesystem::exists(directory / partFileName(candidate), ec);
    };

    if (!taken(name)) {
        return name;
    }

    const std::filesystem::path as_path{name};
    const std::string stem = as_path.stem().string();
    const std::string extension = as_path.extension().string();
    for (int index = 1;; ++index) {
        std::string candidate = fmt::format("{} ({}){}", stem, index, extension);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

std::string partFileName(const std::string& name) { return name + ".part"; }

} // namespace linkfetch
