#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkfetch {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string path;
};

// Splits scheme://[user@]host[:port]/path?query. Scheme and host are lowercased.
[[nodiscard]] std::optional<ParsedUrl> parseUrl(const std::string& url);

// Accepts only https URLs (or any scheme when require_https is false) whose
// host is exactly one of `allowed_hosts`. Throws ValidationError.
void validateSourceUrl(const std::string& url, const std::vector<std::string>& allowed_hosts,
                       bool require_https = true);

// Absolute, lexically normalized path with symlinks resolved for the part
// that exists on disk.
[[nodiscard]] std::filesystem::path canonicalizeLoose(const std::filesystem::path& path);

[[nodiscard]] bool isInsideRoot(const std::filesystem::path& candidate,
                                const std::filesystem::path& root);

// Returns the canonical directory when it is one of the roots or below one.
// Throws ValidationError otherwise.
[[nodiscard]] std::filesystem::path
validateDestination(const std::filesystem::path& destination,
                    const std::vector<std::filesystem::path>& allowed_roots);

// Keeps alphanumerics, '-', '_', '.', ' '. Never returns a name with a path
// separator, "." or "..". Falls back to "download.bin".
[[nodiscard]] std::string sanitizeFileName(const std::string& name);

// Last path segment of the URL, percent-decoded.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

// File name from a Content-Disposition value. `filename*=UTF-8''...` is
// percent-decoded and wins over a plain `filename=`.
[[nodiscard]] std::optional<std::string> fileNameFromContentDisposition(const std::string& value);

// True for placeholder names such as "download" or "index.html".
[[nodiscard]] bool isGenericFileName(const std::string& name);

// "movie.mkv" -> "movie (1).mkv", "movie (2).mkv", ... until neither the
// name nor its ".part" sibling exists in `directory`.
[[nodiscard]] std::string disambiguateFileName(const std::filesystem::path& directory,
                                               const std::string& name);

[[nodiscard]] std::string partFileName(const std::string& name);

} // namespace linkfetch
