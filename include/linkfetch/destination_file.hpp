#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace linkfetch {

// Output file for one transfer attempt. Bytes are appended at the current
// offset; checkpoint() is the offset that has reached durable storage.
class DestinationFile {
public:
    // Opens (creating if needed) `path` and positions it at `offset`,
    // truncating anything past it. Throws TransferError on failure.
    DestinationFile(std::filesystem::path path, std::uint64_t offset,
                    std::uint64_t flush_interval_bytes);
    ~DestinationFile();

    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;

    // Returns false on a short write; the error text is in lastError().
    bool append(const char* data, std::size_t size);
    // Flushes when at least flush_interval_bytes were appended since the last
    // checkpoint.
    bool maybeFlush();
    bool flush();
    // Drops everything after `offset` (0 restarts the file).
    bool truncate(std::uint64_t offset);
    // Flushes and closes; false if the final flush failed.
    bool close();

    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::uint64_t checkpoint() const noexcept { return checkpoint_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void setError(const char* what);

    std::filesystem::path path_;
    std::unique_ptr<FILE, FileDeleter> file_;
    std::uint64_t offset_{0};
    std::uint64_t checkpoint_{0};
    std::uint64_t flush_interval_;
    std::string last_error_;
};

} // namespace linkfetch
