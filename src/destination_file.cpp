#include "linkfetch/destination_file.hpp"

#include "linkfetch/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <unistd.h>

namespace linkfetch {

DestinationFile::DestinationFile(std::filesystem::path path, std::uint64_t offset,
                                 std::uint64_t flush_interval_bytes)
    : path_(std::move(path)), flush_interval_(flush_interval_bytes) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path_, ec);
    file_.reset(std::fopen(path_.c_str(), exists ? "r+b" : "w+b"));
    if (!file_) {
        throw TransferError(fmt::format("Cannot open destination file {}: {}",
                                        path_.string(), std::strerror(errno)));
    }

    if (!truncate(offset)) {
        throw TransferError(last_error_);
    }
}

DestinationFile::~DestinationFile() = default;

bool DestinationFile::append(const char* data, std::size_t size) {
    if (!file_) {
        last_error_ = "Destination file is closed";
        return false;
    }

    const std::size_t written = std::fwrite(data, 1, size, file_.get());
    offset_ += written;
    if (written != size) {
        setError("Failed to write output file");
        return false;
    }
    return true;
}

bool DestinationFile::maybeFlush() {
    if (offset_ - checkpoint_ < flush_interval_) {
        return true;
    }
    return flush();
}

bool DestinationFile::flush() {
    if (!file_) {
        return true;
    }
    if (std::fflush(file_.get()) != 0) {
        setError("Failed to flush output file");
        return false;
    }
    if (::fsync(fileno(file_.get())) != 0) {
        setError("Failed to sync output file");
        return false;
    }
    checkpoint_ = offset_;
    return true;
}

bool DestinationFile::truncate(std::uint64_t offset) {
    if (!file_) {
        last_error_ = "Destination file is closed";
        return false;
    }
    if (std::fflush(file_.get()) != 0) {
        setError("Failed to flush output file");
        return false;
    }
    if (::ftruncate(fileno(file_.get()), static_cast<off_t>(offset)) == -1) {
        setError("Cannot resize destination file");
        return false;
    }
    if (fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        setError("Failed to seek output file");
        return false;
    }
    offset_ = offset;
    checkpoint_ = offset;
    return true;
}

bool DestinationFile::close() {
    if (!file_) {
        return true;
    }
    const bool flushed = flush();
    file_.reset();
    return flushed;
}

void DestinationFile::setError(const char* what) {
    last_error_ = fmt::format("{} {}: {}", what, path_.string(), std::strerror(errno));
}

} // namespace linkfetch
