#include <seekline/common/constants.h>
#include <seekline/reader/error.h>
#include <seekline/source/gzip_source.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <climits>
#include <vector>

namespace seekline {

GzipByteSource::GzipByteSource(const std::string &path)
    : path_(path), gz_handle_(nullptr), size_(0) {
    gz_handle_ = gzopen(path.c_str(), "rb");
    if (!gz_handle_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to open gzip file: " + path);
    }
    if (gzbuffer(gz_handle_, constants::source::GZIP_BUFFER_SIZE) != 0) {
        spdlog::debug("gzbuffer rejected, keeping zlib default for {}", path);
    }

    try {
        size_ = measure_uncompressed_size();
    } catch (...) {
        gzclose(gz_handle_);
        gz_handle_ = nullptr;
        throw;
    }

    spdlog::debug("Opened gzip source {} ({} uncompressed bytes)", path_,
                  size_);
}

GzipByteSource::~GzipByteSource() {
    if (gz_handle_) {
        gzclose(gz_handle_);
        gz_handle_ = nullptr;
    }
}

std::uint64_t GzipByteSource::measure_uncompressed_size() {
    std::vector<char> buffer(constants::source::GZIP_SCAN_BUFFER_SIZE);
    std::uint64_t total = 0;
    while (true) {
        int n = gzread(gz_handle_, buffer.data(),
                       static_cast<unsigned>(buffer.size()));
        if (n < 0) {
            throw ReaderError(ReaderError::FILE_IO_ERROR,
                              "Failed to decompress " + path_ + ": " +
                                  last_error());
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::uint64_t>(n);
    }
    if (gzrewind(gz_handle_) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to rewind " + path_ + ": " + last_error());
    }
    return total;
}

std::string GzipByteSource::last_error() const {
    int errnum = Z_OK;
    const char *message = gzerror(gz_handle_, &errnum);
    return message ? message : "unknown zlib error";
}

void GzipByteSource::seek(std::uint64_t offset) {
    z_off_t result = gzseek(gz_handle_, static_cast<z_off_t>(offset), SEEK_SET);
    if (result < 0 || static_cast<std::uint64_t>(result) != offset) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek to uncompressed offset " +
                              std::to_string(offset) + " in " + path_ + ": " +
                              last_error());
    }
}

std::size_t GzipByteSource::read(char *buffer, std::size_t size) {
    unsigned len = static_cast<unsigned>(
        std::min<std::size_t>(size, static_cast<std::size_t>(INT_MAX)));
    int n = gzread(gz_handle_, buffer, len);
    if (n < 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to read from " + path_ + ": " +
                              last_error());
    }
    return static_cast<std::size_t>(n);
}

}  // namespace seekline
