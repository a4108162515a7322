#include <seekline/utils/platform_compat.h>
// platform_compat.h must come first for the large file definitions
#include <seekline/common/constants.h>
#include <seekline/reader/error.h>
#include <seekline/source/file_source.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#ifdef __linux__
#include <fcntl.h>
#endif

namespace seekline {

static std::string errno_message() { return std::strerror(errno); }

FileByteSource::FileByteSource(const std::string &path)
    : path_(path), file_handle_(nullptr), size_(0) {
    file_handle_ = fopen(path.c_str(), "rb");
    if (!file_handle_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to open file: " + path + " (" +
                              errno_message() + ")");
    }

    setvbuf(file_handle_, nullptr, _IOFBF,
            constants::source::FILE_IO_BUFFER_SIZE);

    seekline_stat_t st;
    if (fstat(fileno(file_handle_), &st) != 0) {
        std::string reason = errno_message();
        fclose(file_handle_);
        file_handle_ = nullptr;
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to stat file: " + path + " (" + reason + ")");
    }
    size_ = static_cast<std::uint64_t>(st.st_size);

#ifdef __linux__
    // Navigation jumps around the file, sequential read-ahead does not help
    posix_fadvise(fileno(file_handle_), 0, 0, POSIX_FADV_RANDOM);
#endif

    spdlog::debug("Opened file source {} ({} bytes)", path_, size_);
}

FileByteSource::~FileByteSource() {
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
}

void FileByteSource::seek(std::uint64_t offset) {
    if (fseeko(file_handle_, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek to offset " +
                              std::to_string(offset) + " in " + path_ + " (" +
                              errno_message() + ")");
    }
}

std::size_t FileByteSource::read(char *buffer, std::size_t size) {
    std::size_t n = fread(buffer, 1, size, file_handle_);
    if (n < size && ferror(file_handle_)) {
        clearerr(file_handle_);
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to read from " + path_);
    }
    return n;
}

}  // namespace seekline
