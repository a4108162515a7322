#include <seekline/reader/error.h>
#include <seekline/source/memory_source.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace seekline {

MemoryByteSource::MemoryByteSource(std::string data)
    : data_(std::move(data)), position_(0) {}

void MemoryByteSource::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Seek offset " + std::to_string(offset) +
                              " is past the end of the buffer (" +
                              std::to_string(data_.size()) + " bytes)");
    }
    position_ = static_cast<std::size_t>(offset);
}

std::size_t MemoryByteSource::read(char *buffer, std::size_t size) {
    std::size_t n = std::min(size, data_.size() - position_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

}  // namespace seekline
