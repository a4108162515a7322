#include <seekline/common/constants.h>
#include <seekline/reader/boundary_scanner.h>
#include <seekline/reader/error.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

using constants::scanner::CR_BYTE;
using constants::scanner::LF_BYTE;

namespace seekline {

BoundaryScanner::BoundaryScanner(ByteSource &source, std::size_t chunk_size)
    : source_(source), file_size_(source.size()), chunk_size_(0) {
    set_chunk_size(chunk_size);
}

void BoundaryScanner::set_chunk_size(std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Chunk size must be greater than 0");
    }
    // A scan never reads more than the whole source in one call
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size, file_size_)));
    chunk_.swap(buffer);
    chunk_size_ = chunk_size;
}

void BoundaryScanner::read_chunk(std::uint64_t offset, std::size_t length) {
    std::size_t n = source_.read_at(offset, chunk_.data(), length);
    if (n != length) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Short read at offset " + std::to_string(offset) +
                              ": expected " + std::to_string(length) +
                              " bytes, got " + std::to_string(n));
    }
}

char BoundaryScanner::read_byte(std::uint64_t offset) {
    char byte = 0;
    if (source_.read_at(offset, &byte, 1) != 1) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Short read at offset " + std::to_string(offset));
    }
    return byte;
}

std::uint64_t BoundaryScanner::find_start_backward(std::uint64_t origin,
                                                   bool skip_origin) {
    std::uint64_t probe = origin;
    while (probe > 0) {
        // Near the beginning only the bytes in [0, probe) are read
        std::uint64_t from = probe >= chunk_size_ ? probe - chunk_size_ : 0;
        std::size_t length = static_cast<std::size_t>(probe - from);
        read_chunk(from, length);

        for (std::size_t i = length; i > 0; --i) {
            // chunk_[i - 1] is the byte at probe - 1
            if (skip_origin && probe == origin) {
                --probe;
                continue;
            }
            if (chunk_[i - 1] == LF_BYTE) {
                return probe;
            }
            --probe;
        }
    }
    return 0;
}

std::optional<std::uint64_t> BoundaryScanner::find_start_forward(
    std::uint64_t origin) {
    std::uint64_t probe = origin;
    while (probe < file_size_) {
        std::size_t length = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, file_size_ - probe));
        read_chunk(probe, length);

        const void *hit = std::memchr(chunk_.data(), LF_BYTE, length);
        if (hit) {
            std::uint64_t next =
                probe + static_cast<std::uint64_t>(
                            static_cast<const char *>(hit) - chunk_.data()) +
                1;
            if (next >= file_size_) {
                return std::nullopt;
            }
            return next;
        }
        probe += length;
    }
    return std::nullopt;
}

std::uint64_t BoundaryScanner::find_end(std::uint64_t start) {
    std::uint64_t probe = start;
    while (probe < file_size_) {
        std::size_t length = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, file_size_ - probe));
        read_chunk(probe, length);

        const void *hit = std::memchr(chunk_.data(), LF_BYTE, length);
        if (hit) {
            std::size_t i = static_cast<std::size_t>(
                static_cast<const char *>(hit) - chunk_.data());
            std::uint64_t end = probe + i;
            if (end > start) {
                char preceding = i > 0 ? chunk_[i - 1] : read_byte(end - 1);
                if (preceding == CR_BYTE) {
                    --end;
                }
            }
            return end;
        }
        probe += length;
    }
    return file_size_;
}

}  // namespace seekline
