#ifndef SEEKLINE_COMMON_CONSTANTS_H
#define SEEKLINE_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace constants {

namespace scanner {
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 200;
static constexpr char LF_BYTE = '\n';
static constexpr char CR_BYTE = '\r';
}  // namespace scanner

namespace source {
static constexpr std::size_t FILE_IO_BUFFER_SIZE =
    262144;  // 256KB for file I/O
static constexpr std::size_t GZIP_SCAN_BUFFER_SIZE = 131072;  // 128KB
static constexpr unsigned GZIP_BUFFER_SIZE = 65536;           // 64KB
static constexpr unsigned char GZIP_MAGIC_0 = 0x1f;
static constexpr unsigned char GZIP_MAGIC_1 = 0x8b;
}  // namespace source

namespace indexer {
static constexpr std::size_t PROGRESS_LOG_LINES = 1 << 20;
}  // namespace indexer
}  // namespace constants

#endif  // SEEKLINE_COMMON_CONSTANTS_H
