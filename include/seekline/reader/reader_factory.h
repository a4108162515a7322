#ifndef SEEKLINE_READER_READER_FACTORY_H
#define SEEKLINE_READER_READER_FACTORY_H

#include <seekline/common/constants.h>
#include <seekline/random/random_source.h>
#include <seekline/reader/reader.h>
#include <seekline/source/byte_source.h>

#include <cstddef>
#include <memory>
#include <string>

namespace seekline {

enum class SourceFormat {
    PLAIN,  // Uncompressed bytes, read as is
    GZIP    // gzip stream, lines are those of the uncompressed content
};

/**
 * Factory choosing the byte source for a path from its content
 */
class ReaderFactory {
   public:
    /**
     * Create a reader for a plain or gzip-compressed file
     * @throws ReaderError(FILE_IO_ERROR) if the file does not exist or
     * cannot be read
     * @throws ReaderError(EMPTY_FILE) if there is no content
     */
    static std::unique_ptr<Reader> create(
        const std::string &path,
        std::size_t chunk_size = constants::scanner::DEFAULT_CHUNK_SIZE,
        std::unique_ptr<RandomSource> random = nullptr);

    /**
     * Open the byte source matching the detected format
     */
    static std::unique_ptr<ByteSource> open_source(const std::string &path);

    /**
     * Detect the format by looking at the gzip magic bytes
     */
    static SourceFormat detect_format(const std::string &path);

   private:
    ReaderFactory() = delete;  // Static-only class
};

}  // namespace seekline

#endif  // SEEKLINE_READER_READER_FACTORY_H
