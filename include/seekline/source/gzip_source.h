#ifndef SEEKLINE_SOURCE_GZIP_SOURCE_H
#define SEEKLINE_SOURCE_GZIP_SOURCE_H

#include <seekline/source/byte_source.h>
#include <zlib.h>

#include <string>

namespace seekline {

/**
 * ByteSource over the uncompressed content of a gzip file.
 *
 * Offsets address uncompressed bytes. The uncompressed size is measured by
 * one streaming pass when the source is opened. Backward seeks make zlib
 * restart decompression from the beginning of the stream, so backward
 * navigation is much slower than on a plain file.
 */
class GzipByteSource : public ByteSource {
   public:
    /**
     * @throws ReaderError(FILE_IO_ERROR) if the file cannot be opened or the
     * compressed stream is corrupt
     */
    explicit GzipByteSource(const std::string &path);
    ~GzipByteSource() override;

    GzipByteSource(const GzipByteSource &) = delete;
    GzipByteSource &operator=(const GzipByteSource &) = delete;

    std::uint64_t size() const override { return size_; }
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t size) override;

    const std::string &get_path() const { return path_; }

   private:
    std::string last_error() const;
    std::uint64_t measure_uncompressed_size();

    std::string path_;
    gzFile gz_handle_;
    std::uint64_t size_;
};

}  // namespace seekline

#endif  // SEEKLINE_SOURCE_GZIP_SOURCE_H
