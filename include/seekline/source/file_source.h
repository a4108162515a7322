#ifndef SEEKLINE_SOURCE_FILE_SOURCE_H
#define SEEKLINE_SOURCE_FILE_SOURCE_H

#include <seekline/source/byte_source.h>

#include <cstdio>
#include <string>

namespace seekline {

/**
 * ByteSource over a regular file opened with stdio
 */
class FileByteSource : public ByteSource {
   public:
    /**
     * @throws ReaderError(FILE_IO_ERROR) if the file cannot be opened or
     * its size cannot be determined
     */
    explicit FileByteSource(const std::string &path);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource &) = delete;
    FileByteSource &operator=(const FileByteSource &) = delete;

    std::uint64_t size() const override { return size_; }
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t size) override;

    const std::string &get_path() const { return path_; }

   private:
    std::string path_;
    FILE *file_handle_;
    std::uint64_t size_;
};

}  // namespace seekline

#endif  // SEEKLINE_SOURCE_FILE_SOURCE_H
