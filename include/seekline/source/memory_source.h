#ifndef SEEKLINE_SOURCE_MEMORY_SOURCE_H
#define SEEKLINE_SOURCE_MEMORY_SOURCE_H

#include <seekline/source/byte_source.h>

#include <string>

namespace seekline {

/**
 * ByteSource over an owned in-memory buffer
 */
class MemoryByteSource : public ByteSource {
   public:
    explicit MemoryByteSource(std::string data);

    std::uint64_t size() const override { return data_.size(); }
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t size) override;

   private:
    std::string data_;
    std::size_t position_;
};

}  // namespace seekline

#endif  // SEEKLINE_SOURCE_MEMORY_SOURCE_H
