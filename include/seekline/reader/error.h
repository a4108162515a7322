#ifndef SEEKLINE_READER_ERROR_H
#define SEEKLINE_READER_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace seekline {

class ReaderError : public std::runtime_error {
   public:
    enum Type {
        EMPTY_FILE,
        FILE_IO_ERROR,
        DECODE_ERROR,
        INVALID_ARGUMENT,
        INDEX_ERROR
    };

    ReaderError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message);
    Type type_;
};

/**
 * Raised when a resolved line span is not valid UTF-8. Carries the byte
 * range of the offending line.
 */
class DecodeError : public ReaderError {
   public:
    DecodeError(std::uint64_t start_offset, std::uint64_t end_offset,
                const std::string &cause);

    std::uint64_t start_offset() const { return start_offset_; }
    std::uint64_t end_offset() const { return end_offset_; }

   private:
    std::uint64_t start_offset_;
    std::uint64_t end_offset_;
};

}  // namespace seekline

#endif  // SEEKLINE_READER_ERROR_H
