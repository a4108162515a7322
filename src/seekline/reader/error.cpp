#include <seekline/reader/error.h>

namespace seekline {

std::string ReaderError::format_message(Type type,
                                        const std::string &message) {
    const char *prefix = "";
    switch (type) {
        case EMPTY_FILE:
            prefix = "Empty file";
            break;
        case FILE_IO_ERROR:
            prefix = "File I/O error";
            break;
        case DECODE_ERROR:
            prefix = "Decode error";
            break;
        case INVALID_ARGUMENT:
            prefix = "Invalid argument";
            break;
        case INDEX_ERROR:
            prefix = "Index error";
            break;
    }
    return std::string(prefix) + ": " + message;
}

DecodeError::DecodeError(std::uint64_t start_offset, std::uint64_t end_offset,
                         const std::string &cause)
    : ReaderError(DECODE_ERROR,
                  "The line starting at byte " + std::to_string(start_offset) +
                      " and ending at byte " + std::to_string(end_offset) +
                      " is not valid UTF-8: " + cause),
      start_offset_(start_offset),
      end_offset_(end_offset) {}

}  // namespace seekline
