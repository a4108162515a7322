#ifndef SEEKLINE_READER_LINE_SPAN_H
#define SEEKLINE_READER_LINE_SPAN_H

#include <cstdint>

namespace seekline {

/**
 * Half-open byte range [start, end) of one line, terminator excluded
 */
struct LineSpan {
    std::uint64_t start;
    std::uint64_t end;

    std::uint64_t length() const { return end - start; }

    bool operator==(const LineSpan &other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const LineSpan &other) const { return !(*this == other); }
};

enum class ReadMode { PREVIOUS, CURRENT, NEXT, RANDOM };

/**
 * Position of a reader inside its source.
 *
 * A blank first line and BOF share the span (0, 0), so BOF is tracked with
 * an explicit flag that is cleared as soon as a line is resolved.
 */
struct Cursor {
    LineSpan span;
    std::uint64_t file_size;
    bool before_first;

    explicit Cursor(std::uint64_t file_size_)
        : span{0, 0}, file_size(file_size_), before_first(true) {}

    bool is_bof() const { return before_first; }
    bool is_eof() const {
        return span.start == file_size && span.end == file_size;
    }

    void to_bof() {
        span = {0, 0};
        before_first = true;
    }

    void to_eof() {
        span = {file_size, file_size};
        before_first = false;
    }

    void set(const LineSpan &resolved) {
        span = resolved;
        before_first = false;
    }
};

}  // namespace seekline

#endif  // SEEKLINE_READER_LINE_SPAN_H
