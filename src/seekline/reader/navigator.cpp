#include <seekline/reader/error.h>
#include <seekline/reader/navigator.h>
#include <simdjson.h>

#include <string>

namespace seekline {

Navigator::Navigator(ByteSource &source, RandomSource &random,
                     std::size_t chunk_size)
    : source_(source), random_(random), scanner_(source, chunk_size) {}

std::optional<LineSpan> Navigator::resolve(ReadMode mode, Cursor &cursor,
                                           const LineIndex *index) {
    if (index) {
        return resolve_indexed(mode, cursor, *index);
    }
    return resolve_unindexed(mode, cursor);
}

std::optional<LineSpan> Navigator::resolve_unindexed(ReadMode mode,
                                                     Cursor &cursor) {
    std::uint64_t start = 0;
    switch (mode) {
        case ReadMode::PREVIOUS:
            if (cursor.is_bof() || cursor.span.start == 0) {
                return std::nullopt;
            }
            start = scanner_.find_start_backward(cursor.span.start, true);
            break;
        case ReadMode::CURRENT:
            if (cursor.is_bof()) {
                start = 0;
            } else if (cursor.is_eof()) {
                start = scanner_.find_start_backward(cursor.file_size, true);
            } else {
                return cursor.span;
            }
            break;
        case ReadMode::NEXT:
            if (cursor.is_bof()) {
                start = 0;
            } else {
                if (cursor.span.end == cursor.file_size) {
                    return std::nullopt;
                }
                auto next = scanner_.find_start_forward(cursor.span.end);
                if (!next) {
                    // Only a trailing terminator is left
                    cursor.to_eof();
                    return std::nullopt;
                }
                start = *next;
            }
            break;
        case ReadMode::RANDOM: {
            // Lines are picked proportionally to their length in bytes
            std::uint64_t offset = random_.uniform(cursor.file_size);
            start = scanner_.find_start_backward(offset, false);
            break;
        }
    }

    LineSpan span{start, scanner_.find_end(start)};
    cursor.set(span);
    return span;
}

std::size_t Navigator::indexed_position(const Cursor &cursor,
                                        const LineIndex &index) const {
    auto position = index.position_of(cursor.span.start);
    if (!position) {
        throw ReaderError(ReaderError::INDEX_ERROR,
                          "No indexed line starts at offset " +
                              std::to_string(cursor.span.start));
    }
    return *position;
}

std::optional<LineSpan> Navigator::resolve_indexed(ReadMode mode,
                                                   Cursor &cursor,
                                                   const LineIndex &index) {
    if (index.empty()) {
        throw ReaderError(ReaderError::INDEX_ERROR, "Index has no lines");
    }

    std::size_t position = 0;
    switch (mode) {
        case ReadMode::PREVIOUS:
            if (cursor.is_bof() || cursor.span.start == 0) {
                return std::nullopt;
            }
            if (cursor.is_eof()) {
                position = index.size() - 1;
            } else {
                position = indexed_position(cursor, index);
                if (position == 0) {
                    return std::nullopt;
                }
                --position;
            }
            break;
        case ReadMode::CURRENT:
            if (cursor.is_bof()) {
                position = 0;
            } else if (cursor.is_eof()) {
                position = index.size() - 1;
            } else {
                return cursor.span;
            }
            break;
        case ReadMode::NEXT:
            if (cursor.is_bof()) {
                position = 0;
            } else {
                if (cursor.span.end == cursor.file_size) {
                    return std::nullopt;
                }
                position = indexed_position(cursor, index) + 1;
                if (position == index.size()) {
                    cursor.to_eof();
                    return std::nullopt;
                }
            }
            break;
        case ReadMode::RANDOM:
            position = static_cast<std::size_t>(random_.uniform(index.size()));
            break;
    }

    const LineSpan &span = index.at(position);
    cursor.set(span);
    return span;
}

std::string Navigator::decode(const LineSpan &span) {
    std::string line(static_cast<std::size_t>(span.length()), '\0');
    if (!line.empty()) {
        std::size_t n = source_.read_at(span.start, &line[0], line.size());
        if (n != line.size()) {
            throw ReaderError(ReaderError::FILE_IO_ERROR,
                              "Short read for line at offset " +
                                  std::to_string(span.start) + ": expected " +
                                  std::to_string(line.size()) +
                                  " bytes, got " + std::to_string(n));
        }
    }
    if (!simdjson::validate_utf8(line.data(), line.size())) {
        throw DecodeError(span.start, span.end,
                          "invalid UTF-8 byte sequence");
    }
    return line;
}

}  // namespace seekline
