#ifndef SEEKLINE_READER_READER_IMPL_H
#define SEEKLINE_READER_READER_IMPL_H

#include <seekline/indexer/line_index.h>
#include <seekline/random/random_source.h>
#include <seekline/reader/line_span.h>
#include <seekline/reader/navigator.h>
#include <seekline/source/byte_source.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace seekline {

struct ReaderImplementor {
    // Declaration order matters: navigator holds references to both
    std::unique_ptr<ByteSource> source;
    std::unique_ptr<RandomSource> random;
    Cursor cursor;
    Navigator navigator;
    std::unique_ptr<LineIndex> index;

    ReaderImplementor(std::unique_ptr<ByteSource> source_,
                      std::unique_ptr<RandomSource> random_,
                      std::size_t chunk_size);

    std::optional<std::string> read_line(ReadMode mode);
    void build_index();
    std::size_t get_num_lines() const;

    inline void to_bof() { cursor.to_bof(); }
    inline void to_eof() { cursor.to_eof(); }
    inline bool is_indexed() const { return index != nullptr; }
    inline std::uint64_t get_file_size() const { return cursor.file_size; }
    inline void set_chunk_size(std::size_t chunk_size) {
        navigator.get_scanner().set_chunk_size(chunk_size);
    }
    inline std::size_t get_chunk_size() {
        return navigator.get_scanner().get_chunk_size();
    }
};

}  // namespace seekline

#endif  // SEEKLINE_READER_READER_IMPL_H
