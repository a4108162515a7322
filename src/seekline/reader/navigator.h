#ifndef SEEKLINE_READER_NAVIGATOR_H
#define SEEKLINE_READER_NAVIGATOR_H

#include <seekline/indexer/line_index.h>
#include <seekline/random/random_source.h>
#include <seekline/reader/boundary_scanner.h>
#include <seekline/reader/line_span.h>
#include <seekline/source/byte_source.h>

#include <optional>
#include <string>

namespace seekline {

/**
 * Resolves read requests to line spans and moves the cursor.
 *
 * Without an index every request is answered by the BoundaryScanner. With
 * an index, neighbouring and random lines are looked up in the table. An
 * empty result means there is no line in the requested direction.
 */
class Navigator {
   public:
    Navigator(ByteSource &source, RandomSource &random,
              std::size_t chunk_size);

    std::optional<LineSpan> resolve(ReadMode mode, Cursor &cursor,
                                    const LineIndex *index);

    /**
     * Read the span from the source and validate it as UTF-8
     * @throws DecodeError if the bytes are not valid UTF-8
     */
    std::string decode(const LineSpan &span);

    BoundaryScanner &get_scanner() { return scanner_; }

   private:
    std::optional<LineSpan> resolve_unindexed(ReadMode mode, Cursor &cursor);
    std::optional<LineSpan> resolve_indexed(ReadMode mode, Cursor &cursor,
                                            const LineIndex &index);
    std::size_t indexed_position(const Cursor &cursor,
                                 const LineIndex &index) const;

    ByteSource &source_;
    RandomSource &random_;
    BoundaryScanner scanner_;
};

}  // namespace seekline

#endif  // SEEKLINE_READER_NAVIGATOR_H
