#ifndef SEEKLINE_INDEXER_LINE_INDEX_H
#define SEEKLINE_INDEXER_LINE_INDEX_H

#include <seekline/reader/line_span.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace seekline {

/**
 * Ordered table of every line span of a source plus a reverse lookup from
 * a span's start offset to its position in the table.
 *
 * Spans are appended in file order while the index is built and never
 * modified afterwards.
 */
class LineIndex {
   public:
    LineIndex() = default;

    /**
     * Append the next span in file order
     * @throws ReaderError(INDEX_ERROR) if the span does not start after the
     * previously appended one
     */
    void append(const LineSpan &span);

    std::size_t size() const { return spans_.size(); }
    bool empty() const { return spans_.empty(); }

    /**
     * @throws ReaderError(INDEX_ERROR) if position is out of range
     */
    const LineSpan &at(std::size_t position) const;

    /**
     * Position of the span starting at `start_offset`, if any
     */
    std::optional<std::size_t> position_of(std::uint64_t start_offset) const;

    const std::vector<LineSpan> &get_spans() const { return spans_; }

   private:
    std::vector<LineSpan> spans_;
    std::unordered_map<std::uint64_t, std::size_t> positions_;
};

}  // namespace seekline

#endif  // SEEKLINE_INDEXER_LINE_INDEX_H
