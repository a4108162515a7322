#include <seekline/indexer/line_index.h>
#include <seekline/reader/error.h>

#include <string>

namespace seekline {

void LineIndex::append(const LineSpan &span) {
    if (!spans_.empty() && span.start <= spans_.back().end) {
        throw ReaderError(ReaderError::INDEX_ERROR,
                          "Span starting at " + std::to_string(span.start) +
                              " does not follow the span ending at " +
                              std::to_string(spans_.back().end));
    }
    positions_.emplace(span.start, spans_.size());
    spans_.push_back(span);
}

const LineSpan &LineIndex::at(std::size_t position) const {
    if (position >= spans_.size()) {
        throw ReaderError(ReaderError::INDEX_ERROR,
                          "Line position " + std::to_string(position) +
                              " out of range (" +
                              std::to_string(spans_.size()) + " lines)");
    }
    return spans_[position];
}

std::optional<std::size_t> LineIndex::position_of(
    std::uint64_t start_offset) const {
    auto it = positions_.find(start_offset);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace seekline
