#ifndef SEEKLINE_INDEXER_INDEX_BUILDER_H
#define SEEKLINE_INDEXER_INDEX_BUILDER_H

#include <seekline/indexer/line_index.h>
#include <seekline/reader/navigator.h>

#include <cstdint>

namespace seekline {

/**
 * Builds a LineIndex with one forward pass of unindexed "next line"
 * resolutions. The pass uses its own cursor starting at BOF, so the result
 * does not depend on where the reader currently is.
 */
class IndexBuilder {
   public:
    IndexBuilder(Navigator &navigator, std::uint64_t file_size);

    LineIndex build();

   private:
    Navigator &navigator_;
    std::uint64_t file_size_;
};

}  // namespace seekline

#endif  // SEEKLINE_INDEXER_INDEX_BUILDER_H
