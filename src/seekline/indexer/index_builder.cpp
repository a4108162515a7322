#include <seekline/common/constants.h>
#include <seekline/indexer/index_builder.h>
#include <spdlog/spdlog.h>

namespace seekline {

IndexBuilder::IndexBuilder(Navigator &navigator, std::uint64_t file_size)
    : navigator_(navigator), file_size_(file_size) {}

LineIndex IndexBuilder::build() {
    spdlog::debug("Building line index over {} bytes with chunk_size={}",
                  file_size_, navigator_.get_scanner().get_chunk_size());

    LineIndex index;
    Cursor cursor(file_size_);
    while (auto span = navigator_.resolve(ReadMode::NEXT, cursor, nullptr)) {
        index.append(*span);
        if (index.size() % constants::indexer::PROGRESS_LOG_LINES == 0) {
            spdlog::debug("Indexed {} lines, at byte {} of {}", index.size(),
                          span->end, file_size_);
        }
    }

    spdlog::debug("Index pass complete: {} lines", index.size());
    return index;
}

}  // namespace seekline
