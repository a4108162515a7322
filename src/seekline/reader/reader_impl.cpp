#include <seekline/indexer/index_builder.h>
#include <seekline/reader/error.h>
#include <seekline/reader/reader_impl.h>
#include <seekline/utils/timer.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace seekline {

static std::unique_ptr<ByteSource> require_non_empty(
    std::unique_ptr<ByteSource> source) {
    if (!source) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Byte source must not be null");
    }
    if (source->size() == 0) {
        throw ReaderError(ReaderError::EMPTY_FILE,
                          "Cannot navigate lines of a zero-length source");
    }
    return source;
}

static std::unique_ptr<RandomSource> default_random(
    std::unique_ptr<RandomSource> random) {
    if (random) {
        return random;
    }
    return std::make_unique<Mt19937RandomSource>();
}

ReaderImplementor::ReaderImplementor(std::unique_ptr<ByteSource> source_,
                                     std::unique_ptr<RandomSource> random_,
                                     std::size_t chunk_size)
    : source(require_non_empty(std::move(source_))),
      random(default_random(std::move(random_))),
      cursor(source->size()),
      navigator(*source, *random, chunk_size) {
    spdlog::debug("Created reader over {} bytes with chunk_size={}",
                  cursor.file_size, chunk_size);
}

std::optional<std::string> ReaderImplementor::read_line(ReadMode mode) {
    auto span = navigator.resolve(mode, cursor, index.get());
    if (!span) {
        return std::nullopt;
    }
    return navigator.decode(*span);
}

void ReaderImplementor::build_index() {
    if (index) {
        spdlog::debug("Line index already built ({} lines), skipping",
                      index->size());
        return;
    }

    Timer timer(true);
    IndexBuilder builder(navigator, cursor.file_size);
    index = std::make_unique<LineIndex>(builder.build());
    timer.stop();

    cursor.to_bof();
    spdlog::info("Line index built: {} lines in {:.3f} ms", index->size(),
                 timer.elapsed());
}

std::size_t ReaderImplementor::get_num_lines() const {
    if (!index) {
        throw ReaderError(ReaderError::INDEX_ERROR,
                          "Line count is only known after build_index()");
    }
    return index->size();
}

}  // namespace seekline
