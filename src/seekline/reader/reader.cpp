#include <seekline/reader/error.h>
#include <seekline/reader/reader.h>
#include <seekline/reader/reader_factory.h>
#include <seekline/reader/reader_impl.h>
#include <seekline/source/file_source.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <utility>

namespace seekline {

Reader::Reader(const std::string &path, std::size_t chunk_size)
    : p_impl_(new ReaderImplementor(std::make_unique<FileByteSource>(path),
                                    nullptr, chunk_size)) {}

Reader::Reader(std::unique_ptr<ByteSource> source,
               std::unique_ptr<RandomSource> random, std::size_t chunk_size)
    : p_impl_(new ReaderImplementor(std::move(source), std::move(random),
                                    chunk_size)) {}

Reader::~Reader() = default;

Reader::Reader(Reader &&other) noexcept : p_impl_(other.p_impl_.release()) {}

Reader &Reader::operator=(Reader &&other) noexcept {
    if (this != &other) {
        p_impl_.reset(other.p_impl_.release());
    }
    return *this;
}

ReaderImplementor &Reader::impl() const {
    if (!p_impl_) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT, "Reader is not open");
    }
    return *p_impl_;
}

Reader &Reader::to_bof() {
    impl().to_bof();
    return *this;
}

Reader &Reader::to_eof() {
    impl().to_eof();
    return *this;
}

std::optional<std::string> Reader::next_line() {
    return impl().read_line(ReadMode::NEXT);
}

std::optional<std::string> Reader::prev_line() {
    return impl().read_line(ReadMode::PREVIOUS);
}

std::optional<std::string> Reader::current_line() {
    return impl().read_line(ReadMode::CURRENT);
}

std::optional<std::string> Reader::random_line() {
    return impl().read_line(ReadMode::RANDOM);
}

Reader &Reader::build_index() {
    impl().build_index();
    return *this;
}

void Reader::set_chunk_size(std::size_t chunk_size) {
    impl().set_chunk_size(chunk_size);
}

std::size_t Reader::get_chunk_size() const { return impl().get_chunk_size(); }

std::uint64_t Reader::get_file_size() const { return impl().get_file_size(); }

LineSpan Reader::get_current_span() const { return impl().cursor.span; }

bool Reader::is_bof() const { return impl().cursor.is_bof(); }

bool Reader::is_eof() const { return impl().cursor.is_eof(); }

bool Reader::is_indexed() const { return impl().is_indexed(); }

std::size_t Reader::get_num_lines() const { return impl().get_num_lines(); }

bool Reader::is_valid() const { return p_impl_ != nullptr; }

}  // namespace seekline

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

using seekline::Reader;
using seekline::ReaderFactory;

static Reader *to_reader(seekline_reader_handle_t handle) {
    return static_cast<Reader *>(handle);
}

static std::size_t effective_chunk_size(std::size_t chunk_size) {
    return chunk_size == 0 ? constants::scanner::DEFAULT_CHUNK_SIZE
                           : chunk_size;
}

template <typename ReadFn>
static int copy_line(seekline_reader_handle_t handle, char *buffer,
                     std::size_t buffer_size, std::size_t *line_length,
                     const char *operation, ReadFn read) {
    if (!handle || !buffer || buffer_size == 0) {
        spdlog::error("Invalid parameters for {}", operation);
        return -1;
    }

    try {
        std::optional<std::string> line = read(*to_reader(handle));
        if (!line) {
            if (line_length) {
                *line_length = 0;
            }
            buffer[0] = '\0';
            return 0;
        }
        if (line_length) {
            *line_length = line->size();
        }
        if (line->size() + 1 > buffer_size) {
            spdlog::error("{}: line of {} bytes does not fit a buffer of {}",
                          operation, line->size(), buffer_size);
            return -1;
        }
        std::memcpy(buffer, line->data(), line->size());
        buffer[line->size()] = '\0';
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("{} failed: {}", operation, e.what());
        return -1;
    }
}

extern "C" {

seekline_reader_handle_t seekline_reader_create(const char *path,
                                                size_t chunk_size) {
    if (!path) {
        spdlog::error("Invalid parameters for reader creation");
        return nullptr;
    }

    try {
        auto reader =
            ReaderFactory::create(path, effective_chunk_size(chunk_size));
        return static_cast<seekline_reader_handle_t>(reader.release());
    } catch (const std::exception &e) {
        spdlog::error("Failed to create reader: {}", e.what());
        return nullptr;
    }
}

seekline_reader_handle_t seekline_reader_create_with_seed(const char *path,
                                                          size_t chunk_size,
                                                          uint64_t seed) {
    if (!path) {
        spdlog::error("Invalid parameters for reader creation");
        return nullptr;
    }

    try {
        auto reader = ReaderFactory::create(
            path, effective_chunk_size(chunk_size),
            std::make_unique<seekline::Mt19937RandomSource>(seed));
        return static_cast<seekline_reader_handle_t>(reader.release());
    } catch (const std::exception &e) {
        spdlog::error("Failed to create reader: {}", e.what());
        return nullptr;
    }
}

void seekline_reader_destroy(seekline_reader_handle_t reader) {
    delete to_reader(reader);
}

int seekline_reader_next_line(seekline_reader_handle_t reader, char *buffer,
                              size_t buffer_size, size_t *line_length) {
    return copy_line(reader, buffer, buffer_size, line_length, "next_line",
                     [](Reader &r) { return r.next_line(); });
}

int seekline_reader_prev_line(seekline_reader_handle_t reader, char *buffer,
                              size_t buffer_size, size_t *line_length) {
    return copy_line(reader, buffer, buffer_size, line_length, "prev_line",
                     [](Reader &r) { return r.prev_line(); });
}

int seekline_reader_current_line(seekline_reader_handle_t reader,
                                 char *buffer, size_t buffer_size,
                                 size_t *line_length) {
    return copy_line(reader, buffer, buffer_size, line_length, "current_line",
                     [](Reader &r) { return r.current_line(); });
}

int seekline_reader_random_line(seekline_reader_handle_t reader, char *buffer,
                                size_t buffer_size, size_t *line_length) {
    return copy_line(reader, buffer, buffer_size, line_length, "random_line",
                     [](Reader &r) { return r.random_line(); });
}

void seekline_reader_to_bof(seekline_reader_handle_t reader) {
    if (reader) {
        to_reader(reader)->to_bof();
    }
}

void seekline_reader_to_eof(seekline_reader_handle_t reader) {
    if (reader) {
        to_reader(reader)->to_eof();
    }
}

int seekline_reader_build_index(seekline_reader_handle_t reader) {
    if (!reader) {
        return -1;
    }

    try {
        to_reader(reader)->build_index();
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Failed to build index: {}", e.what());
        return -1;
    }
}

int seekline_reader_set_chunk_size(seekline_reader_handle_t reader,
                                   size_t chunk_size) {
    if (!reader) {
        return -1;
    }

    try {
        to_reader(reader)->set_chunk_size(chunk_size);
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Failed to set chunk size: {}", e.what());
        return -1;
    }
}

int seekline_reader_get_num_lines(seekline_reader_handle_t reader,
                                  size_t *num_lines) {
    if (!reader || !num_lines) {
        return -1;
    }

    try {
        *num_lines = to_reader(reader)->get_num_lines();
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Failed to get number of lines: {}", e.what());
        return -1;
    }
}

int seekline_reader_get_file_size(seekline_reader_handle_t reader,
                                  uint64_t *file_size) {
    if (!reader || !file_size) {
        return -1;
    }

    *file_size = to_reader(reader)->get_file_size();
    return 0;
}

}  // extern "C"
