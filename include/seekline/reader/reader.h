#ifndef SEEKLINE_READER_READER_H
#define SEEKLINE_READER_READER_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

/**
 * Opaque handle for a seekline reader
 */
typedef void *seekline_reader_handle_t;

/**
 * Create a reader for a plain or gzip-compressed file
 * @param path Path to the file
 * @param chunk_size Scan chunk size in bytes, 0 for the default
 * @return handle, or NULL on failure (missing file, empty file, ...)
 */
seekline_reader_handle_t seekline_reader_create(const char *path,
                                                size_t chunk_size);

/**
 * Same as seekline_reader_create with a deterministic random sequence
 */
seekline_reader_handle_t seekline_reader_create_with_seed(const char *path,
                                                          size_t chunk_size,
                                                          uint64_t seed);
void seekline_reader_destroy(seekline_reader_handle_t reader);

/**
 * Line readers copy the line plus a terminating NUL into `buffer`.
 * @param line_length Receives the line length in bytes (without NUL)
 * @return 1 if a line was read, 0 if there is no line in that direction,
 *         -1 on error. If the buffer is too small -1 is returned,
 *         `line_length` holds the required length and the cursor is left on
 *         that line, so seekline_reader_current_line can fetch it again.
 */
int seekline_reader_next_line(seekline_reader_handle_t reader, char *buffer,
                              size_t buffer_size, size_t *line_length);
int seekline_reader_prev_line(seekline_reader_handle_t reader, char *buffer,
                              size_t buffer_size, size_t *line_length);
int seekline_reader_current_line(seekline_reader_handle_t reader,
                                 char *buffer, size_t buffer_size,
                                 size_t *line_length);
int seekline_reader_random_line(seekline_reader_handle_t reader, char *buffer,
                                size_t buffer_size, size_t *line_length);

void seekline_reader_to_bof(seekline_reader_handle_t reader);
void seekline_reader_to_eof(seekline_reader_handle_t reader);
int seekline_reader_build_index(seekline_reader_handle_t reader);
int seekline_reader_set_chunk_size(seekline_reader_handle_t reader,
                                   size_t chunk_size);
int seekline_reader_get_num_lines(seekline_reader_handle_t reader,
                                  size_t *num_lines);
int seekline_reader_get_file_size(seekline_reader_handle_t reader,
                                  uint64_t *file_size);

#ifdef __cplusplus
}  // extern "C"

#include <seekline/common/constants.h>
#include <seekline/random/random_source.h>
#include <seekline/reader/error.h>
#include <seekline/reader/line_span.h>
#include <seekline/source/byte_source.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace seekline {

struct ReaderImplementor;

/**
 * Bidirectional, random-access line reader over a ByteSource.
 *
 * The reader keeps a cursor on the current line and resolves neighbouring
 * lines by scanning the source in chunks, so memory use does not depend on
 * the file size. After build_index() every line span is kept in memory and
 * navigation becomes a table lookup.
 *
 * random_line() without an index picks a random byte and returns the line
 * containing it, so long lines are picked more often than short ones. With
 * an index every line has the same probability.
 *
 * Lines end at LF or CRLF; terminators are never part of a returned line.
 * A reader is not thread safe.
 *
 * Example usage:
 * ```cpp
 * seekline::Reader reader("trace.log");
 * while (auto line = reader.next_line()) {
 *     // ...
 * }
 * reader.to_eof();
 * auto last = reader.prev_line();
 * ```
 */
class Reader {
   public:
    /**
     * Open a plain file
     * @throws ReaderError(FILE_IO_ERROR) if the file cannot be opened
     * @throws ReaderError(EMPTY_FILE) if the file is empty
     */
    explicit Reader(
        const std::string &path,
        std::size_t chunk_size = constants::scanner::DEFAULT_CHUNK_SIZE);

    /**
     * Take ownership of an already opened source. Without a random source a
     * Mt19937RandomSource seeded from std::random_device is used.
     * @throws ReaderError(EMPTY_FILE) if the source is empty
     */
    Reader(std::unique_ptr<ByteSource> source,
           std::unique_ptr<RandomSource> random = nullptr,
           std::size_t chunk_size = constants::scanner::DEFAULT_CHUNK_SIZE);

    ~Reader();

    Reader(const Reader &) = delete;
    Reader &operator=(const Reader &) = delete;
    Reader(Reader &&other) noexcept;
    Reader &operator=(Reader &&other) noexcept;

    /**
     * Move the cursor before the first line, no I/O
     */
    Reader &to_bof();

    /**
     * Move the cursor after the last line, no I/O
     */
    Reader &to_eof();

    /**
     * Line after the cursor, empty at the end of the file
     */
    std::optional<std::string> next_line();

    /**
     * Line before the cursor, empty at the beginning of the file
     */
    std::optional<std::string> prev_line();

    /**
     * Line under the cursor. At BOF this is the first line, at EOF the last
     * one. Does not move the cursor otherwise.
     */
    std::optional<std::string> current_line();

    /**
     * Random line, see the class comment for the selection probability
     */
    std::optional<std::string> random_line();

    /**
     * Scan the whole file once and keep every line span in memory. Always
     * scans from the beginning of the file and leaves the cursor at BOF;
     * calling it again on an indexed reader does nothing.
     */
    Reader &build_index();

    /**
     * Scan granularity in bytes, does not change results
     * @throws ReaderError(INVALID_ARGUMENT) if chunk_size is 0
     */
    void set_chunk_size(std::size_t chunk_size);
    std::size_t get_chunk_size() const;

    std::uint64_t get_file_size() const;
    LineSpan get_current_span() const;
    bool is_bof() const;
    bool is_eof() const;
    bool is_indexed() const;

    /**
     * Number of lines
     * @throws ReaderError(INDEX_ERROR) if the index has not been built
     */
    std::size_t get_num_lines() const;

    bool is_valid() const;

   private:
    ReaderImplementor &impl() const;

    std::unique_ptr<ReaderImplementor> p_impl_;
};

}  // namespace seekline
#endif

#endif  // SEEKLINE_READER_READER_H
