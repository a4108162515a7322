#include <seekline/reader/error.h>
#include <seekline/reader/reader_factory.h>
#include <seekline/source/file_source.h>
#include <seekline/source/gzip_source.h>
#include <seekline/utils/filesystem.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <utility>

namespace seekline {

std::unique_ptr<Reader> ReaderFactory::create(
    const std::string &path, std::size_t chunk_size,
    std::unique_ptr<RandomSource> random) {
    return std::make_unique<Reader>(open_source(path), std::move(random),
                                    chunk_size);
}

std::unique_ptr<ByteSource> ReaderFactory::open_source(
    const std::string &path) {
    SourceFormat format = detect_format(path);
    spdlog::debug("ReaderFactory::open_source - detected format {} for {}",
                  static_cast<int>(format), path);

    switch (format) {
        case SourceFormat::GZIP:
            return std::make_unique<GzipByteSource>(path);
        case SourceFormat::PLAIN:
            break;
    }
    return std::make_unique<FileByteSource>(path);
}

SourceFormat ReaderFactory::detect_format(const std::string &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "File '" + path +
                              "' does not exist or is not a regular file");
    }

    FILE *file = fopen(path.c_str(), "rb");
    if (!file) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to open file: " + path);
    }
    unsigned char magic[2] = {0, 0};
    std::size_t n = fread(magic, 1, sizeof(magic), file);
    fclose(file);

    if (n == sizeof(magic) && magic[0] == constants::source::GZIP_MAGIC_0 &&
        magic[1] == constants::source::GZIP_MAGIC_1) {
        return SourceFormat::GZIP;
    }
    return SourceFormat::PLAIN;
}

}  // namespace seekline
