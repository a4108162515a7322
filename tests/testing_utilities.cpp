#include "testing_utilities.h"

#include <seekline/utils/filesystem.h>
#include <zlib.h>

#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace seekline_test {
bool compress_file_to_gzip(const std::string& input_file,
                           const std::string& output_file) {
    std::ifstream input(input_file, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }

    gzFile gz_output = gzopen(output_file.c_str(), "wb");
    if (!gz_output) {
        return false;
    }

    const std::size_t buffer_size = 8192;
    std::vector<char> buffer(buffer_size);

    while (input.read(buffer.data(), buffer_size) || input.gcount() > 0) {
        unsigned int bytes_read = static_cast<unsigned int>(input.gcount());
        if (gzwrite(gz_output, buffer.data(), bytes_read) !=
            static_cast<int>(bytes_read)) {
            gzclose(gz_output);
            return false;
        }
    }

    return gzclose(gz_output) == Z_OK;
}

std::string make_lines_text(std::size_t lines, const std::string& terminator) {
    std::string text;
    for (std::size_t i = 1; i <= lines; ++i) {
        text += "{\"id\": " + std::to_string(i) + ", \"message\": \"" +
                std::string(i % 13, 'x') + "\"}" + terminator;
    }
    return text;
}

TestEnvironment::TestEnvironment() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    fs::path temp_base = fs::temp_directory_path();
    fs::path test_path =
        temp_base / ("seekline_test_" + std::to_string(dis(gen)));

    std::error_code ec;
    if (fs::create_directories(test_path, ec)) {
        test_dir = test_path.string();
    }
    // test_dir stays empty on failure, see is_valid()
}

TestEnvironment::~TestEnvironment() {
    if (!test_dir.empty()) {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
}

const std::string& TestEnvironment::get_dir() const { return test_dir; }
bool TestEnvironment::is_valid() const { return !test_dir.empty(); }

std::string TestEnvironment::write_file(const std::string& name,
                                        const std::string& content) {
    if (test_dir.empty()) {
        return "";
    }

    std::string path = test_dir + "/" + name;
    std::ofstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return "";
    }
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    f.close();
    return f ? path : "";
}

std::string TestEnvironment::write_gzip_file(const std::string& name,
                                             const std::string& content) {
    std::string txt_file = write_file(name + ".txt", content);
    if (txt_file.empty()) {
        return "";
    }

    std::string gz_file = test_dir + "/" + name;
    bool success = compress_file_to_gzip(txt_file, gz_file);
    fs::remove(txt_file);

    return success ? gz_file : "";
}
}  // namespace seekline_test

extern "C" {
int compress_file_to_gzip_c(const char* input_file, const char* output_file) {
    if (!input_file || !output_file) return 0;
    return seekline_test::compress_file_to_gzip(input_file, output_file) ? 1
                                                                         : 0;
}
}
