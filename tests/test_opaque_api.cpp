#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <seekline/reader/reader.h>
#include <seekline/utils/logger.h>

#include <cstdio>
#include <cstring>
#include <string>

#include "testing_utilities.h"

using namespace seekline_test;

namespace {
const char* EXAMPLE_TEXT = "AAAA AAAA\nB B BB BBB\nCCCC  CCCCC\n";
}

TEST_CASE("Opaque reader creation and destruction") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.write_file("example.txt", EXAMPLE_TEXT);
    REQUIRE(!path.empty());

    seekline_reader_handle_t reader = seekline_reader_create(path.c_str(), 0);
    CHECK(reader != nullptr);

    uint64_t file_size = 0;
    CHECK(seekline_reader_get_file_size(reader, &file_size) == 0);
    CHECK(file_size == std::strlen(EXAMPLE_TEXT));

    seekline_reader_destroy(reader);
}

TEST_CASE("Opaque reader invalid parameters") {
    // silence the expected error logs
    seekline_set_log_level("off");

    TestEnvironment env;
    REQUIRE(env.is_valid());

    CHECK(seekline_reader_create(nullptr, 0) == nullptr);

    std::string missing = env.get_dir() + "/missing.txt";
    CHECK(seekline_reader_create(missing.c_str(), 0) == nullptr);

    std::string empty = env.write_file("empty.txt", "");
    REQUIRE(!empty.empty());
    CHECK(seekline_reader_create(empty.c_str(), 0) == nullptr);

    char buffer[64];
    size_t length = 0;
    CHECK(seekline_reader_next_line(nullptr, buffer, sizeof(buffer),
                                    &length) == -1);
    CHECK(seekline_reader_build_index(nullptr) == -1);
    CHECK(seekline_reader_set_chunk_size(nullptr, 10) == -1);
    size_t num_lines = 0;
    CHECK(seekline_reader_get_num_lines(nullptr, &num_lines) == -1);
    uint64_t file_size = 0;
    CHECK(seekline_reader_get_file_size(nullptr, &file_size) == -1);

    // no-ops on a null handle
    seekline_reader_to_bof(nullptr);
    seekline_reader_to_eof(nullptr);
    seekline_reader_destroy(nullptr);

    seekline_set_log_level("info");
}

TEST_CASE("Opaque reader line navigation") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.write_file("example.txt", EXAMPLE_TEXT);
    REQUIRE(!path.empty());

    seekline_reader_handle_t reader = seekline_reader_create(path.c_str(), 4);
    REQUIRE(reader != nullptr);

    char buffer[64];
    size_t length = 0;

    SUBCASE("Forward") {
        CHECK(seekline_reader_next_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "AAAA AAAA");
        CHECK(length == 9);
        CHECK(seekline_reader_next_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "B B BB BBB");
        CHECK(seekline_reader_next_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "CCCC  CCCCC");
        CHECK(seekline_reader_next_line(reader, buffer, sizeof(buffer),
                                        &length) == 0);
        CHECK(length == 0);
    }

    SUBCASE("Backward") {
        seekline_reader_to_eof(reader);
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "CCCC  CCCCC");
        CHECK(seekline_reader_current_line(reader, buffer, sizeof(buffer),
                                           &length) == 1);
        CHECK(std::string(buffer) == "CCCC  CCCCC");
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "AAAA AAAA");
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 0);

        seekline_reader_to_bof(reader);
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 0);
    }

    SUBCASE("Buffer too small") {
        seekline_set_log_level("off");
        char small[4];
        CHECK(seekline_reader_next_line(reader, small, sizeof(small),
                                        &length) == -1);
        CHECK(length == 9);
        // cursor stays on the line, fetch it again with a larger buffer
        CHECK(seekline_reader_current_line(reader, buffer, sizeof(buffer),
                                           &length) == 1);
        CHECK(std::string(buffer) == "AAAA AAAA");
        seekline_set_log_level("info");
    }

    SUBCASE("Index and chunk size") {
        size_t num_lines = 0;
        seekline_set_log_level("off");
        CHECK(seekline_reader_get_num_lines(reader, &num_lines) == -1);
        CHECK(seekline_reader_set_chunk_size(reader, 0) == -1);
        seekline_set_log_level("info");

        CHECK(seekline_reader_set_chunk_size(reader, 1) == 0);
        CHECK(seekline_reader_build_index(reader) == 0);
        CHECK(seekline_reader_get_num_lines(reader, &num_lines) == 0);
        CHECK(num_lines == 3);

        seekline_reader_to_eof(reader);
        CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                        &length) == 1);
        CHECK(std::string(buffer) == "CCCC  CCCCC");
    }

    seekline_reader_destroy(reader);
}

TEST_CASE("Opaque reader random lines") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.write_file("example.txt", EXAMPLE_TEXT);
    REQUIRE(!path.empty());

    seekline_reader_handle_t first =
        seekline_reader_create_with_seed(path.c_str(), 0, 2024);
    seekline_reader_handle_t second =
        seekline_reader_create_with_seed(path.c_str(), 3, 2024);
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);

    char a[64];
    char b[64];
    size_t length = 0;
    for (int i = 0; i < 20; ++i) {
        CHECK(seekline_reader_random_line(first, a, sizeof(a), &length) == 1);
        CHECK(seekline_reader_random_line(second, b, sizeof(b), &length) == 1);
        CHECK(std::string(a) == std::string(b));
    }

    seekline_reader_destroy(first);
    seekline_reader_destroy(second);
}

TEST_CASE("Opaque reader over a gzip file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string txt = env.write_file("example.txt", EXAMPLE_TEXT);
    REQUIRE(!txt.empty());
    std::string gz = env.get_dir() + "/example.txt.gz";
    REQUIRE(compress_file_to_gzip_c(txt.c_str(), gz.c_str()) == 1);

    seekline_reader_handle_t reader = seekline_reader_create(gz.c_str(), 0);
    REQUIRE(reader != nullptr);

    uint64_t file_size = 0;
    CHECK(seekline_reader_get_file_size(reader, &file_size) == 0);
    CHECK(file_size == std::strlen(EXAMPLE_TEXT));

    char buffer[64];
    size_t length = 0;
    seekline_reader_to_eof(reader);
    CHECK(seekline_reader_prev_line(reader, buffer, sizeof(buffer),
                                    &length) == 1);
    CHECK(std::string(buffer) == "CCCC  CCCCC");

    seekline_reader_destroy(reader);
}
