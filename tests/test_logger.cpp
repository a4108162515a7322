#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <seekline/utils/logger.h>
#include <seekline/utils/timer.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <thread>

using namespace seekline;

TEST_CASE("Logger - Level by name") {
    CHECK(logger::set_log_level("debug") == 0);
    CHECK(logger::get_log_level_string() == "debug");
    CHECK(spdlog::get_level() == spdlog::level::debug);

    CHECK(logger::set_log_level("WARNING") == 0);
    CHECK(logger::get_log_level_string() == "warn");

    CHECK(logger::set_log_level("err") == 0);
    CHECK(logger::get_log_level_string() == "error");

    SUBCASE("Unknown names select info") {
        CHECK(logger::set_log_level("chatty") == 0);
        CHECK(logger::get_log_level_string() == "info");
    }

    SUBCASE("Empty name is rejected") {
        CHECK(logger::set_log_level("") == -1);
        CHECK(logger::get_log_level_string() == "error");
    }

    logger::set_log_level("info");
}

TEST_CASE("Logger - Level by number") {
    CHECK(logger::set_log_level_int(0) == 0);
    CHECK(logger::get_log_level_int() == 0);
    CHECK(logger::get_log_level_string() == "trace");

    CHECK(logger::set_log_level_int(6) == 0);
    CHECK(logger::get_log_level_string() == "off");

    CHECK(logger::set_log_level_int(7) == -1);
    CHECK(logger::set_log_level_int(-1) == -1);
    CHECK(logger::get_log_level_int() == 6);

    logger::set_log_level_int(2);
}

TEST_CASE("Logger - C API") {
    CHECK(seekline_set_log_level(nullptr) == -1);
    CHECK(seekline_set_log_level("critical") == 0);
    CHECK(std::string(seekline_get_log_level_string()) == "critical");
    CHECK(seekline_set_log_level_int(1) == 0);
    CHECK(seekline_get_log_level_int() == 1);
    CHECK(std::string(seekline_get_log_level_string()) == "debug");
    seekline_set_log_level("info");
}

TEST_CASE("Logger - stderr logger becomes the default") {
    logger::use_stderr_logger();
    REQUIRE(spdlog::default_logger() != nullptr);
    CHECK(spdlog::default_logger()->name() == "stderr");
    // installing twice reuses the registered logger
    CHECK_NOTHROW(logger::use_stderr_logger());
}

TEST_CASE("Timer - Measures elapsed time") {
    Timer timer(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    timer.stop();
    double elapsed = timer.elapsed();
    CHECK(elapsed >= 5.0);
    // stopped timers do not advance
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    CHECK(timer.elapsed() == elapsed);

    Timer idle;
    CHECK(idle.elapsed() == 0.0);
    idle.start();
    CHECK(idle.elapsed() >= 0.0);
}
