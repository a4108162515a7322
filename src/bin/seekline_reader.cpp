#include <seekline/config.h>
#include <seekline/reader/error.h>
#include <seekline/reader/reader.h>
#include <seekline/reader/reader_factory.h>
#include <seekline/utils/filesystem.h>
#include <seekline/utils/logger.h>
#include <seekline/utils/timer.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace {

struct RunStats {
  std::size_t lines = 0;
  std::size_t bytes = 0;
};

void emit(const std::string &line, bool print, RunStats &stats) {
  stats.lines++;
  stats.bytes += line.size();
  if (print) {
    fwrite(line.data(), 1, line.size(), stdout);
    fputc('\n', stdout);
  }
}

RunStats run_forward(seekline::Reader &reader, std::size_t count,
                     bool print) {
  RunStats stats;
  reader.to_bof();
  while (count == 0 || stats.lines < count) {
    auto line = reader.next_line();
    if (!line) break;
    emit(*line, print, stats);
  }
  return stats;
}

RunStats run_backward(seekline::Reader &reader, std::size_t count,
                      bool print) {
  RunStats stats;
  reader.to_eof();
  while (count == 0 || stats.lines < count) {
    auto line = reader.prev_line();
    if (!line) break;
    emit(*line, print, stats);
  }
  return stats;
}

RunStats run_random(seekline::Reader &reader, std::size_t count,
                    bool print) {
  RunStats stats;
  if (count == 0) count = 1;
  for (std::size_t i = 0; i < count; i++) {
    auto line = reader.random_line();
    if (!line) break;
    emit(*line, print, stats);
  }
  return stats;
}

// Line numbers are 0-based; lines past the end produce no output
RunStats run_line(seekline::Reader &reader, std::size_t line_number,
                  bool print) {
  RunStats stats;
  if (reader.is_indexed() && line_number >= reader.get_num_lines()) {
    spdlog::warn("Line {} is past the last line ({} lines)", line_number,
                 reader.get_num_lines());
    return stats;
  }
  reader.to_bof();
  std::optional<std::string> line;
  for (std::size_t i = 0; i <= line_number; i++) {
    line = reader.next_line();
    if (!line) {
      spdlog::warn("Line {} is past the last line ({} lines)", line_number,
                   i);
      return stats;
    }
  }
  emit(*line, print, stats);
  return stats;
}

}  // namespace

int main(int argc, char **argv) {
  argparse::ArgumentParser program("seekline_reader",
                                   SEEKLINE_PACKAGE_VERSION);
  program.add_description(
      "Read lines of a plain or gzipped text file forward, backward, at "
      "random or by line number");
  program.add_epilog(
      "Without --index, random mode picks a random byte and prints the line "
      "containing it, so longer lines are picked more often. Use --index for "
      "uniform line sampling.");
  program.add_argument("file").help("File to read").required();
  program.add_argument("-m", "--mode")
      .help("Set the reading mode (forward, backward, random, line)")
      .default_value<std::string>("forward")
      .choices("forward", "backward", "random", "line");
  program.add_argument("-n", "--count")
      .help("Number of lines to read, 0 reads all lines (random: 1 line)")
      .default_value<std::size_t>(0)
      .scan<'d', std::size_t>();
  program.add_argument("-l", "--line")
      .help("0-based line number for line mode")
      .default_value<std::size_t>(0)
      .scan<'d', std::size_t>();
  program.add_argument("-i", "--index")
      .help("Build the in-memory line index before reading")
      .flag();
  program.add_argument("-c", "--chunk-size")
      .help("Scan chunk size in bytes (default: 200)")
      .default_value<std::size_t>(
          static_cast<std::size_t>(constants::scanner::DEFAULT_CHUNK_SIZE))
      .scan<'d', std::size_t>();
  program.add_argument("-s", "--seed")
      .help("Seed for random mode, random_device when absent")
      .scan<'d', std::uint64_t>();
  program.add_argument("--bench")
      .help("Time the operation instead of printing lines")
      .flag();
  program.add_argument("--log-level")
      .help(
          "Set logging level (trace, debug, info, warn, error, critical, off)")
      .default_value<std::string>("info");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &err) {
    spdlog::error("Error occurred: {}", err.what());
    std::cerr << program;
    return 1;
  }

  std::string path = program.get<std::string>("file");
  std::string mode = program.get<std::string>("--mode");
  std::size_t count = program.get<std::size_t>("--count");
  std::size_t line_number = program.get<std::size_t>("--line");
  bool use_index = program.get<bool>("--index");
  std::size_t chunk_size = program.get<std::size_t>("--chunk-size");
  std::optional<std::uint64_t> seed = program.present<std::uint64_t>("--seed");
  bool bench = program.get<bool>("--bench");
  std::string log_level_str = program.get<std::string>("--log-level");

  // stderr-based logger to ensure logs don't interfere with data output
  seekline::logger::use_stderr_logger();
  seekline::logger::set_log_level(log_level_str);

  spdlog::debug("Log level set to: {}", log_level_str);
  spdlog::debug("Processing file: {}", path);
  spdlog::debug("Mode: {}", mode);
  spdlog::debug("Chunk size: {} bytes", chunk_size);
  spdlog::debug("Use index: {}", use_index);

  if (chunk_size == 0) {
    spdlog::error("Chunk size must be positive (greater than 0 bytes)");
    return 1;
  }

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      spdlog::error("File '{}' cannot be accessed: {}", path, ec.message());
    } else {
      spdlog::error("File '{}' does not exist", path);
    }
    return 1;
  }

  try {
    std::unique_ptr<seekline::RandomSource> random;
    if (seed) {
      random = std::make_unique<seekline::Mt19937RandomSource>(*seed);
    }
    auto reader =
        seekline::ReaderFactory::create(path, chunk_size, std::move(random));
    spdlog::debug("Opened {} ({} bytes)", path, reader->get_file_size());

    if (use_index) {
      seekline::Timer index_timer(true);
      reader->build_index();
      index_timer.stop();
      if (bench) {
        spdlog::info("index: {} lines in {:.3f} ms", reader->get_num_lines(),
                     index_timer.elapsed());
      }
    }

    bool print = !bench;
    seekline::Timer timer(true);
    RunStats stats;
    if (mode == "forward") {
      stats = run_forward(*reader, count, print);
    } else if (mode == "backward") {
      stats = run_backward(*reader, count, print);
    } else if (mode == "random") {
      stats = run_random(*reader, count, print);
    } else {
      stats = run_line(*reader, line_number, print);
    }
    timer.stop();
    fflush(stdout);

    if (bench) {
      double ms = timer.elapsed();
      spdlog::info("{}{}: {} lines, {} bytes in {:.3f} ms ({:.1f} lines/s)",
                   mode, use_index ? " (indexed)" : "", stats.lines,
                   stats.bytes, ms,
                   ms > 0 ? stats.lines / (ms / 1000.0) : 0.0);
    } else {
      spdlog::debug("Read {} lines", stats.lines);
    }
  } catch (const seekline::ReaderError &e) {
    spdlog::error("Reader error: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("Error occurred: {}", e.what());
    return 1;
  }

  return 0;
}
