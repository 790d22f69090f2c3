#include "generate_command.hpp"

#include <cstdlib>
#include <exception>
#include <ostream>
#include <print>

#include "cli_parser.hpp"
#include "size_parser.hpp"

namespace {

constexpr std::string_view SEPARATOR =
    "==================================================";

constexpr size_t POSITIONAL_ARGS = 2;

// Prints "\rProgress: x.x%" per chunk; `printed` records that the line needs terminating
auto consoleProgress(std::ostream& out, bool& printed) -> randfile::ProgressObserver {
  return [&out, &printed](const randfile::Progress& progress) {
    std::print(out, "\rProgress: {:.1f}%", progress.percent());
    out.flush();
    printed = true;
  };
}

}  // namespace

auto randfile::printUsage(std::string_view prog_name, std::ostream& err) -> void {
  std::println(
      err,
      "Usage: {} <filename> <size> [--output_dir <dir>] [--chunk_size <bytes>]\n"
      "  <size> is a byte count or a value suffixed with MB/GB (e.g. 1000, 1MB, 2.5GB)\n"
      "  --output_dir   existing directory receiving the file (default: {})\n"
      "  --chunk_size   bytes written per I/O call (default: {})",
      prog_name,
      DEFAULT_OUTPUT_DIR,
      DEFAULT_CHUNK_SIZE
  );
}

auto randfile::runGenerate(const GenerateOptions& options, std::ostream& out) -> int {
  auto size_bytes = parseSize(options.size);
  if (!size_bytes) {
    std::println(out, "Error: {}", size_bytes.error().message);
    return EXIT_FAILURE;
  }

  bool progress_printed = false;
  auto writer = FileWriter(options.writer, consoleProgress(out, progress_printed));

  std::println(out, "Starting file generation...");
  std::println(out, "{}", SEPARATOR);
  std::println(
      out,
      "Generating {} ({:.2f} GB)...",
      options.filename,
      static_cast<double>(*size_bytes) / static_cast<double>(BYTES_PER_GB)
  );

  auto report = writer.generate(options.filename, *size_bytes);
  if (!report) {
    if (progress_printed) {
      std::println(out, "");
    }
    std::println(out, "Error creating {}: {}", options.filename, report.error().message);
    return EXIT_FAILURE;
  }

  if (report->state == GenerationState::Skipped) {
    std::println(out, "{} already exists, skipping...", options.filename);
  }
  else {
    if (progress_printed) {
      std::println(out, "");
    }
    std::println(
        out, "Completed {} in {:.2f} seconds", options.filename, report->elapsed_seconds
    );
  }

  std::println(out, "Successfully created {}", options.filename);
  std::println(out, "File generation completed!");
  return EXIT_SUCCESS;
}

auto randfile::runGenerate(int argc, char* argv[], std::ostream& out, std::ostream& err) -> int {
  try {
    auto cli_parser = CliParser(argc, argv);
    if (cli_parser.has("help") || cli_parser.positionalCount() < POSITIONAL_ARGS) {
      printUsage(cli_parser.programName(), err);
      return EXIT_FAILURE;
    }

    auto unrecognized = cli_parser.unknownOptions({"output_dir", "chunk_size"});
    for (size_t i = POSITIONAL_ARGS; i < cli_parser.positionalCount(); ++i) {
      unrecognized.push_back(*cli_parser.get<std::string>(i));
    }
    if (!unrecognized.empty()) {
      printUsage(cli_parser.programName(), err);
      std::print(err, "Error: unrecognized arguments:");
      for (const auto& arg : unrecognized) {
        std::print(err, " {}", arg);
      }
      std::println(err, "");
      return EXIT_FAILURE;
    }

    auto options = GenerateOptions{
        .filename = *cli_parser.get<std::string>(0),
        .size = *cli_parser.get<std::string>(1),
        .writer = WriterConfig{
            .output_dir = cli_parser.get<std::string>("output_dir")
                              .value_or(std::string(DEFAULT_OUTPUT_DIR)),
            .chunk_size = cli_parser.get<size_t>("chunk_size").value_or(DEFAULT_CHUNK_SIZE),
        },
    };
    return runGenerate(options, out);
  }
  catch (const std::exception& e) {
    std::println(out, "Error: {}", e.what());
    return EXIT_FAILURE;
  }
}
