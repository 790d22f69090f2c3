#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "random_byte_source.hpp"

namespace randfile {

constexpr size_t DEFAULT_CHUNK_SIZE = 1024UL * 1024UL;
constexpr std::int64_t DEFAULT_PROGRESS_THRESHOLD = 1024LL * 1024LL * 1024LL;
constexpr std::string_view DEFAULT_OUTPUT_DIR = "test_files";

struct WriterConfig {
  std::filesystem::path output_dir{DEFAULT_OUTPUT_DIR};
  size_t chunk_size{DEFAULT_CHUNK_SIZE};
  // Progress is reported only for requests strictly larger than this many bytes
  std::int64_t progress_threshold{DEFAULT_PROGRESS_THRESHOLD};
};

struct Progress {
  std::int64_t bytes_written;
  std::int64_t total_bytes;

  auto percent() const -> double {
    return total_bytes > 0 ? static_cast<double>(bytes_written) / total_bytes * 100.0 : 100.0;
  }
};

using ProgressObserver = std::function<void(const Progress&)>;

// NotStarted -> Skipped | Writing -> Completed | Failed
enum class GenerationState { NotStarted, Writing, Skipped, Completed, Failed };

struct GenerationReport {
  GenerationState state;
  std::filesystem::path path;
  std::int64_t bytes_written{0};
  double elapsed_seconds{0.0};
};

/*
 * Creates `<output_dir>/<filename>` filled with `size_bytes` random bytes, written in chunks of
 * `chunk_size`. An existing target is never touched: the call reports Skipped instead. The output
 * directory must already exist. On failure a partially written file may remain on disk.
 */
class FileWriter {
 public:
  explicit FileWriter(WriterConfig config, ProgressObserver observer = {});
  FileWriter(const FileWriter&) = delete;
  auto operator=(const FileWriter&) -> FileWriter& = delete;

  auto generate(std::string_view filename, std::int64_t size_bytes)
      -> std::expected<GenerationReport, Error>;

  auto targetPath(std::string_view filename) const -> std::filesystem::path;
  auto state() const -> GenerationState {
    return state_;
  }

 private:
  auto writeChunks(std::ofstream& out, const std::filesystem::path& path, std::int64_t size_bytes)
      -> std::expected<std::int64_t, Error>;
  auto fail(const std::filesystem::path& path, std::string_view cause) -> std::unexpected<Error>;

  WriterConfig config_;
  ProgressObserver observer_;
  RandomByteSource source_;
  std::vector<char> chunk_;
  GenerationState state_{GenerationState::NotStarted};
};

}  // namespace randfile
