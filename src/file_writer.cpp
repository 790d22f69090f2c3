#include "file_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <fstream>
#include <ios>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "stop_watch.hpp"

namespace {

// std::fstream does not report why it failed; the underlying C library leaves it in errno
auto lastOsError() -> std::string {
  if (errno == 0) {
    return "unknown I/O error";
  }
  return std::error_code(errno, std::generic_category()).message();
}

}  // namespace

randfile::FileWriter::FileWriter(WriterConfig config, ProgressObserver observer)
    : config_{std::move(config)}, observer_{std::move(observer)} {
  if (config_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  chunk_.resize(config_.chunk_size);
}

auto randfile::FileWriter::targetPath(std::string_view filename) const -> std::filesystem::path {
  // A rooted name still lands inside output_dir: "/tmp/x.bin" -> "<output_dir>/tmp/x.bin"
  return config_.output_dir / std::filesystem::path(filename).relative_path();
}

auto randfile::FileWriter::generate(std::string_view filename, std::int64_t size_bytes)
    -> std::expected<GenerationReport, Error> {
  state_ = GenerationState::NotStarted;
  const auto path = targetPath(filename);

  auto ec = std::error_code{};
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    return fail(path, ec.message());
  }
  if (exists) {
    state_ = GenerationState::Skipped;
    return GenerationReport{GenerationState::Skipped, path};
  }

  state_ = GenerationState::Writing;
  auto watch = StopWatch<std::chrono::duration<double>>();

  errno = 0;
  auto out = std::ofstream(path, std::ios::binary | std::ios::trunc);  // RAII object
  if (!out) {
    return fail(path, std::format("could not open for writing: {}", lastOsError()));
  }

  auto written = writeChunks(out, path, size_bytes);
  if (!written) {
    return std::unexpected(std::move(written.error()));
  }

  errno = 0;
  out.close();
  if (out.fail()) {
    return fail(path, std::format("could not flush to disk: {}", lastOsError()));
  }

  state_ = GenerationState::Completed;
  return GenerationReport{GenerationState::Completed, path, *written, watch.elapsed().count()};
}

auto randfile::FileWriter::writeChunks(
    std::ofstream& out, const std::filesystem::path& path, std::int64_t size_bytes
) -> std::expected<std::int64_t, Error> {
  const bool report_progress = observer_ && size_bytes > config_.progress_threshold;
  const auto chunk_size = static_cast<std::int64_t>(chunk_.size());
  std::int64_t bytes_written = 0;

  while (bytes_written < size_bytes) {
    // The last chunk is cut to land exactly on size_bytes
    const auto to_write = std::min(chunk_size, size_bytes - bytes_written);
    auto chunk = std::span(chunk_).first(static_cast<size_t>(to_write));
    source_.fill(chunk);

    errno = 0;
    if (!out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()))) {
      return fail(
          path, std::format("write failed after {} bytes: {}", bytes_written, lastOsError())
      );
    }
    bytes_written += to_write;

    if (report_progress) {
      observer_(Progress{bytes_written, size_bytes});
    }
  }
  return bytes_written;
}

auto randfile::FileWriter::fail(const std::filesystem::path& path, std::string_view cause)
    -> std::unexpected<Error> {
  state_ = GenerationState::Failed;
  return std::unexpected(
      Error{ErrorKind::IOFailure, path.string(), std::format("{}: {}", path.string(), cause)}
  );
}
