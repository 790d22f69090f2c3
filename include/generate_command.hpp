#pragma once
#include <iosfwd>
#include <string>
#include <string_view>

#include "file_writer.hpp"

namespace randfile {

struct GenerateOptions {
  std::string filename;
  std::string size;
  WriterConfig writer;
};

auto printUsage(std::string_view prog_name, std::ostream& err) -> void;

// Runs one generation end to end: parse the size, write (or skip) the file and report each step
// on `out`. Returns the process exit code.
auto runGenerate(const GenerateOptions& options, std::ostream& out) -> int;

// Entry point used by the executable. Usage problems are reported on `err`, everything else on
// `out`.
auto runGenerate(int argc, char* argv[], std::ostream& out, std::ostream& err) -> int;

}  // namespace randfile
