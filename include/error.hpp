#pragma once
#include <string>

namespace randfile {

enum class ErrorKind {
  InvalidSizeFormat,  // the size expression could not be parsed
  IOFailure,          // existence check, open, write or close of the target failed
};

struct Error {
  ErrorKind kind;
  std::string input;  // offending size string or target path
  std::string message;
};

}  // namespace randfile
