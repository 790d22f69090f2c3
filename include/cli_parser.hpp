#pragma once
#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace randfile {

// Splits argv into positional arguments and `--name [value]` options. A value that fails to
// convert to the requested type raises std::runtime_error naming the offending argument.
class CliParser {
 public:
  CliParser(int argc, char* argv[]) : program_name_(*argv) {
    parseArguments(std::span(argv + 1, argc - 1));
  }

  auto programName() const -> std::string_view {
    return program_name_;
  }

  auto has(const std::string& name) const -> bool {
    return options_.contains(name);
  }

  // Options present on the command line that are not in `known`, as "--name"
  auto unknownOptions(std::initializer_list<std::string_view> known) const
      -> std::vector<std::string> {
    auto unknown = std::vector<std::string>{};
    for (const auto& [name, value] : options_) {
      if (std::ranges::find(known, std::string_view(name)) == known.end()) {
        unknown.push_back("--" + name);
      }
    }
    std::ranges::sort(unknown);
    return unknown;
  }

  auto positionalCount() const -> size_t {
    return positional_args_.size();
  }

  template <typename T>
  auto get(const std::string& name) const -> std::optional<T> {
    auto it = options_.find(name);
    if (it == options_.end()) {
      return std::nullopt;
    }

    if (!it->second.has_value()) {
      throw std::runtime_error("Option '--" + name + "' requires a value.");
    }
    return std::optional<T>(tryParse<T>(name, *it->second));
  }

  template <typename T>
  auto get(size_t index) const -> std::optional<T> {
    if (index >= positional_args_.size()) {
      return std::nullopt;
    }
    return std::optional<T>(tryParse<T>(std::to_string(index), positional_args_[index]));
  }

 private:
  std::string_view program_name_;
  std::unordered_map<std::string, std::optional<std::string_view>> options_;
  std::vector<std::string_view> positional_args_;

  auto parseArguments(std::span<char*> args) -> void {
    for (size_t i = 0; i < args.size(); ++i) {
      std::string_view arg = args[i];
      if (arg.starts_with("--")) {
        auto option_name = std::string(arg.substr(2));
        if (i + 1 < args.size() && !std::string_view(args[i + 1]).starts_with("--")) {
          options_[option_name] = std::string_view(args[++i]);
        }
        else {
          options_[option_name] = std::nullopt;  // A flag
        }
      }
      else {
        positional_args_.emplace_back(arg);
      }
    }
  }

  template <typename T>
  auto tryParse(const std::string& name, std::string_view value_str) const -> T {
    T value{};
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
      auto result = std::from_chars(value_str.data(), value_str.data() + value_str.size(), value);
      if (result.ec != std::errc() || result.ptr != value_str.data() + value_str.size()) {
        throw std::runtime_error(
            "Failed to parse integer value '" + std::string(value_str) + "' for '" + name + "'."
        );
      }
    }
    else if constexpr (std::is_same_v<T, std::string>) {
      return std::string(value_str);
    }
    return value;
  }
};

}  // namespace randfile
