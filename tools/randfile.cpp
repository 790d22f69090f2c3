#include <iostream>

#include "generate_command.hpp"

auto main(int argc, char* argv[]) -> int {
  return randfile::runGenerate(argc, argv, std::cout, std::cerr);
}
