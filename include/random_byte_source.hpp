#pragma once
#include <random>
#include <span>

namespace randfile {

// Produces unpredictable bytes for chunk payloads. The engine is seeded from std::random_device
// and the seed is never exposed: two runs never produce the same stream on purpose.
class RandomByteSource {
 public:
  RandomByteSource();
  RandomByteSource(const RandomByteSource&) = delete;
  auto operator=(const RandomByteSource&) -> RandomByteSource& = delete;

  auto fill(std::span<char> buffer) -> void;

 private:
  std::mt19937_64 engine_;
};

}  // namespace randfile
