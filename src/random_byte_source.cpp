#include "random_byte_source.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>

namespace {

auto seedFromDevice() -> std::seed_seq {
  auto device = std::random_device{};
  auto entropy = std::array<std::random_device::result_type, std::mt19937_64::state_size>{};
  std::ranges::generate(entropy, std::ref(device));
  return std::seed_seq(entropy.begin(), entropy.end());
}

}  // namespace

randfile::RandomByteSource::RandomByteSource() {
  auto seq = seedFromDevice();
  engine_.seed(seq);
}

auto randfile::RandomByteSource::fill(std::span<char> buffer) -> void {
  // One 64-bit draw covers eight bytes; the tail takes the low bytes of a last draw
  constexpr auto word_size = sizeof(std::uint64_t);
  const auto full_words = buffer.size() / word_size;

  for (size_t i = 0; i < full_words; ++i) {
    const std::uint64_t word = engine_();
    std::memcpy(buffer.data() + i * word_size, &word, word_size);
  }

  const auto tail = buffer.size() % word_size;
  if (tail > 0) {
    const std::uint64_t word = engine_();
    std::memcpy(buffer.data() + full_words * word_size, &word, tail);
  }
}
