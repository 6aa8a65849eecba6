#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace keyflow {

// Source of non-negative 31-bit integers for key prefixes.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Returns a value in [0, 2^31 - 1].
  virtual uint32_t next_non_negative() = 0;
};

class SeededRandomSource final : public RandomSource {
 public:
  explicit SeededRandomSource(uint64_t seed);

  // Seeds once from std::random_device.
  static std::unique_ptr<SeededRandomSource> FromSecureSeed();

  uint32_t next_non_negative() override;

 private:
  std::mt19937_64 engine_;
  std::uniform_int_distribution<uint32_t> dist_;
};

}  // namespace keyflow
