#include "keyflow/random_source.h"

#include <limits>

namespace keyflow {

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : engine_(seed), dist_(0, static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {}

std::unique_ptr<SeededRandomSource> SeededRandomSource::FromSecureSeed() {
  std::random_device device;
  const uint64_t seed = (static_cast<uint64_t>(device()) << 32) | device();
  return std::make_unique<SeededRandomSource>(seed);
}

uint32_t SeededRandomSource::next_non_negative() {
  return dist_(engine_);
}

}  // namespace keyflow
