// -----------------------------------------------------------------------------
// determinism.cpp: implementation for determinism.hpp
// -----------------------------------------------------------------------------
#include "fedsim/determinism.hpp"

#include <cmath>
#include <cstdio>

namespace fedsim {

static constexpr double TWO_PI = 6.283185307179586476925286766559;

uint64_t derive_node_seed(const std::string& node_id, uint64_t scenario_seed) {
  const std::string key = node_id + "_" + std::to_string(scenario_seed);
  return splitmix64(fnv1a64(key));
}

uint64_t DeterministicRng::next_u64() {
  state_ += 0x9e3779b97f4a7c15ull;           // splitmix64 step
  uint64_t z = state_;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

double DeterministicRng::next_unit() {
  return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);  // 2^-53
}

uint64_t DeterministicRng::next_below(uint64_t bound) {
  if (bound == 0) return 0;
  // rejection sampling keeps the result unbiased
  const uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
  uint64_t r = next_u64();
  while (r >= limit) r = next_u64();
  return r % bound;
}

double DeterministicRng::gaussian(double mean, double stddev) {
  if (have_spare_) {
    have_spare_ = false;
    return mean + stddev * spare_;
  }

  double u1 = next_unit();
  while (u1 <= 0.0) u1 = next_unit();        // log(0) guard
  const double u2 = next_unit();

  const double r     = std::sqrt(-2.0 * std::log(u1));
  const double theta = TWO_PI * u2;

  spare_      = r * std::sin(theta);
  have_spare_ = true;
  return mean + stddev * (r * std::cos(theta));
}

bool DeterministicRng::chance(double p) {
  if (p <= 0.0) return false;
  if (p >= 1.0) return true;
  return next_unit() < p;
}

std::string StreamDigest::hex() const {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h_));
  return std::string(buf);
}

} // namespace fedsim
