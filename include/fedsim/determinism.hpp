#pragma once
/**
 * @file determinism.hpp
 * @brief Stable hashing, seed derivation and the seeded PRNG every deterministic node uses.
 *
 * @details
 * A deterministic node may only vary with (a) its seeded PRNG, (b) its virtual clock and
 * (c) the events the coordinator delivers. This header covers (a):
 *
 * - `fnv1a64()` is a fixed, documented 64-bit FNV-1a hash. It never depends on process
 *   state, pointer values or the standard library's `std::hash`, which is allowed to differ
 *   between builds and runs.
 * - `derive_node_seed(node_id, scenario_seed)` hashes the text `"<node_id>_<seed>"` with
 *   FNV-1a and finalizes it with splitmix64, so nearby inputs land far apart.
 * - `DeterministicRng` is a splitmix64 stream. Its outputs are fixed for a given seed on
 *   every platform. `gaussian()` goes through libm (`log`, `sqrt`, `cos`), so bit-exact
 *   agreement across different libm builds is not promised; runs on one machine are.
 * - `StreamDigest` folds an encoded event stream into one FNV-1a value so two runs can be
 *   compared without keeping both streams around.
 *
 * @code
 *   fedsim::DeterministicRng rng(fedsim::derive_node_seed("sensor1", 42));
 *   double t = rng.gaussian(20.0, 2.0);
 * @endcode
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace fedsim {

constexpr uint64_t FNV1A64_OFFSET = 1469598103934665603ull;
constexpr uint64_t FNV1A64_PRIME  = 1099511628211ull;

/// 64-bit FNV-1a over raw bytes, continuing from `h`.
inline uint64_t fnv1a64(const void* data, std::size_t len, uint64_t h = FNV1A64_OFFSET) {
  const auto* p = static_cast<const unsigned char*>(data);
  for (std::size_t i = 0; i < len; ++i) {
    h ^= static_cast<uint64_t>(p[i]);
    h *= FNV1A64_PRIME;
  }
  return h;
}

inline uint64_t fnv1a64(std::string_view s, uint64_t h = FNV1A64_OFFSET) {
  return fnv1a64(s.data(), s.size(), h);
}

/// splitmix64 finalizer (bijective 64-bit mix).
inline uint64_t splitmix64(uint64_t x) {
  x += 0x9e3779b97f4a7c15ull;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return x ^ (x >> 31);
}

/// Per-node PRNG seed from (node_id, scenario_seed). Stable across processes and builds.
uint64_t derive_node_seed(const std::string& node_id, uint64_t scenario_seed);

class DeterministicRng {
public:
  explicit DeterministicRng(uint64_t seed = 0) : state_(seed) {}

  void reseed(uint64_t seed) { state_ = seed; have_spare_ = false; }

  uint64_t next_u64();

  /// Uniform in [0, 1) with 53 bits of precision.
  double next_unit();

  /// Uniform integer in [0, bound). Returns 0 when bound is 0.
  uint64_t next_below(uint64_t bound);

  /// Normal variate (Box-Muller; the second value of each pair is cached).
  double gaussian(double mean, double stddev);

  /// True with probability `p` (clamped to [0, 1]).
  bool chance(double p);

private:
  uint64_t state_;
  bool     have_spare_ = false;
  double   spare_      = 0.0;
};

/// Running FNV-1a digest over a byte stream, plus how many records were folded in.
class StreamDigest {
public:
  void add(std::string_view record) {
    h_ = fnv1a64(record, h_);
    h_ = fnv1a64("\n", 1, h_);       // record separator so "ab","c" != "a","bc"
    ++count_;
  }

  uint64_t value() const { return h_; }
  uint64_t count() const { return count_; }
  std::string hex() const;

  void reset() { h_ = FNV1A64_OFFSET; count_ = 0; }

private:
  uint64_t h_     = FNV1A64_OFFSET;
  uint64_t count_ = 0;
};

} // namespace fedsim
