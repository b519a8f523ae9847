#pragma once

#include <cstddef>
#include <cstdint>

namespace gatewatch::util {

// splitmix64 step (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits -> [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

// The one pseudo-random source a campaign session draws from.
//
// Every encounter draw (ship, captain name, access code, manifest, story roll)
// advances the same state, so a sequence is reproducible only for an identical
// seed and an identical call order.
class HashRng {
 public:
  explicit HashRng(std::uint64_t seed) : s_(seed) {}

  std::uint64_t next_u64() {
    s_ = splitmix64(s_);
    return s_;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // true with probability p (clamped to [0,1]).
  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return next_u01() < p;
  }

  // Unbiased index in [0, n). Returns 0 for n <= 1.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return static_cast<std::size_t>(r % bound);
    }
  }

  // Inclusive integer range.
  int range_int(int lo, int hi) {
    if (hi < lo) {
      const int t = lo;
      lo = hi;
      hi = t;
    }
    return lo + static_cast<int>(index(static_cast<std::size_t>(hi - lo) + 1));
  }

  std::uint64_t state() const { return s_; }
  void set_state(std::uint64_t s) { s_ = s; }

 private:
  std::uint64_t s_{0};
};

} // namespace gatewatch::util
