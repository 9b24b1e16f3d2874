#include "claw/venue.hpp"

namespace claw {

namespace {
constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ull;
constexpr uint64_t kFnvPrime  = 0x100000001b3ull;

template <class T>
void mix(uint64_t& h, T v) noexcept {
  auto u = static_cast<uint64_t>(v);
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    h ^= (u >> (8 * i)) & 0xFFu;
    h *= kFnvPrime;
  }
}
} // namespace

VenueId fingerprint(const VenueKey& k) noexcept {
  uint64_t h = kFnvOffset;
  mix(h, k.asset0);
  mix(h, k.asset1);
  mix(h, k.fee);
  mix(h, static_cast<uint32_t>(k.tick_spacing));
  mix(h, k.hooks);
  return h;
}

} // namespace claw
