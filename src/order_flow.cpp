#include "claw/order_flow.hpp"

#include <algorithm>
#include <cmath>

namespace claw {

namespace {
constexpr Amount kReserve0 = 1'000'000;
} // namespace

OrderFlowGenerator::OrderFlowGenerator(uint64_t seed, FlowParams p)
  : rng_(seed ^ 0x9E3779B97F4A7C15ULL), p_(p), price_(p.start_price) {}

double OrderFlowGenerator::uniform01() {
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

Amount OrderFlowGenerator::sample_amount() {
  return std::uniform_int_distribution<Amount>(p_.min_amount, std::max(p_.min_amount, p_.max_amount))(rng_);
}

AccountId OrderFlowGenerator::sample_maker() {
  const uint32_t n = std::max<uint32_t>(1, p_.makers);
  return p_.first_maker + std::uniform_int_distribution<uint32_t>(0, n - 1)(rng_);
}

AccountId OrderFlowGenerator::sample_taker() {
  const uint32_t n = std::max<uint32_t>(1, p_.takers);
  return p_.first_taker + std::uniform_int_distribution<uint32_t>(0, n - 1)(rng_);
}

std::optional<OrderId> OrderFlowGenerator::sample_posted_id() {
  if (posted_ == 0) return std::nullopt;
  return std::uniform_int_distribution<OrderId>(1, posted_)(rng_);
}

std::vector<Event> OrderFlowGenerator::generate(Ts t0, std::size_t n) {
  std::vector<Event> out;
  out.reserve(n);

  const double w_total = p_.w_post + p_.w_swap + p_.w_cancel + p_.w_arm + p_.w_tick;
  if (w_total <= 0.0) return out;

  std::exponential_distribution<double> gap(1.0 / std::max(1e-9, p_.mean_gap_s));
  double t = static_cast<double>(t0);

  for (std::size_t k = 0; k < n; ++k) {
    t += gap(rng_);
    const Ts ts = static_cast<Ts>(t);
    const double u = uniform01() * w_total;

    if (u < p_.w_post) {
      // quote around the reference price with a little edge either way
      const bool sells0 = uniform01() < 0.5;
      const Amount amt = sample_amount();
      const double edge = 0.98 + 0.04 * uniform01();
      const double px = static_cast<double>(price_) * edge;
      const Amount min_out = sells0
          ? static_cast<Amount>(std::llround(static_cast<double>(amt) * px))
          : std::max<Amount>(1, static_cast<Amount>(std::llround(static_cast<double>(amt) / px)));
      const Ts dur = std::uniform_int_distribution<Ts>(p_.min_duration, std::max(p_.min_duration, p_.max_duration))(rng_);
      out.push_back(PostOrder{ts, sample_maker(), sells0, amt, min_out, dur, uniform01() < p_.prob_agent});
      ++posted_;
    } else if (u < p_.w_post + p_.w_swap) {
      const bool wants0 = uniform01() < 0.5;
      const Amount base = sample_amount();
      // offer asset1 when buying asset0, sized off the reference price
      const Amount offered = wants0 ? base * static_cast<Amount>(std::max<int64_t>(1, price_)) : base;
      out.push_back(Swap{ts, sample_taker(), wants0, -static_cast<SignedAmount>(offered)});
    } else if (u < p_.w_post + p_.w_swap + p_.w_cancel) {
      if (auto id = sample_posted_id()) {
        // maker guessed; wrong guesses are rejected as Unauthorized
        out.push_back(CancelOrder{ts, sample_maker(), *id});
      }
    } else if (u < p_.w_post + p_.w_swap + p_.w_cancel + p_.w_arm) {
      if (auto id = sample_posted_id()) {
        const bool lower = uniform01() < 0.5;
        const int64_t off = std::max<int64_t>(1, price_ / 100);
        const int64_t limit = lower ? price_ - off : price_ + off;
        out.push_back(ArmTrigger{ts, *id, sample_maker(), static_cast<Price>(limit) * kPriceScale,
                                 lower ? Direction::Lower : Direction::Upper});
      }
    } else {
      const double step = (uniform01() * 2.0 - 1.0) * static_cast<double>(p_.walk_bps) / 10'000.0;
      price_ = std::max<int64_t>(1, static_cast<int64_t>(std::llround(static_cast<double>(price_) * (1.0 + step))));
      out.push_back(PriceTick{ts, kReserve0, kReserve0 * static_cast<Amount>(price_)});
    }
  }

  return out;
}

} // namespace claw
