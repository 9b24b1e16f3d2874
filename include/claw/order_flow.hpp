#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "claw/events.hpp"
#include "claw/types.hpp"

namespace claw {

struct FlowParams {
  // relative event weights
  double w_post{40.0};
  double w_swap{30.0};
  double w_cancel{8.0};
  double w_arm{7.0};
  double w_tick{15.0};

  // mean seconds between events
  double mean_gap_s{2.0};

  uint32_t makers{8};
  uint32_t takers{4};
  AccountId first_maker{1000};
  AccountId first_taker{2000};

  Amount min_amount{10};
  Amount max_amount{500};

  // Reference price in whole units of asset1 per asset0 and its per-tick
  // random walk (basis points).
  int64_t start_price{3000};
  int32_t walk_bps{40};

  Ts min_duration{60};
  Ts max_duration{3600};

  double prob_agent{0.5};
};

class OrderFlowGenerator {
public:
  OrderFlowGenerator(uint64_t seed, FlowParams p);

  // Generate n events starting at t0.
  std::vector<Event> generate(Ts t0, std::size_t n);

private:
  std::mt19937_64 rng_;
  FlowParams p_;
  OrderId posted_{0};     // ids handed out if every post is accepted
  int64_t price_{0};

  double uniform01();
  Amount sample_amount();
  AccountId sample_maker();
  AccountId sample_taker();

  // (best effort) a previously posted id; the engine may reject it
  std::optional<OrderId> sample_posted_id();
};

} // namespace claw
