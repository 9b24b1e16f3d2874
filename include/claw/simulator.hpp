#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "claw/custody.hpp"
#include "claw/events.hpp"
#include "claw/fill.hpp"
#include "claw/matching_engine.hpp"
#include "claw/relay.hpp"
#include "claw/trigger_authority.hpp"

namespace claw {

struct SimConfig {
  AssetId  asset0{1};
  AssetId  asset1{2};
  uint32_t fee{3000};
  int32_t  tick_spacing{60};

  AccountId engine{0xE0};
  AccountId coordinator{0xC0};
  AccountId relay{0xA0};
  AccountId admin{0xAD};
  AccountId beneficiary{0xBE};
  uint64_t  remote_domain{11155111};

  // Minted in both assets the first time an account appears.
  Amount initial_balance{1'000'000'000};

  RulesConfig rules{};
  std::size_t max_checks_per_update{0};

  // Run the invariant checks after every event.
  bool check_invariants{true};
};

struct SimulationResult {
  std::vector<Fill> fills;
  std::vector<Order> orders;        // final ledger state
  uint32_t post_rejects{0};
  uint32_t cancel_rejects{0};
  uint32_t arm_rejects{0};
  uint32_t unmatched_swaps{0};
  uint32_t evictions{0};
  uint32_t authorizations{0};       // messages emitted by the authority
  uint32_t stale_authorizations{0}; // delivered but order no longer active
  uint32_t invariant_violations{0};
};

class Simulator {
public:
  explicit Simulator(SimConfig cfg = {});

  // Deterministic replay: stable ordering by (ts, insertion order)
  SimulationResult run(const std::vector<Event>& events);

  const MatchingEngine& engine() const noexcept { return *engine_; }
  const TriggerAuthority& authority() const noexcept { return *authority_; }
  const TokenLedger& custody() const noexcept { return custody_; }
  const VenueKey& venue() const noexcept { return venue_; }

private:
  SimConfig cfg_{};
  TokenLedger custody_{};
  InMemoryRelay relay_;
  std::unique_ptr<MatchingEngine> engine_;
  std::unique_ptr<TriggerAuthority> authority_;
  VenueKey venue_{};
  std::vector<AccountId> funded_{};

  void fund_(AccountId who);
};

} // namespace claw
