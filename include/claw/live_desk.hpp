#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "claw/custody.hpp"
#include "claw/fill.hpp"
#include "claw/matching_engine.hpp"
#include "claw/relay.hpp"
#include "claw/trigger_authority.hpp"
#include "claw/types.hpp"

namespace claw {

struct DeskConfig {
  AccountId engine{0xE0};
  AccountId coordinator{0xC0};
  AccountId relay{0xA0};
  AccountId admin{0xAD};
  AccountId beneficiary{0xBE};
  uint64_t  remote_domain{11155111};

  RulesConfig rules{};
  std::size_t max_checks_per_update{256};
  std::size_t max_recent_fills{500};
};

// -------- Read models returned to the HTTP layer --------
struct OrderView {
  Order order{};
  std::string sell_symbol{};
  std::string buy_symbol{};
  bool expired{false};
};

struct PriceUpdateResult {
  EvaluationReport report{};
  std::vector<Delivery> deliveries{};
};

// Engine, trigger authority and in-process relay behind one mutex so the
// gateway's HTTP threads and the price feed thread can share them.
class LiveDesk {
public:
  using Clock = std::function<Ts()>;

  explicit LiveDesk(DeskConfig cfg = {}, Clock clock = {});

  LiveDesk(const LiveDesk&) = delete;
  LiveDesk& operator=(const LiveDesk&) = delete;

  // ---- setup ----
  void register_asset(AssetId asset, std::string symbol);
  VenueKey open_venue(AssetId a, AssetId b, uint32_t fee, int32_t tick_spacing);
  bool fund(AccountId who, AssetId asset, Amount amount);

  // ---- manual interaction ----
  PostAck post(VenueId venue, AccountId maker, bool sells_asset_zero,
               Amount amount_in, Amount min_amount_out, Ts duration, bool via_agent);
  CancelAck cancel(VenueId venue, AccountId maker, OrderId id);
  MatchOutcome swap(VenueId venue, AccountId taker, bool wants_asset_zero, SignedAmount amount_specified);
  ArmAck arm(AccountId caller, OrderId id, Price limit_price, Direction direction);

  // Feeds the authority and delivers whatever it emitted.
  PriceUpdateResult push_price(Price price);

  // ---- read-only views ----
  std::vector<OrderView> orders() const;
  std::optional<OrderView> order(OrderId id) const;
  std::vector<OrderView> venue_orders(VenueId venue) const;
  std::vector<Trigger> triggers() const;
  std::vector<Fill> recent_fills(std::size_t max) const;
  std::vector<VenueKey> venues() const;
  std::optional<Price> last_price() const;
  Amount balance_of(AssetId asset, AccountId who) const;
  Amount locked(AssetId asset) const;

  Ts now() const { return clock_(); }
  const DeskConfig& config() const noexcept { return cfg_; }

private:
  DeskConfig cfg_{};
  Clock clock_{};

  mutable std::mutex mu_;
  TokenLedger custody_{};
  InMemoryRelay relay_;
  std::shared_ptr<const AccessPolicy> admin_;
  MatchingEngine engine_;
  TriggerAuthority authority_;

  std::unordered_map<AssetId, std::string> symbols_{};
  std::unordered_map<VenueId, VenueKey> venues_{};
  std::deque<Fill> fills_{};   // newest first

  OrderView view_locked_(const Order& o, Ts now) const;
  void record_fill_locked_(const Fill& f);
};

} // namespace claw
