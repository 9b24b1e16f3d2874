#include "claw/simulator.hpp"
#include "claw/invariants.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace claw {

namespace {
struct TimedEvent {
  Ts ts{};
  uint64_t seq{};
  const Event* ev{};
};
} // namespace

Simulator::Simulator(SimConfig cfg)
  : cfg_(cfg), relay_(cfg.relay) {
  auto admin = std::make_shared<SingleAdmin>(cfg_.admin);
  engine_ = std::make_unique<MatchingEngine>(custody_, cfg_.engine, cfg_.coordinator, admin, cfg_.rules);
  (void)engine_->set_relay(cfg_.admin, cfg_.relay);

  AuthorityConfig acfg{};
  acfg.beneficiary = cfg_.beneficiary;
  acfg.target_domain = cfg_.remote_domain;
  acfg.target_contract = cfg_.engine;
  acfg.max_checks_per_update = cfg_.max_checks_per_update;
  authority_ = std::make_unique<TriggerAuthority>(acfg, relay_, admin);

  venue_ = engine_->venue(cfg_.asset0, cfg_.asset1, cfg_.fee, cfg_.tick_spacing);
  fund_(cfg_.beneficiary);
}

void Simulator::fund_(AccountId who) {
  if (std::find(funded_.begin(), funded_.end(), who) != funded_.end()) return;
  funded_.push_back(who);
  (void)custody_.mint(venue_.asset0, who, cfg_.initial_balance);
  (void)custody_.mint(venue_.asset1, who, cfg_.initial_balance);
}

SimulationResult Simulator::run(const std::vector<Event>& events) {
  SimulationResult out{};

  std::vector<TimedEvent> sorted;
  sorted.reserve(events.size());
  for (uint64_t i = 0; i < events.size(); ++i) {
    const auto& e = events[i];
    Ts ts = 0;
    std::visit([&](const auto& x) { ts = x.ts; }, e);
    sorted.push_back(TimedEvent{ts, i, &e});
  }

  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TimedEvent& a, const TimedEvent& b) {
                     if (a.ts != b.ts) return a.ts < b.ts;
                     return a.seq < b.seq;
                   });

  for (const auto& te : sorted) {
    std::visit([&](const auto& x) {
      using T = std::decay_t<decltype(x)>;

      if constexpr (std::is_same_v<T, PostOrder>) {
        fund_(x.maker);
        PostRequest req{};
        req.venue = venue_;
        req.sells_asset_zero = x.sells_asset_zero;
        req.amount_in = x.amount_in;
        req.min_amount_out = x.min_amount_out;
        req.duration = x.duration;
        req.now = x.ts;
        req.caller = x.maker;
        req.origin_is_direct_caller = !x.via_agent;
        if (engine_->post_order(req).status != OrderStatus::Accepted) out.post_rejects++;
      } else if constexpr (std::is_same_v<T, CancelOrder>) {
        if (engine_->cancel_order(x.id, venue_, x.maker).status != OrderStatus::Accepted) {
          out.cancel_rejects++;
        }
      } else if constexpr (std::is_same_v<T, Swap>) {
        fund_(x.taker);
        SwapRequest req{};
        req.venue = venue_;
        req.taker = x.taker;
        req.taker_wants_asset_zero = x.wants_asset_zero;
        req.amount_specified = x.amount_specified;
        req.now = x.ts;
        auto res = engine_->match_incoming_swap(cfg_.coordinator, req);
        out.evictions += static_cast<uint32_t>(res.evicted.size());
        if (res.matched()) out.fills.push_back(*res.fill);
        else out.unmatched_swaps++;
      } else if constexpr (std::is_same_v<T, ArmTrigger>) {
        auto ack = authority_->arm(cfg_.admin, x.id, x.maker, x.limit_price, x.direction, x.ts);
        if (ack.status != OrderStatus::Accepted) out.arm_rejects++;
      } else if constexpr (std::is_same_v<T, PriceTick>) {
        auto rep = authority_->on_reserve_update(ReserveSample{x.ts, x.reserve0, x.reserve1});
        if (rep) out.authorizations += static_cast<uint32_t>(rep->emitted.size());
        for (const auto& d : relay_.deliver_all(*engine_, x.ts)) {
          if (d.ack.status == OrderStatus::Accepted && d.ack.fill) out.fills.push_back(*d.ack.fill);
          else if (d.ack.reject_reason == RejectReason::NotActive) out.stale_authorizations++;
        }
      }
    }, *te.ev);

    if (cfg_.check_invariants) {
      const auto& l = engine_->ledger();
      if (!escrow_balanced(l) || !index_consistent(l) || !custody_covers_escrow(l, custody_)) {
        out.invariant_violations++;
      }
    }
  }

  out.orders = engine_->ledger().orders();
  return out;
}

} // namespace claw
