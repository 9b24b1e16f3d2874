#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "claw/guard.hpp"
#include "claw/price_feed.hpp"
#include "claw/relay.hpp"
#include "claw/rules.hpp"
#include "claw/trigger.hpp"
#include "claw/types.hpp"

namespace claw {

struct AuthorityConfig {
  // Identity whose funds settle trigger fills on the remote engine.
  AccountId beneficiary{};

  // Where authorizations are addressed.
  uint64_t  target_domain{};
  AccountId target_contract{};
  uint64_t  gas_budget{1'000'000};

  // 0 = evaluate every armed trigger per update. N > 0 bounds the work to N
  // triggers and resumes from a cursor on the next update.
  std::size_t max_checks_per_update{0};
};

struct ArmAck {
  TriggerId id{};
  OrderStatus status{OrderStatus::Rejected};
  RejectReason reject_reason{RejectReason::None};
};

struct EvaluationReport {
  Ts ts{};
  Price price{};
  std::size_t checked{0};
  std::vector<TriggerId> fired{};
  std::vector<CrossDomainMessage> emitted{};
};

// Watches a price feed on its own execution domain and emits one
// triggerOrder authorization per trigger whose condition holds.
class TriggerAuthority {
public:
  TriggerAuthority(AuthorityConfig cfg,
                   MessageSink& sink,
                   std::shared_ptr<const AccessPolicy> operators);

  TriggerAuthority(const TriggerAuthority&) = delete;
  TriggerAuthority& operator=(const TriggerAuthority&) = delete;

  // No uniqueness check: several triggers may watch the same order.
  ArmAck arm(AccountId caller, OrderId order_id, AccountId maker,
             Price limit_price, Direction direction, Ts now);

  EvaluationReport on_price_update(const PriceSample& sample);

  // nullopt if the reserves do not yield a price
  std::optional<EvaluationReport> on_reserve_update(const ReserveSample& sample);

  const Trigger* trigger(TriggerId id) const noexcept;
  const std::vector<Trigger>& triggers() const noexcept { return triggers_; }
  std::size_t armed_count() const noexcept { return armed_.size(); }

  const AuthorityConfig& config() const noexcept { return cfg_; }
  std::optional<Price> last_price() const noexcept { return last_price_; }

private:
  AuthorityConfig cfg_{};
  MessageSink& sink_;
  std::shared_ptr<const AccessPolicy> operators_;

  std::vector<Trigger> triggers_;      // arena, id - 1
  std::vector<TriggerId> armed_;       // unordered, swap-pop on fire
  std::unordered_map<TriggerId, std::size_t> armed_pos_;
  std::size_t cursor_{0};
  std::optional<Price> last_price_{};

  void disarm_(TriggerId id) noexcept;
  CrossDomainMessage authorization_(const Trigger& t) const;
};

} // namespace claw
