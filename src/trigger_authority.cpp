#include "claw/trigger_authority.hpp"

#include <algorithm>
#include <utility>

namespace claw {

TriggerAuthority::TriggerAuthority(AuthorityConfig cfg,
                                   MessageSink& sink,
                                   std::shared_ptr<const AccessPolicy> operators)
  : cfg_(cfg), sink_(sink), operators_(std::move(operators)) {}

const Trigger* TriggerAuthority::trigger(TriggerId id) const noexcept {
  if (id == 0 || id > triggers_.size()) return nullptr;
  return &triggers_[id - 1];
}

ArmAck TriggerAuthority::arm(AccountId caller, OrderId order_id, AccountId maker,
                             Price limit_price, Direction direction, Ts now) {
  ArmAck ack{};

  if (!operators_ || !operators_->may_configure(caller)) {
    ack.reject_reason = RejectReason::Unauthorized;
    return ack;
  }
  if (order_id == 0) {
    ack.reject_reason = RejectReason::NotFound;
    return ack;
  }
  if (limit_price <= 0) {
    ack.reject_reason = RejectReason::InvalidAmount;
    return ack;
  }

  Trigger t{};
  t.id = static_cast<TriggerId>(triggers_.size()) + 1;
  t.order_id = order_id;
  t.maker = maker;
  t.limit_price = limit_price;
  t.direction = direction;
  t.armed_at = now;
  triggers_.push_back(t);

  armed_pos_[t.id] = armed_.size();
  armed_.push_back(t.id);

  ack.id = t.id;
  ack.status = OrderStatus::Accepted;
  return ack;
}

void TriggerAuthority::disarm_(TriggerId id) noexcept {
  auto it = armed_pos_.find(id);
  if (it == armed_pos_.end()) return;

  const std::size_t pos = it->second;
  const TriggerId last = armed_.back();
  if (last != id) {
    armed_[pos] = last;
    armed_pos_[last] = pos;
  }
  armed_.pop_back();
  armed_pos_.erase(it);
}

CrossDomainMessage TriggerAuthority::authorization_(const Trigger& t) const {
  CrossDomainMessage m{};
  m.target_domain = cfg_.target_domain;
  m.target_contract = cfg_.target_contract;
  m.gas_budget = cfg_.gas_budget;
  m.payload = encode_trigger_call(TriggerCall{t.order_id, cfg_.beneficiary});
  return m;
}

EvaluationReport TriggerAuthority::on_price_update(const PriceSample& sample) {
  EvaluationReport rep{};
  rep.ts = sample.ts;
  rep.price = sample.price;
  last_price_ = sample.price;

  const std::size_t n = armed_.size();
  if (n == 0) return rep;

  const std::size_t budget = (cfg_.max_checks_per_update == 0)
                                 ? n
                                 : std::min(cfg_.max_checks_per_update, n);

  // Snapshot the batch before firing reshuffles armed_.
  if (cursor_ >= n) cursor_ = 0;
  std::vector<TriggerId> batch;
  batch.reserve(budget);
  for (std::size_t k = 0; k < budget; ++k) batch.push_back(armed_[(cursor_ + k) % n]);
  cursor_ = (cursor_ + budget) % n;

  for (TriggerId id : batch) {
    Trigger& t = triggers_[id - 1];
    ++rep.checked;
    if (!t.active || !condition_met(t, sample.price)) continue;

    // Fired before emission: a duplicate update can never emit again.
    t.active = false;
    t.fired_at = sample.ts;
    t.fired_price = sample.price;
    disarm_(id);

    auto msg = authorization_(t);
    sink_.send(msg);
    rep.fired.push_back(id);
    rep.emitted.push_back(std::move(msg));
  }

  if (cursor_ >= armed_.size()) cursor_ = 0;
  return rep;
}

std::optional<EvaluationReport> TriggerAuthority::on_reserve_update(const ReserveSample& sample) {
  auto px = derive_price(sample);
  if (!px) return std::nullopt;
  return on_price_update(*px);
}

} // namespace claw
