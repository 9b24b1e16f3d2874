#include "claw/relay.hpp"

#include <algorithm>

namespace claw {

namespace {

void put_word(std::vector<uint8_t>& out, uint64_t v) {
  for (std::size_t i = 0; i < kWordSize - 8; ++i) out.push_back(0);
  for (int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(v >> shift));
}

std::optional<uint64_t> get_word(std::span<const uint8_t> w) noexcept {
  for (std::size_t i = 0; i < kWordSize - 8; ++i) {
    if (w[i] != 0) return std::nullopt;
  }
  uint64_t v = 0;
  for (std::size_t i = kWordSize - 8; i < kWordSize; ++i) v = (v << 8) | w[i];
  return v;
}

} // namespace

std::vector<uint8_t> encode_trigger_call(const TriggerCall& c) {
  std::vector<uint8_t> out;
  out.reserve(kTriggerCallSize);
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(kTriggerOrderSelector >> shift));
  }
  put_word(out, c.order_id);
  put_word(out, c.beneficiary);
  return out;
}

std::optional<TriggerCall> decode_trigger_call(std::span<const uint8_t> payload) noexcept {
  if (payload.size() != kTriggerCallSize) return std::nullopt;

  uint32_t sel = 0;
  for (std::size_t i = 0; i < 4; ++i) sel = (sel << 8) | payload[i];
  if (sel != kTriggerOrderSelector) return std::nullopt;

  const auto id = get_word(payload.subspan(4, kWordSize));
  const auto who = get_word(payload.subspan(4 + kWordSize, kWordSize));
  if (!id || !who) return std::nullopt;

  return TriggerCall{*id, *who};
}

void InMemoryRelay::send(const CrossDomainMessage& msg) {
  queue_.push_back(msg);
  ++sent_;
}

void InMemoryRelay::duplicate_pending() {
  const std::size_t n = queue_.size();
  for (std::size_t i = 0; i < n; ++i) queue_.push_back(queue_[i]);
}

void InMemoryRelay::reverse_pending() {
  std::reverse(queue_.begin(), queue_.end());
}

std::vector<Delivery> InMemoryRelay::deliver_all(MatchingEngine& engine, Ts now) {
  std::vector<Delivery> out;
  out.reserve(queue_.size());

  while (!queue_.empty()) {
    Delivery d{};
    d.msg = std::move(queue_.front());
    queue_.pop_front();

    if (d.msg.target_contract != engine.self()) continue;

    // undecodable payloads are reported with an empty call and a default ack
    d.call = decode_trigger_call(d.msg.payload);
    if (d.call) d.ack = engine.trigger_order(identity_, d.call->order_id, d.call->beneficiary, now);
    out.push_back(std::move(d));
  }
  return out;
}

} // namespace claw
