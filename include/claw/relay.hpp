#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <vector>

#include "claw/matching_engine.hpp"
#include "claw/types.hpp"

namespace claw {

// ---- payload: triggerOrder(orderId, beneficiary) ----
inline constexpr uint32_t kTriggerOrderSelector = 0x74726967u;
inline constexpr std::size_t kWordSize = 32;
inline constexpr std::size_t kTriggerCallSize = 4 + 2 * kWordSize;

struct TriggerCall {
  OrderId order_id{};
  AccountId beneficiary{};

  bool operator==(const TriggerCall&) const = default;
};

std::vector<uint8_t> encode_trigger_call(const TriggerCall& c);
std::optional<TriggerCall> decode_trigger_call(std::span<const uint8_t> payload) noexcept;

struct CrossDomainMessage {
  uint64_t  target_domain{};
  AccountId target_contract{};
  uint64_t  gas_budget{};
  std::vector<uint8_t> payload{};
};

// Outbound port of the trigger authority. Delivery is the relay's business.
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void send(const CrossDomainMessage& msg) = 0;
};

struct Delivery {
  CrossDomainMessage msg{};
  std::optional<TriggerCall> call{};
  FillAck ack{};
};

// Local stand-in for the relay network. Queues messages and hands them to an
// engine as the bound relay identity; can duplicate and reorder to mimic an
// at-least-once, unordered channel.
class InMemoryRelay final : public MessageSink {
public:
  explicit InMemoryRelay(AccountId identity) noexcept : identity_(identity) {}

  void send(const CrossDomainMessage& msg) override;

  AccountId identity() const noexcept { return identity_; }
  std::size_t pending() const noexcept { return queue_.size(); }
  std::size_t sent() const noexcept { return sent_; }

  void duplicate_pending();
  void reverse_pending();
  void drop_pending() noexcept { queue_.clear(); }

  // Delivers every message addressed to engine.self() and drains the queue.
  std::vector<Delivery> deliver_all(MatchingEngine& engine, Ts now);

private:
  AccountId identity_{};
  std::deque<CrossDomainMessage> queue_{};
  std::size_t sent_{0};
};

} // namespace claw
