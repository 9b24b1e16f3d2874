#include "claw/live_desk.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace claw {

namespace {

Ts system_seconds() {
  using namespace std::chrono;
  return static_cast<Ts>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

AuthorityConfig authority_config(const DeskConfig& cfg) {
  AuthorityConfig a{};
  a.beneficiary = cfg.beneficiary;
  a.target_domain = cfg.remote_domain;
  a.target_contract = cfg.engine;
  a.max_checks_per_update = cfg.max_checks_per_update;
  return a;
}

} // namespace

LiveDesk::LiveDesk(DeskConfig cfg, Clock clock)
  : cfg_(cfg),
    clock_(clock ? std::move(clock) : Clock(system_seconds)),
    relay_(cfg.relay),
    admin_(std::make_shared<SingleAdmin>(cfg.admin)),
    engine_(custody_, cfg.engine, cfg.coordinator, admin_, cfg.rules),
    authority_(authority_config(cfg), relay_, admin_) {
  (void)engine_.set_relay(cfg_.admin, cfg_.relay);
}

void LiveDesk::register_asset(AssetId asset, std::string symbol) {
  std::lock_guard<std::mutex> lk(mu_);
  symbols_[asset] = std::move(symbol);
}

VenueKey LiveDesk::open_venue(AssetId a, AssetId b, uint32_t fee, int32_t tick_spacing) {
  std::lock_guard<std::mutex> lk(mu_);
  const VenueKey k = engine_.venue(a, b, fee, tick_spacing);
  venues_[fingerprint(k)] = k;
  return k;
}

bool LiveDesk::fund(AccountId who, AssetId asset, Amount amount) {
  std::lock_guard<std::mutex> lk(mu_);
  return custody_.mint(asset, who, amount);
}

PostAck LiveDesk::post(VenueId venue, AccountId maker, bool sells_asset_zero,
                       Amount amount_in, Amount min_amount_out, Ts duration, bool via_agent) {
  std::lock_guard<std::mutex> lk(mu_);

  auto it = venues_.find(venue);
  if (it == venues_.end()) {
    PostAck ack{};
    ack.reject_reason = RejectReason::InvalidVenue;
    return ack;
  }

  PostRequest req{};
  req.venue = it->second;
  req.sells_asset_zero = sells_asset_zero;
  req.amount_in = amount_in;
  req.min_amount_out = min_amount_out;
  req.duration = duration;
  req.now = clock_();
  req.caller = maker;
  req.origin_is_direct_caller = !via_agent;
  return engine_.post_order(req);
}

CancelAck LiveDesk::cancel(VenueId venue, AccountId maker, OrderId id) {
  std::lock_guard<std::mutex> lk(mu_);

  // an unknown venue still goes through the engine so id and owner are
  // checked first; an empty key never matches a stored fingerprint
  auto it = venues_.find(venue);
  const VenueKey key = (it == venues_.end()) ? VenueKey{} : it->second;
  return engine_.cancel_order(id, key, maker);
}

MatchOutcome LiveDesk::swap(VenueId venue, AccountId taker, bool wants_asset_zero,
                            SignedAmount amount_specified) {
  std::lock_guard<std::mutex> lk(mu_);

  auto it = venues_.find(venue);
  if (it == venues_.end()) {
    MatchOutcome out{};
    out.status = OrderStatus::Rejected;
    out.reject_reason = RejectReason::InvalidVenue;
    return out;
  }

  SwapRequest req{};
  req.venue = it->second;
  req.taker = taker;
  req.taker_wants_asset_zero = wants_asset_zero;
  req.amount_specified = amount_specified;
  req.now = clock_();

  auto out = engine_.match_incoming_swap(cfg_.coordinator, req);
  if (out.fill) record_fill_locked_(*out.fill);
  return out;
}

ArmAck LiveDesk::arm(AccountId caller, OrderId id, Price limit_price, Direction direction) {
  std::lock_guard<std::mutex> lk(mu_);

  const Order* o = engine_.ledger().order(id);
  const AccountId maker = o ? o->maker : kNoAccount;
  return authority_.arm(caller, id, maker, limit_price, direction, clock_());
}

PriceUpdateResult LiveDesk::push_price(Price price) {
  std::lock_guard<std::mutex> lk(mu_);

  const Ts ts = clock_();
  PriceUpdateResult out{};
  out.report = authority_.on_price_update(PriceSample{ts, price});
  out.deliveries = relay_.deliver_all(engine_, ts);
  for (const auto& d : out.deliveries) {
    if (d.ack.fill) record_fill_locked_(*d.ack.fill);
  }
  return out;
}

void LiveDesk::record_fill_locked_(const Fill& f) {
  fills_.push_front(f);
  while (fills_.size() > cfg_.max_recent_fills) fills_.pop_back();
}

OrderView LiveDesk::view_locked_(const Order& o, Ts now) const {
  OrderView v{};
  v.order = o;
  auto s = symbols_.find(o.sell_asset);
  auto b = symbols_.find(o.buy_asset);
  v.sell_symbol = (s == symbols_.end()) ? std::to_string(o.sell_asset) : s->second;
  v.buy_symbol = (b == symbols_.end()) ? std::to_string(o.buy_asset) : b->second;
  v.expired = is_expired(o, now);
  return v;
}

std::vector<OrderView> LiveDesk::orders() const {
  std::lock_guard<std::mutex> lk(mu_);
  const Ts now = clock_();
  const auto& all = engine_.ledger().orders();

  // newest first
  std::vector<OrderView> out;
  out.reserve(all.size());
  for (auto it = all.rbegin(); it != all.rend(); ++it) out.push_back(view_locked_(*it, now));
  return out;
}

std::optional<OrderView> LiveDesk::order(OrderId id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const Order* o = engine_.ledger().order(id);
  if (!o) return std::nullopt;
  return view_locked_(*o, clock_());
}

std::vector<OrderView> LiveDesk::venue_orders(VenueId venue) const {
  std::lock_guard<std::mutex> lk(mu_);
  const Ts now = clock_();
  std::vector<OrderView> out;
  for (const auto& o : engine_.ledger().live_orders(venue)) out.push_back(view_locked_(o, now));
  return out;
}

std::vector<Trigger> LiveDesk::triggers() const {
  std::lock_guard<std::mutex> lk(mu_);
  return authority_.triggers();
}

std::vector<Fill> LiveDesk::recent_fills(std::size_t max) const {
  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t n = std::min(max, fills_.size());
  return std::vector<Fill>(fills_.begin(), fills_.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<VenueKey> LiveDesk::venues() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<VenueKey> out;
  out.reserve(venues_.size());
  for (const auto& [id, k] : venues_) out.push_back(k);
  return out;
}

std::optional<Price> LiveDesk::last_price() const {
  std::lock_guard<std::mutex> lk(mu_);
  return authority_.last_price();
}

Amount LiveDesk::balance_of(AssetId asset, AccountId who) const {
  std::lock_guard<std::mutex> lk(mu_);
  return custody_.balance_of(asset, who);
}

Amount LiveDesk::locked(AssetId asset) const {
  std::lock_guard<std::mutex> lk(mu_);
  return engine_.ledger().locked(asset);
}

} // namespace claw
