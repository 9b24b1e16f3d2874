#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "httplib.h"

#include "claw/live_desk.hpp"
#include "claw/rules.hpp"
#include "claw/types.hpp"

// ---------------- Tunables ----------------
namespace {

constexpr claw::AssetId kWeth = 1;
constexpr claw::AssetId kUsdc = 2;
constexpr uint32_t kFee = 3000;
constexpr int32_t kTickSpacing = 60;

// Demo accounts are funded on first use
constexpr claw::Amount kDemoFunding = 1'000'000'000'000ull;

// Synthetic feed: reference price drifts every ~2-4 seconds
constexpr int kFeedMinMs = 2000;
constexpr int kFeedMaxMs = 4000;
constexpr int64_t kFeedStartPrice = 3000;
constexpr int kFeedStepBps = 25;

constexpr std::size_t kMaxFills = 250;

} // namespace

// ---------------- Helpers ----------------
static long long get_ll(const httplib::Request& req, const char* key, long long def = 0) {
  if (!req.has_param(key)) return def;
  try { return std::stoll(req.get_param_value(key)); }
  catch (const std::exception&) { return def; }
}

static unsigned long long get_ull(const httplib::Request& req, const char* key, unsigned long long def = 0) {
  if (!req.has_param(key)) return def;
  try { return std::stoull(req.get_param_value(key)); }
  catch (const std::exception&) { return def; }
}

static bool get_bool(const httplib::Request& req, const char* key, bool def = false) {
  if (!req.has_param(key)) return def;
  const auto v = req.get_param_value(key);
  return v == "1" || v == "true";
}

static std::string json_bool(bool v) { return v ? "true" : "false"; }

static std::string json_str(std::string_view v) { return "\"" + std::string(v) + "\""; }

static void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

static void reply(httplib::Response& res, const std::string& body) {
  set_no_cache(res);
  res.set_content(body, "application/json");
}

static std::string ack_json(bool accepted, claw::RejectReason r, uint64_t id) {
  std::ostringstream oss;
  oss << "{"
      << "\"accepted\":" << json_bool(accepted) << ","
      << "\"reason\":" << json_str(claw::to_string(r)) << ","
      << "\"id\":" << id
      << "}";
  return oss.str();
}

// Amounts go out as strings: dashboards parse them as big integers.
static void order_json(std::ostringstream& oss, const claw::OrderView& v) {
  const auto& o = v.order;
  oss << "{"
      << "\"orderId\":" << o.id << ","
      << "\"maker\":" << json_str(std::to_string(o.maker)) << ","
      << "\"sellToken0\":" << json_bool(o.sells_asset_zero) << ","
      << "\"sellToken\":" << json_str(v.sell_symbol) << ","
      << "\"buyToken\":" << json_str(v.buy_symbol) << ","
      << "\"amountIn\":" << json_str(std::to_string(o.amount_in)) << ","
      << "\"minAmountOut\":" << json_str(std::to_string(o.min_amount_out)) << ","
      << "\"expiry\":" << o.expiry << ","
      << "\"active\":" << json_bool(o.active) << ","
      << "\"isExpired\":" << json_bool(v.expired) << ","
      << "\"state\":" << json_str(claw::to_string(o.state)) << ","
      << "\"origin\":" << json_str(claw::to_string(o.origin))
      << "}";
}

static std::string orders_json(const std::vector<claw::OrderView>& vs) {
  std::ostringstream oss;
  oss << "{\"orders\":[";
  for (std::size_t i = 0; i < vs.size(); ++i) {
    if (i) oss << ",";
    order_json(oss, vs[i]);
  }
  oss << "]}";
  return oss.str();
}

// ---------------- Synthetic price feed ----------------
struct FeedThread {
  std::shared_ptr<std::atomic<bool>> running;
  std::thread worker;
};

static FeedThread start_price_feed(claw::LiveDesk& desk, uint64_t seed) {
  FeedThread ft{};
  ft.running = std::make_shared<std::atomic<bool>>(true);
  auto run = ft.running;

  ft.worker = std::thread([run, &desk, seed]() {
    std::mt19937_64 rng(static_cast<std::mt19937_64::result_type>(seed) ^ 0xA5A5A5A5A5A5A5A5ull);
    std::uniform_int_distribution<int> sleep_ms(kFeedMinMs, kFeedMaxMs);
    std::uniform_int_distribution<int> dir(-1, 1);

    claw::Price px = kFeedStartPrice * claw::kPriceScale;
    while (run->load(std::memory_order_relaxed)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms(rng)));

      px += static_cast<claw::Price>(dir(rng)) * (px / 10'000) * kFeedStepBps;
      if (px < claw::kPriceScale) px = claw::kPriceScale;

      auto r = desk.push_price(px);
      for (const auto& d : r.deliveries) {
        if (!d.call) continue;
        std::cout << "trigger order=" << d.call->order_id
                  << " result=" << (d.ack.fill ? "filled" : claw::to_string(d.ack.reject_reason))
                  << "\n";
      }
    }
  });

  return ft;
}

static void stop_price_feed(FeedThread& ft) {
  if (ft.running) ft.running->store(false, std::memory_order_relaxed);
  if (ft.worker.joinable()) ft.worker.join();
}

// ---------------- main ----------------
int main(int argc, char** argv) {
  // args: [port] [seed]
  int port = 8080;
  uint64_t seed = 1;

  if (argc > 1) port = std::atoi(argv[1]);
  if (argc > 2) seed = static_cast<uint64_t>(std::strtoull(argv[2], nullptr, 10));

  claw::DeskConfig dcfg{};
  claw::LiveDesk desk{dcfg};

  desk.register_asset(kWeth, "WETH");
  desk.register_asset(kUsdc, "USDC");
  const claw::VenueKey venue = desk.open_venue(kWeth, kUsdc, kFee, kTickSpacing);
  const claw::VenueId venue_id = claw::fingerprint(venue);

  (void)desk.fund(dcfg.beneficiary, kWeth, kDemoFunding);
  (void)desk.fund(dcfg.beneficiary, kUsdc, kDemoFunding);

  std::vector<claw::AccountId> funded{dcfg.beneficiary};
  std::mutex funded_mu;
  auto ensure_funded = [&](claw::AccountId who) {
    std::lock_guard<std::mutex> lk(funded_mu);
    if (std::find(funded.begin(), funded.end(), who) != funded.end()) return;
    funded.push_back(who);
    (void)desk.fund(who, kWeth, kDemoFunding);
    (void)desk.fund(who, kUsdc, kDemoFunding);
  };

  FeedThread feed = start_price_feed(desk, seed);

  httplib::Server svr;

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  // ---- read surface ----
  svr.Get("/api/orders", [&](const httplib::Request&, httplib::Response& res) {
    reply(res, orders_json(desk.orders()));
  });

  svr.Get("/api/order", [&](const httplib::Request& req, httplib::Response& res) {
    const auto v = desk.order(static_cast<claw::OrderId>(get_ull(req, "id", 0)));
    if (!v) {
      res.status = 404;
      reply(res, "{\"error\":\"NotFound\"}");
      return;
    }
    std::ostringstream oss;
    order_json(oss, *v);
    reply(res, oss.str());
  });

  svr.Get("/api/venue", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = static_cast<claw::VenueId>(get_ull(req, "id", venue_id));
    reply(res, orders_json(desk.venue_orders(id)));
  });

  svr.Get("/api/triggers", [&](const httplib::Request&, httplib::Response& res) {
    const auto ts = desk.triggers();
    std::ostringstream oss;
    oss << "{\"triggers\":[";
    for (std::size_t i = 0; i < ts.size(); ++i) {
      const auto& t = ts[i];
      if (i) oss << ",";
      oss << "{"
          << "\"id\":" << t.id << ","
          << "\"orderId\":" << t.order_id << ","
          << "\"maker\":" << json_str(std::to_string(t.maker)) << ","
          << "\"limitPrice\":" << json_str(std::to_string(t.limit_price)) << ","
          << "\"direction\":" << json_str(claw::to_string(t.direction)) << ","
          << "\"active\":" << json_bool(t.active) << ","
          << "\"firedAt\":" << t.fired_at
          << "}";
    }
    oss << "]}";
    reply(res, oss.str());
  });

  svr.Get("/api/fills", [&](const httplib::Request&, httplib::Response& res) {
    const auto fs = desk.recent_fills(kMaxFills);
    std::ostringstream oss;
    oss << "{\"fills\":[";
    for (std::size_t i = 0; i < fs.size(); ++i) {
      const auto& f = fs[i];
      if (i) oss << ",";
      oss << "{"
          << "\"id\":" << f.id << ","
          << "\"ts\":" << f.ts << ","
          << "\"kind\":" << json_str(claw::to_string(f.kind)) << ","
          << "\"orderId\":" << f.order_id << ","
          << "\"maker\":" << json_str(std::to_string(f.maker)) << ","
          << "\"counterparty\":" << json_str(std::to_string(f.counterparty)) << ","
          << "\"makerReceived\":" << json_str(std::to_string(f.maker_received)) << ","
          << "\"counterpartyReceived\":" << json_str(std::to_string(f.counterparty_received))
          << "}";
    }
    oss << "]}";
    reply(res, oss.str());
  });

  svr.Get("/api/price", [&](const httplib::Request&, httplib::Response& res) {
    const auto px = desk.last_price();
    reply(res, std::string("{\"price\":") + (px ? json_str(std::to_string(*px)) : "null") + "}");
  });

  // ---- manual interaction ----
  svr.Post("/api/order", [&](const httplib::Request& req, httplib::Response& res) {
    const auto maker = static_cast<claw::AccountId>(get_ull(req, "maker", 0));
    ensure_funded(maker);
    const auto ack = desk.post(static_cast<claw::VenueId>(get_ull(req, "venue", venue_id)),
                               maker,
                               get_bool(req, "sellToken0", true),
                               static_cast<claw::Amount>(get_ull(req, "amountIn", 0)),
                               static_cast<claw::Amount>(get_ull(req, "minAmountOut", 0)),
                               static_cast<claw::Ts>(get_ll(req, "duration", 3600)),
                               get_bool(req, "agent", false));
    reply(res, ack_json(ack.status == claw::OrderStatus::Accepted, ack.reject_reason, ack.id));
  });

  svr.Post("/api/cancel", [&](const httplib::Request& req, httplib::Response& res) {
    const auto ack = desk.cancel(static_cast<claw::VenueId>(get_ull(req, "venue", venue_id)),
                                 static_cast<claw::AccountId>(get_ull(req, "maker", 0)),
                                 static_cast<claw::OrderId>(get_ull(req, "id", 0)));
    reply(res, ack_json(ack.status == claw::OrderStatus::Accepted, ack.reject_reason, ack.id));
  });

  svr.Post("/api/swap", [&](const httplib::Request& req, httplib::Response& res) {
    const auto taker = static_cast<claw::AccountId>(get_ull(req, "taker", 0));
    ensure_funded(taker);
    const auto out = desk.swap(static_cast<claw::VenueId>(get_ull(req, "venue", venue_id)),
                               taker,
                               get_bool(req, "wantsToken0", false),
                               static_cast<claw::SignedAmount>(get_ll(req, "amountSpecified", 0)));
    std::ostringstream oss;
    oss << "{"
        << "\"accepted\":" << json_bool(out.status == claw::OrderStatus::Accepted) << ","
        << "\"reason\":" << json_str(claw::to_string(out.reject_reason)) << ","
        << "\"matched\":" << json_bool(out.matched()) << ","
        << "\"orderId\":" << (out.fill ? out.fill->order_id : 0) << ","
        << "\"inputConsumed\":" << json_str(std::to_string(out.input_consumed)) << ","
        << "\"outputDelivered\":" << json_str(std::to_string(out.output_delivered)) << ","
        << "\"scanned\":" << out.scanned
        << "}";
    reply(res, oss.str());
  });

  svr.Post("/api/arm", [&](const httplib::Request& req, httplib::Response& res) {
    const auto dir = (req.has_param("direction") && req.get_param_value("direction") == "upper")
                         ? claw::Direction::Upper
                         : claw::Direction::Lower;
    const auto ack = desk.arm(static_cast<claw::AccountId>(get_ull(req, "caller", 0)),
                              static_cast<claw::OrderId>(get_ull(req, "id", 0)),
                              static_cast<claw::Price>(get_ll(req, "limitPrice", 0)),
                              dir);
    reply(res, ack_json(ack.status == claw::OrderStatus::Accepted, ack.reject_reason, ack.id));
  });

  // Manual price push: evaluates armed triggers and delivers what fired.
  svr.Post("/api/price", [&](const httplib::Request& req, httplib::Response& res) {
    const auto price = static_cast<claw::Price>(get_ll(req, "price", 0));
    if (price <= 0) {
      res.status = 400;
      reply(res, ack_json(false, claw::RejectReason::InvalidAmount, 0));
      return;
    }

    const auto r = desk.push_price(price);
    std::ostringstream oss;
    oss << "{"
        << ""price":" << json_str(std::to_string(r.report.price)) << ","
        << ""checked":" << r.report.checked << ","
        << ""fired":[";
    for (std::size_t i = 0; i < r.report.fired.size(); ++i) {
      if (i) oss << ",";
      oss << r.report.fired[i];
    }
    oss << "],\"deliveries\":[";
    for (std::size_t i = 0; i < r.deliveries.size(); ++i) {
      const auto& d = r.deliveries[i];
      if (i) oss << ",";
      oss << ack_json(d.ack.status == claw::OrderStatus::Accepted, d.ack.reject_reason,
                      d.call ? d.call->order_id : 0);
    }
    oss << "]}";
    reply(res, oss.str());
  });

  std::cout << "claw gateway listening on http://localhost:" << port << "/\n";
  std::cout << "venue " << venue_id << " (WETH/USDC), relay " << dcfg.relay
            << ", admin " << dcfg.admin << "\n";
  std::cout << "Type 'exit' (or 'quit') then press Enter to stop cleanly.\n";

  const bool listened = svr.listen("0.0.0.0", port);
  if (!listened) std::cerr << "failed to listen on port " << port << "\n";

  // Clean shutdown
  stop_price_feed(feed);
  if (listened) stdin_thread.join();
  else stdin_thread.detach();  // still blocked on stdin
  return listened ? 0 : 1;
}
