#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "claw/order_flow.hpp"
#include "claw/simulator.hpp"

static void write_fills_csv(const std::string& path, const std::vector<claw::Fill>& fills) {
  std::ofstream f(path);
  f << "fill_id,ts,kind,order_id,maker,counterparty,maker_asset,maker_received,"
       "counterparty_asset,counterparty_received\n";
  for (const auto& x : fills) {
    f << x.id << "," << x.ts << "," << claw::to_string(x.kind) << "," << x.order_id << ","
      << x.maker << "," << x.counterparty << "," << x.maker_asset << "," << x.maker_received << ","
      << x.counterparty_asset << "," << x.counterparty_received << "\n";
  }
}

static void write_orders_csv(const std::string& path, const std::vector<claw::Order>& orders) {
  std::ofstream f(path);
  f << "order_id,maker,origin,sell_asset,buy_asset,amount_in,min_amount_out,created,expiry,state\n";
  for (const auto& o : orders) {
    f << o.id << "," << o.maker << "," << claw::to_string(o.origin) << "," << o.sell_asset << ","
      << o.buy_asset << "," << o.amount_in << "," << o.min_amount_out << "," << o.created << ","
      << o.expiry << "," << claw::to_string(o.state) << "\n";
  }
}

static void usage() {
  std::cout
    << "Usage:\n"
    << "  claw_cli [seed] [events]\n"
    << "  claw_cli --bounded <checks_per_update> [seed] [events]\n";
}

int main(int argc, char** argv) {
  uint64_t seed = 1;
  std::size_t n_events = 2000;
  claw::SimConfig cfg{};

  int arg = 1;
  if (argc >= 2 && std::string(argv[1]) == "--help") { usage(); return 0; }
  const bool bounded = argc >= 2 && std::string(argv[1]) == "--bounded";
  if (bounded && argc < 3) { usage(); return 1; }

  try {
    if (bounded) {
      cfg.max_checks_per_update = static_cast<std::size_t>(std::stoull(argv[2]));
      arg = 3;
    }
    if (argc > arg) seed = static_cast<uint64_t>(std::stoull(argv[arg]));
    if (argc > arg + 1) n_events = static_cast<std::size_t>(std::stoull(argv[arg + 1]));
  } catch (const std::exception& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
    usage();
    return 1;
  }

  claw::FlowParams p{};
  claw::OrderFlowGenerator gen(seed, p);
  auto events = gen.generate(/*t0*/1'700'000'000, n_events);

  claw::Simulator sim{cfg};
  auto res = sim.run(events);

  write_fills_csv("fills.csv", res.fills);
  write_orders_csv("orders.csv", res.orders);

  std::size_t open = 0;
  for (const auto& o : res.orders) open += o.active ? 1 : 0;

  std::cout << "events=" << events.size()
            << " orders=" << res.orders.size()
            << " open=" << open
            << " fills=" << res.fills.size()
            << " unmatched_swaps=" << res.unmatched_swaps
            << " evictions=" << res.evictions
            << " authorizations=" << res.authorizations
            << " stale_authorizations=" << res.stale_authorizations
            << " post_rejects=" << res.post_rejects
            << " cancel_rejects=" << res.cancel_rejects
            << " arm_rejects=" << res.arm_rejects
            << "\n";

  if (res.invariant_violations != 0) {
    std::cerr << "escrow invariant violated " << res.invariant_violations << " times\n";
    return 2;
  }
  return 0;
}
