#include "claw/order_index.hpp"

namespace claw {

namespace {
const std::vector<OrderId> kEmpty{};
} // namespace

void VenueOrderIndex::append(VenueId venue, OrderId id) {
  auto& v = by_venue_[venue];
  slot_[id] = Slot{venue, v.size()};
  v.push_back(id);
}

bool VenueOrderIndex::remove(VenueId venue, OrderId id) noexcept {
  auto sit = slot_.find(id);
  if (sit == slot_.end() || sit->second.venue != venue) return false;

  auto vit = by_venue_.find(venue);
  if (vit == by_venue_.end()) return false;
  auto& v = vit->second;

  const std::size_t pos = sit->second.pos;
  const OrderId last = v.back();
  if (last != id) {
    v[pos] = last;
    slot_[last].pos = pos;
  }
  v.pop_back();
  slot_.erase(sit);

  if (v.empty()) by_venue_.erase(vit);
  return true;
}

bool VenueOrderIndex::contains(VenueId venue, OrderId id) const noexcept {
  auto it = slot_.find(id);
  return it != slot_.end() && it->second.venue == venue;
}

const std::vector<OrderId>& VenueOrderIndex::ids(VenueId venue) const noexcept {
  auto it = by_venue_.find(venue);
  return (it == by_venue_.end()) ? kEmpty : it->second;
}

} // namespace claw
