#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>

#include "claw/types.hpp"

namespace claw {

// Per-venue collection of live order ids. Removal swaps the target with the
// last element and shrinks, so iteration order is not insertion order.
class VenueOrderIndex {
public:
  void append(VenueId venue, OrderId id);

  // O(1); false if id is not indexed under venue
  bool remove(VenueId venue, OrderId id) noexcept;

  bool contains(VenueId venue, OrderId id) const noexcept;

  // Live ids in current index order (empty for an unknown venue).
  const std::vector<OrderId>& ids(VenueId venue) const noexcept;

  std::size_t size(VenueId venue) const noexcept { return ids(venue).size(); }
  std::size_t venue_count() const noexcept { return by_venue_.size(); }

private:
  struct Slot {
    VenueId venue{};
    std::size_t pos{};
  };

  std::unordered_map<VenueId, std::vector<OrderId>> by_venue_;
  std::unordered_map<OrderId, Slot> slot_;
};

} // namespace claw
