#include "claw/guard.hpp"

namespace claw {

bool SingleAdmin::may_configure(AccountId caller) const noexcept {
  return caller != kNoAccount && caller == admin_;
}

} // namespace claw
