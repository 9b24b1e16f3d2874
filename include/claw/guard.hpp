#pragma once
#include "claw/types.hpp"

namespace claw {

// Rejects nested entry into money-moving calls. A custody transfer that calls
// back into the engine finds the guard held and fails with Reentrant.
class ReentrancyGuard {
public:
  class Scope {
  public:
    explicit Scope(ReentrancyGuard& g) noexcept : g_(g), owns_(!g.entered_) {
      if (owns_) g_.entered_ = true;
    }
    ~Scope() { if (owns_) g_.entered_ = false; }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    bool acquired() const noexcept { return owns_; }

  private:
    ReentrancyGuard& g_;
    bool owns_{false};
  };

  bool entered() const noexcept { return entered_; }

private:
  bool entered_{false};
};

// Decides who may rebind privileged identities (relay, strategy operators).
class AccessPolicy {
public:
  virtual ~AccessPolicy() = default;
  virtual bool may_configure(AccountId caller) const noexcept = 0;
};

class SingleAdmin final : public AccessPolicy {
public:
  explicit SingleAdmin(AccountId admin) noexcept : admin_(admin) {}
  bool may_configure(AccountId caller) const noexcept override;
  AccountId admin() const noexcept { return admin_; }

private:
  AccountId admin_{};
};

// Anyone may configure. Only for demos and local test networks.
class OpenAccess final : public AccessPolicy {
public:
  bool may_configure(AccountId) const noexcept override { return true; }
};

} // namespace claw
