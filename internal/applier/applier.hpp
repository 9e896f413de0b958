#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace warden::applier {

struct UpdateIdentity {
  int64_t                    update_id = 0;
  std::string                name;
  std::optional<std::string> version;
};

struct ApplierStatus {
  bool        ok = true;
  std::string error;

  static ApplierStatus Ok() {
    return {};
  }

  static ApplierStatus Failure(std::string msg) {
    return {false, std::move(msg)};
  }

  explicit operator bool() const {
    return ok;
  }
};

/*
  Capability that performs (and undoes) the actual effect of an update.

  Both calls may block arbitrarily. A failure may be reported either as a
  Failure status or by throwing; the state machine treats both the same,
  which is also how cancellation and timeouts surface.
*/
class Applier {
 public:
  virtual ~Applier() = default;

  virtual ApplierStatus Apply(const UpdateIdentity& update) = 0;

  // Best effort inverse of Apply.
  virtual ApplierStatus Rollback(const UpdateIdentity& update) = 0;
};

} // namespace warden::applier
