#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/applier/applier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/updates/update_store.hpp"

namespace warden::core {

class UpdateLocks;

struct Outcome {
  warden::updates::UpdateRecord record;

  // Events appended by this call, in order.
  std::vector<warden::events::Event> events;

  // Set when the applier reported (or threw) a failure.
  std::optional<std::string> applier_error;

  bool ok() const {
    return !applier_error.has_value();
  }
};

/*
  Drives updates through

    pending -> applied | failed -> rolled_back

  Every transition appends its event and moves the record inside one
  transaction. The applier always runs outside a transaction.

  Raises ConflictError, InvalidTransitionError, NotFoundError and
  StorageError. Applier failures are recorded on the update and returned
  in Outcome::applier_error instead of being thrown.
*/
class UpdateStateMachine {
 public:
  UpdateStateMachine(std::shared_ptr<warden::db::Repository> repository, std::shared_ptr<warden::events::EventLog> event_log,
                     std::shared_ptr<warden::updates::UpdateStore> store, std::shared_ptr<warden::applier::Applier> applier,
                     std::shared_ptr<UpdateLocks> locks);

  Outcome Apply(const std::string& name, const std::optional<std::string>& version);

  // Caller-initiated only; never triggered automatically on failure.
  Outcome Rollback(int64_t update_id);

 private:
  // Runs an applier call, folding thrown exceptions into a failure message.
  static std::optional<std::string> Invoke(const std::function<warden::applier::ApplierStatus()>& call);

  std::shared_ptr<warden::db::Repository>       repository_;
  std::shared_ptr<warden::events::EventLog>     event_log_;
  std::shared_ptr<warden::updates::UpdateStore> store_;
  std::shared_ptr<warden::applier::Applier>     applier_;
  std::shared_ptr<UpdateLocks>                  locks_;
};

} // namespace warden::core
