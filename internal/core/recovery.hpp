#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/update_state.hpp"
#include "internal/updates/update_store.hpp"

namespace warden::core {

class UpdateLocks;

struct RecoveryReport {
  std::size_t interrupted         = 0;
  std::size_t rollbacks_completed = 0;
  std::size_t reconciled          = 0;

  // Held by an Apply/Rollback running in this process.
  std::size_t skipped_in_flight = 0;

  // History that does not replay; left untouched for an operator.
  std::vector<int64_t> unreadable;

  // Repair hit a storage error or a concurrent writer; the pass moved on.
  std::vector<int64_t> unrecoverable;

  std::size_t Total() const {
    return interrupted + rollbacks_completed + reconciled;
  }
};

struct Mismatch {
  int64_t                                   update_id = 0;
  warden::model::UpdateState                cached    = warden::model::UpdateState::kPending;
  std::optional<warden::model::UpdateState> projected;
  std::string                               detail;
};

/*
  Brings the update store back in line with the event log after a crash.

  Run at startup before new work is accepted, or on demand. On-demand runs
  skip ids locked in this process but cannot see appliers running in other
  processes; do not run it while another process is applying.

  Never invokes the applier. Each repair appends exactly one event and
  commits together with the record change. A record that cannot be
  repaired is reported and the pass continues with the next one.
*/
class Recovery {
 public:
  Recovery(std::shared_ptr<warden::db::Repository> repository, std::shared_ptr<warden::events::EventLog> event_log,
           std::shared_ptr<warden::updates::UpdateStore> store, std::shared_ptr<UpdateLocks> locks);

  RecoveryReport Run();

  // Read-only: records whose cached state disagrees with their events.
  std::vector<Mismatch> Verify() const;

 private:
  void RecoverOne(int64_t update_id, RecoveryReport& report);

  std::shared_ptr<warden::db::Repository>       repository_;
  std::shared_ptr<warden::events::EventLog>     event_log_;
  std::shared_ptr<warden::updates::UpdateStore> store_;
  std::shared_ptr<UpdateLocks>                  locks_;
};

} // namespace warden::core
