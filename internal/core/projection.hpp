#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/model/event_kind.hpp"
#include "internal/model/update_state.hpp"

namespace warden::core {

struct Projection {
  // nullopt when the events carry no lifecycle kind at all
  std::optional<warden::model::UpdateState> state;

  // update.rollback_started seen without a matching update.rolled_back
  bool rollback_in_flight = false;

  std::optional<warden::model::EventKind> last_kind;
  int64_t                                 last_event_id = 0;
};

/*
  Replays one update's events (as returned by EventLog::ReadByReference)
  and derives its lifecycle state.

    update.started          -> pending
    update.applied          -> applied
    update.failed           -> failed
    update.interrupted      -> failed
    update.rollback_started -> (state kept, rollback in flight)
    update.rolled_back      -> rolled_back
    update.reconciled       -> state named in the payload outcome

  Kinds outside the lifecycle are skipped. A sequence that implies an
  illegal transition throws InvalidTransitionError.
*/
Projection Project(const std::vector<warden::db::model::EventRecord>& events);

} // namespace warden::core
