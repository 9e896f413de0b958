#include "projection.hpp"

#include <string>

#include "internal/events/event_log.hpp"
#include "internal/util/errors.hpp"

namespace warden::core {

using warden::model::EventKind;
using warden::model::UpdateState;

namespace {

std::string Describe(const std::optional<UpdateState>& state) {
  return state ? std::string(warden::model::ToString(*state)) : "none";
}

[[noreturn]] void Illegal(const warden::db::model::EventRecord& event, const std::optional<UpdateState>& state) {
  throw warden::util::InvalidTransitionError("event " + std::to_string(event.id) + " (" + event.kind + ") is illegal in state " +
                                             Describe(state));
}

void Step(Projection& p, const warden::db::model::EventRecord& event, UpdateState next) {
  if (!p.state || !warden::model::CanTransition(*p.state, next)) {
    Illegal(event, p.state);
  }
  p.state = next;
}

} // namespace

Projection Project(const std::vector<warden::db::model::EventRecord>& events) {
  Projection p;

  for (const auto& event : events) {
    if (event.id <= p.last_event_id) {
      throw warden::util::InvalidTransitionError("events out of order at id " + std::to_string(event.id));
    }
    p.last_event_id = event.id;

    const auto kind = warden::model::ParseEventKind(event.kind);
    if (!kind) {
      continue;
    }
    p.last_kind = kind;

    switch (*kind) {
      case EventKind::kStarted:
        if (p.state) Illegal(event, p.state);
        p.state = UpdateState::kPending;
        break;

      case EventKind::kApplied:
        Step(p, event, UpdateState::kApplied);
        break;

      case EventKind::kFailed:
        Step(p, event, UpdateState::kFailed);
        break;

      case EventKind::kInterrupted:
        // recovery may also close out a record whose start event never landed
        if (p.state && *p.state != UpdateState::kPending) Illegal(event, p.state);
        p.state = UpdateState::kFailed;
        break;

      case EventKind::kRollbackStarted:
        if (!p.state || !warden::model::CanRollback(*p.state) || p.rollback_in_flight) Illegal(event, p.state);
        p.rollback_in_flight = true;
        break;

      case EventKind::kRolledBack:
        Step(p, event, UpdateState::kRolledBack);
        p.rollback_in_flight = false;
        break;

      case EventKind::kReconciled: {
        const auto payload = warden::events::EventLog::DecodePayload(event);
        const auto state   = payload ? warden::model::ParseUpdateState(payload->outcome()) : std::nullopt;
        if (!state) {
          throw warden::util::InvalidTransitionError("event " + std::to_string(event.id) + " names no reconciled state");
        }
        p.state              = *state;
        p.rollback_in_flight = false;
        break;
      }
    }
  }

  return p;
}

} // namespace warden::core
