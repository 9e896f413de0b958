#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/projection.hpp"
#include "internal/util/errors.hpp"

namespace {

using warden::core::Project;
using warden::db::model::EventRecord;
using warden::model::EventKind;
using warden::model::UpdateState;

std::vector<EventRecord> Events(std::initializer_list<const char*> kinds) {
  std::vector<EventRecord> events;
  int64_t                  id = 10;
  for (const char* kind : kinds) {
    EventRecord event;
    event.id        = id;
    event.kind      = kind;
    event.update_id = 1;
    events.push_back(event);
    id += 3;
  }
  return events;
}

bool Throws(const std::vector<EventRecord>& events) {
  try {
    (void)Project(events);
  } catch (const warden::util::InvalidTransitionError&) {
    return true;
  }
  return false;
}

void TestEmptyHistory() {
  auto p = Project({});
  assert(!p.state.has_value());
  assert(!p.rollback_in_flight);
  assert(p.last_event_id == 0);
}

void TestLifecycleReplay() {
  assert(Project(Events({"update.started"})).state == UpdateState::kPending);
  assert(Project(Events({"update.started", "update.applied"})).state == UpdateState::kApplied);
  assert(Project(Events({"update.started", "update.failed"})).state == UpdateState::kFailed);

  auto rolled = Project(Events({"update.started", "update.failed", "update.rollback_started", "update.rolled_back"}));
  assert(rolled.state == UpdateState::kRolledBack);
  assert(!rolled.rollback_in_flight);
  assert(rolled.last_kind == EventKind::kRolledBack);
  assert(rolled.last_event_id == 19);
}

void TestRollbackInFlight() {
  auto p = Project(Events({"update.started", "update.applied", "update.rollback_started"}));
  assert(p.state == UpdateState::kApplied);
  assert(p.rollback_in_flight);
}

void TestInterruptedIsFailed() {
  assert(Project(Events({"update.started", "update.interrupted"})).state == UpdateState::kFailed);
  assert(Project(Events({"update.interrupted"})).state == UpdateState::kFailed);
}

void TestReconciledCarriesState() {
  auto events = Events({"update.started", "update.applied", "update.reconciled"});
  events[2].payload = R"({"update_id":"1","outcome":"failed"})";
  assert(Project(events).state == UpdateState::kFailed);

  events[2].payload = R"({"update_id":"1"})";
  assert(Throws(events));
}

void TestUnknownKindsAreSkipped() {
  auto p = Project(Events({"update.started", "agent.heartbeat", "update.applied", "agent.note"}));
  assert(p.state == UpdateState::kApplied);
  assert(p.last_kind == EventKind::kApplied);
}

void TestIllegalSequencesThrow() {
  assert(Throws(Events({"update.applied"})));
  assert(Throws(Events({"update.started", "update.started"})));
  assert(Throws(Events({"update.started", "update.applied", "update.failed"})));
  assert(Throws(Events({"update.started", "update.rollback_started"})));
  assert(Throws(Events({"update.started", "update.applied", "update.rollback_started", "update.rollback_started"})));
  assert(Throws(Events({"update.started", "update.applied", "update.interrupted"})));

  auto out_of_order = Events({"update.started", "update.applied"});
  out_of_order[1].id = out_of_order[0].id;
  assert(Throws(out_of_order));
}

} // namespace

int main() {
  TestEmptyHistory();
  TestLifecycleReplay();
  TestRollbackInFlight();
  TestInterruptedIsFailed();
  TestReconciledCarriesState();
  TestUnknownKindsAreSkipped();
  TestIllegalSequencesThrow();

  std::cout << "warden_unit_projection: pass\n";
  return 0;
}
