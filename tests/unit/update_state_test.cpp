#include <cassert>
#include <iostream>

#include "internal/model/event_kind.hpp"
#include "internal/model/update_state.hpp"

namespace {

using warden::model::CanRollback;
using warden::model::CanTransition;
using warden::model::EventKind;
using warden::model::UpdateState;

static_assert(CanTransition(UpdateState::kPending, UpdateState::kApplied));
static_assert(!CanTransition(UpdateState::kRolledBack, UpdateState::kPending));

void TestTransitionTable() {
  const UpdateState all[] = {UpdateState::kPending, UpdateState::kApplied, UpdateState::kFailed, UpdateState::kRolledBack};

  int legal = 0;
  for (auto from : all) {
    for (auto to : all) {
      if (CanTransition(from, to)) ++legal;
    }
  }
  assert(legal == 4);

  assert(CanTransition(UpdateState::kPending, UpdateState::kApplied));
  assert(CanTransition(UpdateState::kPending, UpdateState::kFailed));
  assert(CanTransition(UpdateState::kApplied, UpdateState::kRolledBack));
  assert(CanTransition(UpdateState::kFailed, UpdateState::kRolledBack));

  assert(!CanTransition(UpdateState::kPending, UpdateState::kRolledBack));
  assert(!CanTransition(UpdateState::kApplied, UpdateState::kFailed));
  assert(!CanTransition(UpdateState::kFailed, UpdateState::kApplied));
  assert(!CanTransition(UpdateState::kApplied, UpdateState::kApplied));
}

void TestRollbackEligibility() {
  assert(CanRollback(UpdateState::kApplied));
  assert(CanRollback(UpdateState::kFailed));
  assert(!CanRollback(UpdateState::kPending));
  assert(!CanRollback(UpdateState::kRolledBack));
  assert(warden::model::IsTerminal(UpdateState::kRolledBack));
}

void TestStateStrings() {
  for (auto state : {UpdateState::kPending, UpdateState::kApplied, UpdateState::kFailed, UpdateState::kRolledBack}) {
    assert(warden::model::ParseUpdateState(warden::model::ToString(state)) == state);
  }
  assert(warden::model::ToString(UpdateState::kRolledBack) == "rolled_back");
  assert(!warden::model::ParseUpdateState("Applied").has_value());
  assert(!warden::model::ParseUpdateState("").has_value());
}

void TestEventKindStrings() {
  assert(warden::model::ToString(EventKind::kStarted) == "update.started");
  assert(warden::model::ToString(EventKind::kRollbackStarted) == "update.rollback_started");
  assert(warden::model::ParseEventKind("update.rolled_back") == EventKind::kRolledBack);
  assert(warden::model::ParseEventKind("update.interrupted") == EventKind::kInterrupted);
  assert(!warden::model::ParseEventKind("agent.heartbeat").has_value());
}

} // namespace

int main() {
  TestTransitionTable();
  TestRollbackEligibility();
  TestStateStrings();
  TestEventKindStrings();

  std::cout << "warden_unit_update_state: pass\n";
  return 0;
}
