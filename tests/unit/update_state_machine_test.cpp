#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/projection.hpp"
#include "internal/core/recovery.hpp"
#include "internal/core/update_locks.hpp"
#include "internal/core/update_state_machine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_applier.hpp"
#include "support/failing_repository.hpp"

namespace {

using warden::applier::ApplierStatus;
using warden::applier::UpdateIdentity;
using warden::core::UpdateStateMachine;
using warden::model::UpdateState;
using warden::testing::FakeApplier;

struct Harness {
  std::shared_ptr<warden::db::Repository>       repository;
  std::shared_ptr<warden::events::EventLog>     event_log;
  std::shared_ptr<warden::updates::UpdateStore> store;
  std::shared_ptr<FakeApplier>                  applier;
  std::shared_ptr<warden::core::UpdateLocks>    locks;
  std::shared_ptr<UpdateStateMachine>           machine;

  explicit Harness(std::shared_ptr<warden::db::Repository> repo = std::make_shared<warden::db::memory::MemoryRepository>())
      : repository(std::move(repo)),
        event_log(std::make_shared<warden::events::EventLog>(repository)),
        store(std::make_shared<warden::updates::UpdateStore>(repository)),
        applier(std::make_shared<FakeApplier>()),
        locks(std::make_shared<warden::core::UpdateLocks>()),
        machine(std::make_shared<UpdateStateMachine>(repository, event_log, store, applier, locks)) {
  }

  std::vector<std::string> Kinds(int64_t update_id) const {
    std::vector<std::string> kinds;
    for (const auto& event : event_log->ReadByReference(update_id)) {
      kinds.push_back(event.kind);
    }
    return kinds;
  }

  int TotalEvents() const {
    auto cursor = event_log->ReadAll();
    int  count  = 0;
    while (cursor.Next()) ++count;
    return count;
  }

  void AssertReplayMatches(int64_t update_id) const {
    auto projection = warden::core::Project(event_log->ReadByReference(update_id));
    assert(projection.state.has_value());
    assert(*projection.state == store->Get(update_id).state);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestApplySuccess() {
  Harness h;

  auto outcome = h.machine->Apply("agent", std::string("2.3"));

  assert(outcome.ok());
  assert(outcome.record.state == UpdateState::kApplied);
  assert(outcome.events.size() == 2);
  assert(h.Kinds(outcome.record.id) == (std::vector<std::string>{"update.started", "update.applied"}));
  assert(outcome.events[0].id < outcome.events[1].id);
  assert(h.applier->apply_calls == 1);
  assert(h.applier->rollback_calls == 0);

  auto meta = warden::updates::UpdateStore::DecodeMeta(outcome.record);
  assert(meta.attempt() == 1);
  assert(meta.error().empty());

  auto payload = warden::events::EventLog::DecodePayload(outcome.events[1]);
  assert(payload.has_value());
  assert(payload->name() == "agent");
  assert(payload->version() == "2.3");

  h.AssertReplayMatches(outcome.record.id);
}

void TestApplyFailureIsRecorded() {
  Harness h;
  h.applier->apply_fn = [](const UpdateIdentity&) { return ApplierStatus::Failure("disk full"); };

  auto outcome = h.machine->Apply("agent", std::string("2.3"));

  assert(!outcome.ok());
  assert(outcome.applier_error == "disk full");
  assert(outcome.record.state == UpdateState::kFailed);
  assert(h.Kinds(outcome.record.id) == (std::vector<std::string>{"update.started", "update.failed"}));
  assert(outcome.record.meta.has_value());
  assert(outcome.record.meta->find("disk full") != std::string::npos);
  assert(warden::events::EventLog::DecodePayload(outcome.events[1])->error() == "disk full");

  // failures are never retried
  assert(h.applier->apply_calls == 1);
  h.AssertReplayMatches(outcome.record.id);
}

void TestApplierExceptionIsAFailure() {
  Harness h;
  h.applier->apply_fn = [](const UpdateIdentity&) -> ApplierStatus { throw std::runtime_error("cancelled: operator abort"); };

  auto outcome = h.machine->Apply("agent", std::nullopt);
  assert(outcome.record.state == UpdateState::kFailed);
  assert(outcome.applier_error == "cancelled: operator abort");
  assert(h.store->ListByState(UpdateState::kPending).empty());
}

void TestRollbackAfterFailure() {
  Harness h;
  h.applier->apply_fn = [](const UpdateIdentity&) { return ApplierStatus::Failure("disk full"); };
  auto failed         = h.machine->Apply("agent", std::string("2.3"));

  auto outcome = h.machine->Rollback(failed.record.id);

  assert(outcome.ok());
  assert(outcome.record.state == UpdateState::kRolledBack);
  assert(outcome.events.size() == 2);
  assert(h.Kinds(failed.record.id) ==
         (std::vector<std::string>{"update.started", "update.failed", "update.rollback_started", "update.rolled_back"}));
  assert(h.applier->rollback_calls == 1);

  auto meta = warden::updates::UpdateStore::DecodeMeta(outcome.record);
  assert(meta.rollback_outcome() == "succeeded");
  assert(meta.error() == "disk full");
  h.AssertReplayMatches(failed.record.id);
}

void TestRollbackTwiceIsRejected() {
  Harness h;
  auto    applied = h.machine->Apply("agent", std::string("2.3"));
  h.machine->Rollback(applied.record.id);

  const int before = h.TotalEvents();
  assert(Throws<warden::util::InvalidTransitionError>([&] { h.machine->Rollback(applied.record.id); }));

  assert(h.TotalEvents() == before);
  assert(h.applier->rollback_calls == 1);
  assert(h.store->Get(applied.record.id).state == UpdateState::kRolledBack);
  h.AssertReplayMatches(applied.record.id);
}

void TestRollbackInverseFailureStillRollsBack() {
  Harness h;
  h.applier->rollback_fn = [](const UpdateIdentity&) { return ApplierStatus::Failure("command exited with status 4"); };
  auto applied           = h.machine->Apply("agent", std::string("2.3"));

  auto outcome = h.machine->Rollback(applied.record.id);
  assert(!outcome.ok());
  assert(outcome.record.state == UpdateState::kRolledBack);

  auto meta = warden::updates::UpdateStore::DecodeMeta(outcome.record);
  assert(meta.rollback_outcome() == "failed");
  assert(meta.rollback_error() == "command exited with status 4");
  assert(warden::events::EventLog::DecodePayload(outcome.events.back())->outcome() == "failed");
}

void TestRollbackPreconditions() {
  Harness h;
  assert(Throws<warden::util::NotFoundError>([&] { h.machine->Rollback(77); }));

  auto record = h.store->Create("agent", std::nullopt);
  assert(Throws<warden::util::InvalidTransitionError>([&] { h.machine->Rollback(record.id); }));
  assert(h.event_log->ReadByReference(record.id).empty());
  assert(h.applier->rollback_calls == 0);
}

void TestRollbackAlreadyInFlightIsConflict() {
  Harness h;
  auto    applied = h.machine->Apply("agent", std::nullopt);

  // as left by another process midway through its rollback
  warden::v1::EventPayload payload;
  payload.set_update_id(applied.record.id);
  h.event_log->Append("update.rollback_started", payload);

  assert(Throws<warden::util::ConflictError>([&] { h.machine->Rollback(applied.record.id); }));
  assert(h.applier->rollback_calls == 0);
}

void TestAttemptNumbersAndIdentityLines() {
  Harness h;
  h.applier->apply_fn = [](const UpdateIdentity& u) {
    return u.version == std::optional<std::string>("1.0") ? ApplierStatus::Failure("boom") : ApplierStatus::Ok();
  };

  auto first  = h.machine->Apply("pkg", std::string("1.0"));
  auto second = h.machine->Apply("pkg", std::string("1.0"));
  auto other  = h.machine->Apply("pkg", std::string("1.1"));

  assert(warden::updates::UpdateStore::DecodeMeta(first.record).attempt() == 1);
  assert(warden::updates::UpdateStore::DecodeMeta(second.record).attempt() == 2);
  assert(warden::updates::UpdateStore::DecodeMeta(other.record).attempt() == 1);
  assert(h.store->History("pkg", std::string("1.0")).size() == 2);
}

void TestStorageFailureLeavesRecordForRecovery() {
  auto    failing = std::make_shared<warden::testing::FailingRepository>(std::make_shared<warden::db::memory::MemoryRepository>());
  Harness h(failing);

  // the final write hits a full disk after the applier ran
  h.applier->apply_fn = [&](const UpdateIdentity&) {
    failing->fail_writes = true;
    return ApplierStatus::Ok();
  };
  assert(Throws<warden::util::StorageError>([&] { h.machine->Apply("agent", std::string("2.3")); }));

  failing->fail_writes = false;
  auto pending         = h.store->ListByState(UpdateState::kPending);
  assert(pending.size() == 1);
  assert(h.Kinds(pending[0].id) == (std::vector<std::string>{"update.started"}));

  warden::core::Recovery recovery(h.repository, h.event_log, h.store, h.locks);
  auto                   report = recovery.Run();
  assert(report.interrupted == 1);
  assert(h.store->Get(pending[0].id).state == UpdateState::kFailed);
  h.AssertReplayMatches(pending[0].id);
}

void TestStorageFailureBeforeStartRunsNothing() {
  auto    failing = std::make_shared<warden::testing::FailingRepository>(std::make_shared<warden::db::memory::MemoryRepository>());
  Harness h(failing);
  failing->fail_writes = true;

  assert(Throws<warden::util::StorageError>([&] { h.machine->Apply("agent", std::nullopt); }));
  assert(h.applier->apply_calls == 0);

  failing->fail_writes = false;
  assert(h.store->ListAll().empty());
  assert(h.TotalEvents() == 0);
}

} // namespace

int main() {
  TestApplySuccess();
  TestApplyFailureIsRecorded();
  TestApplierExceptionIsAFailure();
  TestRollbackAfterFailure();
  TestRollbackTwiceIsRejected();
  TestRollbackInverseFailureStillRollsBack();
  TestRollbackPreconditions();
  TestRollbackAlreadyInFlightIsConflict();
  TestAttemptNumbersAndIdentityLines();
  TestStorageFailureLeavesRecordForRecovery();
  TestStorageFailureBeforeStartRunsNothing();

  std::cout << "warden_unit_update_state_machine: pass\n";
  return 0;
}
