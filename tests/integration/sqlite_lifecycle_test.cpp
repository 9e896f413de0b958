#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/model/event_kind.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_applier.hpp"

namespace {

using warden::applier::ApplierStatus;
using warden::applier::UpdateIdentity;
using warden::model::UpdateState;
using warden::runtime::config::RuntimeConfig;

RuntimeConfig SqliteConfig(const std::string& path, bool run_recovery) {
  RuntimeConfig config;
  auto*         sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path(path);
  sqlite->set_busy_timeout_ms(1000);
  sqlite->set_synchronous("FULL");
  config.mutable_recovery()->set_run_on_startup(run_recovery);
  return config;
}

std::vector<std::string> Kinds(const warden::factory::Runtime& runtime, int64_t update_id) {
  std::vector<std::string> kinds;
  for (const auto& event : runtime.event_log->ReadByReference(update_id)) {
    kinds.push_back(event.kind);
  }
  return kinds;
}

void TestLifecycleSurvivesRestart(const std::string& path) {
  auto applier = std::make_shared<warden::testing::FakeApplier>();
  applier->apply_fn = [](const UpdateIdentity& u) {
    return u.name == "broken" ? ApplierStatus::Failure("disk full") : ApplierStatus::Ok();
  };

  int64_t applied_id = 0;
  int64_t failed_id  = 0;
  {
    auto runtime = warden::factory::Build(SqliteConfig(path, false), applier);

    auto applied = runtime.state_machine->Apply("agent", std::string("2.3"));
    assert(applied.record.state == UpdateState::kApplied);
    applied_id = applied.record.id;

    auto failed = runtime.state_machine->Apply("broken", std::nullopt);
    assert(failed.record.state == UpdateState::kFailed);
    failed_id = failed.record.id;

    auto rolled = runtime.state_machine->Rollback(failed_id);
    assert(rolled.record.state == UpdateState::kRolledBack);

    bool conflict = false;
    try {
      // an update still pending from another attempt blocks a second one
      runtime.store->Create("agent", std::string("3.0"));
      runtime.state_machine->Apply("agent", std::string("3.0"));
    } catch (const warden::util::ConflictError&) {
      conflict = true;
    }
    assert(conflict);
  }

  // reopen: everything committed is still there and consistent
  auto runtime = warden::factory::Build(SqliteConfig(path, false), applier);
  assert(runtime.store->Get(applied_id).state == UpdateState::kApplied);
  assert(runtime.store->Get(failed_id).state == UpdateState::kRolledBack);
  assert(Kinds(runtime, applied_id) == (std::vector<std::string>{"update.started", "update.applied"}));
  assert(Kinds(runtime, failed_id) ==
         (std::vector<std::string>{"update.started", "update.failed", "update.rollback_started", "update.rolled_back"}));
  assert(runtime.store->ListByState(UpdateState::kPending).size() == 1);
}

void TestStartupRecoveryAfterCrash(const std::string& path) {
  auto    applier = std::make_shared<warden::testing::FakeApplier>();
  int64_t crashed = 0;
  int     events_before = 0;
  {
    auto runtime = warden::factory::Build(SqliteConfig(path, false), applier);
    auto tx      = runtime.repository->Begin();
    auto record  = runtime.store->Create(*tx, "agent", std::string("4.0"), warden::v1::UpdateMeta{});

    warden::v1::EventPayload payload;
    payload.set_update_id(record.id);
    payload.set_name(record.name);
    runtime.event_log->Append(*tx, warden::model::ToString(warden::model::EventKind::kStarted), payload);
    tx->Commit();
    crashed = record.id;

    auto cursor = runtime.event_log->ReadAll();
    while (cursor.Next()) ++events_before;
  }

  // startup recovery runs inside Build
  auto runtime = warden::factory::Build(SqliteConfig(path, true), applier);

  auto record = runtime.store->Get(crashed);
  assert(record.state == UpdateState::kFailed);
  auto meta = warden::updates::UpdateStore::DecodeMeta(record);
  assert(meta.interrupted());
  assert(meta.error() == "interrupted");
  assert(Kinds(runtime, crashed).back() == "update.interrupted");
  assert(runtime.store->ListByState(UpdateState::kPending).empty());
  assert(runtime.recovery->Verify().empty());
  assert(applier->apply_calls == 0);

  int  events_after = 0;
  auto cursor       = runtime.event_log->ReadAll();
  while (cursor.Next()) ++events_after;
  // the pending "agent 3.0" left by the first test is interrupted too
  assert(events_after == events_before + 2);
}

void TestDriftedCacheBesidePendingSibling(const std::string& path) {
  auto applier = std::make_shared<warden::testing::FakeApplier>();
  auto runtime = warden::factory::Build(SqliteConfig(path, false), applier);

  auto start = [&](const std::optional<std::string>& version) {
    auto tx     = runtime.repository->Begin();
    auto record = runtime.store->Create(*tx, "agent", version, warden::v1::UpdateMeta{});

    warden::v1::EventPayload payload;
    payload.set_update_id(record.id);
    payload.set_name(record.name);
    runtime.event_log->Append(*tx, warden::model::ToString(warden::model::EventKind::kStarted), payload);
    tx->Commit();
    return record.id;
  };

  // first attempt's cache claims applied but its log stops at started
  const auto drifted = start(std::string("2.3"));
  {
    auto tx = runtime.repository->Begin();
    runtime.store->SetState(*tx, drifted, UpdateState::kPending, UpdateState::kApplied, warden::v1::UpdateMeta{});
    tx->Commit();
  }
  const auto sibling = start(std::string("2.3"));

  auto report = runtime.recovery->Run();
  assert(report.unrecoverable.empty());
  assert(report.unreadable.empty());
  assert(report.interrupted == 2);
  assert(runtime.store->Get(drifted).state == UpdateState::kFailed);
  assert(runtime.store->Get(sibling).state == UpdateState::kFailed);
  assert(runtime.store->ListByState(UpdateState::kPending).empty());
  assert(runtime.recovery->Verify().empty());

  // the identity is free again
  auto retry = runtime.state_machine->Apply("agent", std::string("2.3"));
  assert(retry.record.state == UpdateState::kApplied);
  assert(warden::updates::UpdateStore::DecodeMeta(retry.record).attempt() == 3);
}

} // namespace

int main() {
#if WARDEN_DB_SQLITE
  const auto dir = std::filesystem::temp_directory_path() /
                   ("warden_lifecycle_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  const auto path = (dir / "state.sqlite").string();

  TestLifecycleSurvivesRestart(path);
  TestStartupRecoveryAfterCrash(path);
  TestDriftedCacheBesidePendingSibling((dir / "drift.sqlite").string());

  std::filesystem::remove_all(dir);
  std::cout << "warden_integration_sqlite_lifecycle: pass\n";
#else
  std::cout << "warden_integration_sqlite_lifecycle: skipped (sqlite disabled)\n";
#endif
  return 0;
}
