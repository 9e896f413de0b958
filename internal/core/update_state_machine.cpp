#include "update_state_machine.hpp"

#include <mutex>

#include "internal/core/projection.hpp"
#include "internal/core/update_locks.hpp"
#include "internal/db/api/translate.hpp"
#include "internal/model/event_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace warden::core {

using warden::db::Guarded;
using warden::model::EventKind;
using warden::model::UpdateState;
using warden::observability::IntField;
using warden::observability::StringField;

namespace {

constexpr const char* kRollbackSucceeded = "succeeded";
constexpr const char* kRollbackFailed    = "failed";

warden::v1::EventPayload PayloadFor(const warden::updates::UpdateRecord& record) {
  warden::v1::EventPayload payload;
  payload.set_update_id(record.id);
  payload.set_name(record.name);
  payload.set_version(record.version.value_or(""));
  return payload;
}

warden::applier::UpdateIdentity IdentityOf(const warden::updates::UpdateRecord& record) {
  return {record.id, record.name, record.version};
}

std::string Label(const warden::updates::UpdateRecord& record) {
  return record.version ? record.name + "@" + *record.version : record.name;
}

} // namespace

UpdateStateMachine::UpdateStateMachine(std::shared_ptr<warden::db::Repository> repository,
                                       std::shared_ptr<warden::events::EventLog> event_log,
                                       std::shared_ptr<warden::updates::UpdateStore> store,
                                       std::shared_ptr<warden::applier::Applier> applier, std::shared_ptr<UpdateLocks> locks)
    : repository_(std::move(repository)),
      event_log_(std::move(event_log)),
      store_(std::move(store)),
      applier_(std::move(applier)),
      locks_(std::move(locks)) {
}

std::optional<std::string> UpdateStateMachine::Invoke(const std::function<warden::applier::ApplierStatus()>& call) {
  try {
    auto status = call();
    if (status) {
      return std::nullopt;
    }
    return status.error.empty() ? std::string("applier reported failure") : status.error;
  } catch (const std::exception& e) {
    return std::string(e.what());
  } catch (...) {
    return std::string("applier raised a non-standard exception");
  }
}

Outcome UpdateStateMachine::Apply(const std::string& name, const std::optional<std::string>& version) {
  Outcome                      outcome;
  std::shared_ptr<std::mutex>  update_mutex;
  std::unique_lock<std::mutex> update_lock;

  // 1+2: pending record and update.started commit together. The unique
  // pending index makes the insert the serialization point for duplicates.
  Guarded("apply " + name, [&] {
    auto tx = repository_->Begin();

    warden::v1::UpdateMeta meta;
    meta.set_attempt(static_cast<uint32_t>(store_->History(*tx, name, version).size() + 1));

    outcome.record = store_->Create(*tx, name, version, meta);
    update_mutex   = locks_->For(outcome.record.id);
    update_lock    = std::unique_lock<std::mutex>(*update_mutex);

    outcome.events.push_back(event_log_->Append(*tx, warden::model::ToString(EventKind::kStarted), PayloadFor(outcome.record)));
    tx->Commit();
  });

  WARDEN_LOG_INFO("update started", {IntField("update_id", outcome.record.id), StringField("update", Label(outcome.record))});

  // 3: may block for as long as the applier likes
  const auto failure = Invoke([&] { return applier_->Apply(IdentityOf(outcome.record)); });

  // 4/5
  auto meta    = warden::updates::UpdateStore::DecodeMeta(outcome.record);
  auto payload = PayloadFor(outcome.record);
  auto kind    = EventKind::kApplied;
  auto next    = UpdateState::kApplied;
  if (failure) {
    kind = EventKind::kFailed;
    next = UpdateState::kFailed;
    meta.set_error(*failure);
    payload.set_error(*failure);
  }

  Guarded("apply " + name, [&] {
    auto tx = repository_->Begin();
    outcome.events.push_back(event_log_->Append(*tx, warden::model::ToString(kind), payload));
    store_->SetState(*tx, outcome.record.id, UpdateState::kPending, next, meta);
    outcome.record = store_->Get(*tx, outcome.record.id);
    tx->Commit();
  });

  if (failure) {
    outcome.applier_error = failure;
    WARDEN_LOG_WARN("update failed",
                    {IntField("update_id", outcome.record.id), StringField("update", Label(outcome.record)), StringField("error", *failure)});
  } else {
    WARDEN_LOG_INFO("update applied", {IntField("update_id", outcome.record.id), StringField("update", Label(outcome.record))});
  }
  return outcome;
}

Outcome UpdateStateMachine::Rollback(int64_t update_id) {
  // Only ids that already committed get locked here. Apply takes the lock
  // of its new id while holding the writer transaction, so locking an id
  // that may not exist yet could invert that order.
  store_->Get(update_id);

  auto                        update_mutex = locks_->For(update_id);
  std::lock_guard<std::mutex> update_lock(*update_mutex);

  Outcome     outcome;
  UpdateState prior = UpdateState::kPending;

  Guarded("rollback update " + std::to_string(update_id), [&] {
    auto tx        = repository_->Begin();
    outcome.record = store_->Get(*tx, update_id);
    prior          = outcome.record.state;

    if (!warden::model::CanRollback(prior)) {
      WARDEN_LOG_WARN("rollback rejected", {IntField("update_id", update_id), StringField("state", warden::model::ToString(prior))});
      throw warden::util::InvalidTransitionError("update " + std::to_string(update_id) + " is " +
                                                 std::string(warden::model::ToString(prior)) +
                                                 "; only applied or failed updates can be rolled back");
    }

    // another process may be midway through the same rollback
    if (Project(event_log_->ReadByReference(*tx, update_id)).rollback_in_flight) {
      throw warden::util::ConflictError("rollback of update " + std::to_string(update_id) + " is already in progress");
    }

    outcome.events.push_back(
        event_log_->Append(*tx, warden::model::ToString(EventKind::kRollbackStarted), PayloadFor(outcome.record)));
    tx->Commit();
  });

  WARDEN_LOG_INFO("rollback started", {IntField("update_id", update_id), StringField("update", Label(outcome.record))});

  const auto failure = Invoke([&] { return applier_->Rollback(IdentityOf(outcome.record)); });

  // The record reaches rolled_back either way; the inverse's result is kept in meta.
  auto meta    = warden::updates::UpdateStore::DecodeMeta(outcome.record);
  auto payload = PayloadFor(outcome.record);
  meta.set_rollback_outcome(failure ? kRollbackFailed : kRollbackSucceeded);
  payload.set_outcome(failure ? kRollbackFailed : kRollbackSucceeded);
  if (failure) {
    meta.set_rollback_error(*failure);
    payload.set_error(*failure);
  }

  Guarded("rollback update " + std::to_string(update_id), [&] {
    auto tx = repository_->Begin();
    outcome.events.push_back(event_log_->Append(*tx, warden::model::ToString(EventKind::kRolledBack), payload));
    store_->SetState(*tx, update_id, prior, UpdateState::kRolledBack, meta);
    outcome.record = store_->Get(*tx, update_id);
    tx->Commit();
  });

  if (failure) {
    outcome.applier_error = failure;
    WARDEN_LOG_WARN("rollback inverse failed", {IntField("update_id", update_id), StringField("error", *failure)});
  } else {
    WARDEN_LOG_INFO("update rolled back", {IntField("update_id", update_id)});
  }
  return outcome;
}

} // namespace warden::core
