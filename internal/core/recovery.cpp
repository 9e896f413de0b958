#include "recovery.hpp"

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

constexpr const char* kInterrupted = "interrupted";

warden::v1::EventPayload PayloadFor(const warden::updates::UpdateRecord& record) {
  warden::v1::EventPayload payload;
  payload.set_update_id(record.id);
  payload.set_name(record.name);
  payload.set_version(record.version.value_or(""));
  payload.set_note("recovery");
  return payload;
}

} // namespace

Recovery::Recovery(std::shared_ptr<warden::db::Repository> repository, std::shared_ptr<warden::events::EventLog> event_log,
                   std::shared_ptr<warden::updates::UpdateStore> store, std::shared_ptr<UpdateLocks> locks)
    : repository_(std::move(repository)), event_log_(std::move(event_log)), store_(std::move(store)), locks_(std::move(locks)) {
}

RecoveryReport Recovery::Run() {
  RecoveryReport report;

  for (const auto& record : store_->ListAll()) {
    auto                         update_mutex = locks_->For(record.id);
    std::unique_lock<std::mutex> update_lock(*update_mutex, std::try_to_lock);
    if (!update_lock.owns_lock()) {
      ++report.skipped_in_flight;
      WARDEN_LOG_DEBUG("recovery skipped in-flight update", {IntField("update_id", record.id)});
      continue;
    }

    try {
      RecoverOne(record.id, report);
    } catch (const warden::util::InvalidTransitionError& e) {
      report.unreadable.push_back(record.id);
      WARDEN_LOG_ERROR("update history does not replay", {IntField("update_id", record.id), StringField("error", e.what())});
    } catch (const warden::util::ConflictError& e) {
      report.unrecoverable.push_back(record.id);
      WARDEN_LOG_ERROR("update could not be recovered", {IntField("update_id", record.id), StringField("error", e.what())});
    } catch (const warden::util::StorageError& e) {
      report.unrecoverable.push_back(record.id);
      WARDEN_LOG_ERROR("update could not be recovered", {IntField("update_id", record.id), StringField("error", e.what())});
    }
  }

  WARDEN_LOG_INFO("recovery finished", {IntField("interrupted", static_cast<int64_t>(report.interrupted)),
                                        IntField("rollbacks_completed", static_cast<int64_t>(report.rollbacks_completed)),
                                        IntField("reconciled", static_cast<int64_t>(report.reconciled)),
                                        IntField("skipped", static_cast<int64_t>(report.skipped_in_flight)),
                                        IntField("unreadable", static_cast<int64_t>(report.unreadable.size())),
                                        IntField("unrecoverable", static_cast<int64_t>(report.unrecoverable.size()))});
  return report;
}

void Recovery::RecoverOne(int64_t update_id, RecoveryReport& report) {
  Guarded("recover update " + std::to_string(update_id), [&] {
    auto tx         = repository_->Begin();
    auto record     = store_->Get(*tx, update_id);
    auto projection = Project(event_log_->ReadByReference(*tx, update_id));
    auto meta       = warden::updates::UpdateStore::DecodeMeta(record);
    auto payload    = PayloadFor(record);

    if (projection.rollback_in_flight) {
      // crashed between rollback_started and rolled_back
      meta.set_rollback_outcome(kInterrupted);
      payload.set_outcome(kInterrupted);
      event_log_->Append(*tx, warden::model::ToString(EventKind::kRolledBack), payload);

      auto from = record.state;
      if (!warden::model::CanRollback(from)) {
        // the cache drifted; the log says the rollback left projection.state
        meta.set_reconciled_from(std::string(warden::model::ToString(from)));
        store_->SetState(*tx, update_id, from, *projection.state, meta);
        from = *projection.state;
      }
      store_->SetState(*tx, update_id, from, UpdateState::kRolledBack, meta);
      tx->Commit();

      ++report.rollbacks_completed;
      WARDEN_LOG_WARN("recovery completed interrupted rollback", {IntField("update_id", update_id)});
      return;
    }

    // A log that ends at update.started is crash evidence whatever the cache
    // says, and so is a pending record with no lifecycle events.
    const bool started_only = projection.state ? *projection.state == UpdateState::kPending
                                               : record.state == UpdateState::kPending;
    if (started_only) {
      if (record.state != UpdateState::kPending) {
        meta.set_reconciled_from(std::string(warden::model::ToString(record.state)));
      }
      meta.set_interrupted(true);
      meta.set_error(kInterrupted);
      payload.set_error(kInterrupted);
      event_log_->Append(*tx, warden::model::ToString(EventKind::kInterrupted), payload);
      store_->SetState(*tx, update_id, record.state, UpdateState::kFailed, meta);
      tx->Commit();

      ++report.interrupted;
      WARDEN_LOG_WARN("recovery marked interrupted update failed", {IntField("update_id", update_id),
                                                                    StringField("name", record.name),
                                                                    StringField("cached", warden::model::ToString(record.state))});
      return;
    }

    if (!projection.state) {
      WARDEN_LOG_WARN("update has no lifecycle events",
                      {IntField("update_id", update_id), StringField("state", warden::model::ToString(record.state))});
      return;
    }

    if (*projection.state != record.state) {
      // the log wins
      const auto projected = *projection.state;
      meta.set_reconciled_from(std::string(warden::model::ToString(record.state)));
      payload.set_outcome(std::string(warden::model::ToString(projected)));
      event_log_->Append(*tx, warden::model::ToString(EventKind::kReconciled), payload);
      store_->SetState(*tx, update_id, record.state, projected, meta);
      tx->Commit();

      ++report.reconciled;
      WARDEN_LOG_WARN("recovery reconciled update from log",
                      {IntField("update_id", update_id), StringField("from", warden::model::ToString(record.state)),
                       StringField("to", warden::model::ToString(projected))});
    }
  });
}

std::vector<Mismatch> Recovery::Verify() const {
  std::vector<Mismatch> mismatches;

  Guarded("verify updates", [&] {
    auto tx = repository_->Begin();
    for (const auto& record : store_->ListAll(*tx)) {
      Mismatch mismatch{record.id, record.state, std::nullopt, ""};
      try {
        auto projection    = Project(event_log_->ReadByReference(*tx, record.id));
        mismatch.projected = projection.state;
        if (projection.rollback_in_flight) {
          mismatch.detail = "rollback in flight";
        } else if (!projection.state) {
          mismatch.detail = "no lifecycle events";
        } else if (*projection.state != record.state) {
          mismatch.detail = "cached state differs from log";
        }
      } catch (const warden::util::InvalidTransitionError& e) {
        mismatch.detail = e.what();
      }
      if (!mismatch.detail.empty()) {
        mismatches.push_back(std::move(mismatch));
      }
    }
    tx->Commit();
  });

  return mismatches;
}

} // namespace warden::core
