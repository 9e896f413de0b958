#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/update_record.hpp"

namespace warden::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Events are never updated or deleted
  - At most one update row per (name, version) is in state pending;
    InsertUpdate enforces it atomically and reports AlreadyExists

  The event table is the source of truth; the update table is a cache
  of its projection.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Events (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.id and record.created_at_ms.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  // Events with id > after_id in id order, at most limit rows.
  virtual std::vector<model::EventRecord> ListEvents(Transaction&, int64_t after_id, std::size_t limit) = 0;

  virtual std::vector<model::EventRecord> ListEventsForUpdate(Transaction&, int64_t update_id) = 0;

  // ---------------------------------------------------------------------
  // Updates
  // ---------------------------------------------------------------------

  // Inserts in state pending; assigns record.id and record.created_at_ms.
  virtual Result InsertUpdate(Transaction&, model::UpdateRecord& record) = 0;

  virtual std::optional<model::UpdateRecord> GetUpdate(Transaction&, int64_t id) = 0;

  // Compare-and-swap: NotFound if id is absent, Conflict if the stored
  // state is not `expected`.
  virtual Result SetUpdateState(Transaction&, int64_t id, warden::model::UpdateState expected, warden::model::UpdateState next,
                                const std::optional<std::string>& meta) = 0;

  virtual std::vector<model::UpdateRecord> ListUpdatesByState(Transaction&, warden::model::UpdateState state) = 0;

  virtual std::vector<model::UpdateRecord> ListUpdates(Transaction&) = 0;

  // All attempts of one identity, ascending id.
  virtual std::vector<model::UpdateRecord> FindUpdates(Transaction&, const std::string& name,
                                                       const std::optional<std::string>& version) = 0;
};

} // namespace warden::db
