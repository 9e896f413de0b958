#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace warden::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, int64_t after_id, std::size_t limit) override;
  std::vector<model::EventRecord> ListEventsForUpdate(Transaction&, int64_t update_id) override;

  Result InsertUpdate(Transaction&, model::UpdateRecord&) override;
  std::optional<model::UpdateRecord> GetUpdate(Transaction&, int64_t id) override;
  Result SetUpdateState(Transaction&, int64_t id, warden::model::UpdateState expected, warden::model::UpdateState next,
                        const std::optional<std::string>& meta) override;
  std::vector<model::UpdateRecord> ListUpdatesByState(Transaction&, warden::model::UpdateState state) override;
  std::vector<model::UpdateRecord> ListUpdates(Transaction&) override;
  std::vector<model::UpdateRecord> FindUpdates(Transaction&, const std::string& name,
                                               const std::optional<std::string>& version) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
