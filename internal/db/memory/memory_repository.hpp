#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace warden::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::vector<model::EventRecord>        events;
    std::map<int64_t, model::UpdateRecord> updates;
    int64_t                                next_event_id  = 1;
    int64_t                                next_update_id = 1;
  };

  // Held by a transaction for its whole lifetime (BEGIN IMMEDIATE analogue).
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
