#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/update_record.hpp"
#include "internal/model/update_state.hpp"
#include "warden/v1/update.pb.h"

namespace warden::updates {

using UpdateRecord = warden::db::model::UpdateRecord;

/*
  Store of UpdateRecords, the cached projection of the event log.

  The store checks existence and the expected current state only;
  whether a transition is legal is decided by the state machine.
*/
class UpdateStore {
 public:
  explicit UpdateStore(std::shared_ptr<warden::db::Repository> repository);

  // Creates a pending record. Throws ConflictError if (name, version)
  // already has a pending record.
  UpdateRecord Create(warden::db::Transaction& tx, const std::string& name, const std::optional<std::string>& version,
                      const warden::v1::UpdateMeta& meta);
  UpdateRecord Create(const std::string& name, const std::optional<std::string>& version);

  // Throws NotFoundError.
  UpdateRecord Get(int64_t id) const;
  UpdateRecord Get(warden::db::Transaction& tx, int64_t id) const;

  // Overwrites state and meta if the record is still in `expected`.
  // Throws NotFoundError, or ConflictError when another writer moved it.
  void SetState(warden::db::Transaction& tx, int64_t id, warden::model::UpdateState expected, warden::model::UpdateState next,
                const warden::v1::UpdateMeta& meta);

  std::vector<UpdateRecord> ListByState(warden::model::UpdateState state) const;
  std::vector<UpdateRecord> ListAll() const;
  std::vector<UpdateRecord> ListAll(warden::db::Transaction& tx) const;

  std::vector<UpdateRecord> History(const std::string& name, const std::optional<std::string>& version) const;
  std::vector<UpdateRecord> History(warden::db::Transaction& tx, const std::string& name,
                                    const std::optional<std::string>& version) const;

  static warden::v1::UpdateMeta DecodeMeta(const UpdateRecord& record);

 private:
  std::shared_ptr<warden::db::Repository> repository_;
};

} // namespace warden::updates
