#include "update_store.hpp"

#include "internal/db/api/translate.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace warden::updates {

using warden::db::Guarded;
using warden::db::ThrowIfDbError;
using warden::model::UpdateState;

namespace {

std::string Identity(const std::string& name, const std::optional<std::string>& version) {
  return version ? name + "@" + *version : name;
}

// "" and no version name the same update
std::optional<std::string> NormalizeVersion(const std::optional<std::string>& version) {
  if (version && version->empty()) return std::nullopt;
  return version;
}

} // namespace

UpdateStore::UpdateStore(std::shared_ptr<warden::db::Repository> repository) : repository_(std::move(repository)) {
}

UpdateRecord UpdateStore::Create(warden::db::Transaction& tx, const std::string& name, const std::optional<std::string>& version,
                                 const warden::v1::UpdateMeta& meta) {
  UpdateRecord record;
  record.name    = name;
  record.version = NormalizeVersion(version);
  record.state   = UpdateState::kPending;
  record.meta    = warden::util::ToJson(meta);

  ThrowIfDbError(repository_->InsertUpdate(tx, record), "create update " + Identity(name, record.version));
  return record;
}

UpdateRecord UpdateStore::Create(const std::string& name, const std::optional<std::string>& version) {
  return Guarded("create update", [&] {
    auto tx     = repository_->Begin();
    auto record = Create(*tx, name, version, warden::v1::UpdateMeta{});
    tx->Commit();
    return record;
  });
}

UpdateRecord UpdateStore::Get(int64_t id) const {
  return Guarded("get update", [&] {
    auto tx     = repository_->Begin();
    auto record = Get(*tx, id);
    tx->Commit();
    return record;
  });
}

UpdateRecord UpdateStore::Get(warden::db::Transaction& tx, int64_t id) const {
  auto record = Guarded("get update", [&] { return repository_->GetUpdate(tx, id); });
  if (!record) {
    throw warden::util::NotFoundError("update " + std::to_string(id) + " not found");
  }
  return *record;
}

void UpdateStore::SetState(warden::db::Transaction& tx, int64_t id, UpdateState expected, UpdateState next,
                           const warden::v1::UpdateMeta& meta) {
  ThrowIfDbError(repository_->SetUpdateState(tx, id, expected, next, warden::util::ToJson(meta)),
                 "set update " + std::to_string(id) + " to " + std::string(warden::model::ToString(next)));
}

std::vector<UpdateRecord> UpdateStore::ListByState(UpdateState state) const {
  return Guarded("list updates", [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListUpdatesByState(*tx, state);
    tx->Commit();
    return records;
  });
}

std::vector<UpdateRecord> UpdateStore::ListAll() const {
  return Guarded("list updates", [&] {
    auto tx      = repository_->Begin();
    auto records = ListAll(*tx);
    tx->Commit();
    return records;
  });
}

std::vector<UpdateRecord> UpdateStore::ListAll(warden::db::Transaction& tx) const {
  return Guarded("list updates", [&] { return repository_->ListUpdates(tx); });
}

std::vector<UpdateRecord> UpdateStore::History(const std::string& name, const std::optional<std::string>& version) const {
  return Guarded("update history", [&] {
    auto tx      = repository_->Begin();
    auto records = History(*tx, name, version);
    tx->Commit();
    return records;
  });
}

std::vector<UpdateRecord> UpdateStore::History(warden::db::Transaction& tx, const std::string& name,
                                               const std::optional<std::string>& version) const {
  return Guarded("update history", [&] { return repository_->FindUpdates(tx, name, NormalizeVersion(version)); });
}

warden::v1::UpdateMeta UpdateStore::DecodeMeta(const UpdateRecord& record) {
  return warden::util::ParseJsonOr<warden::v1::UpdateMeta>(record.meta);
}

} // namespace warden::updates
