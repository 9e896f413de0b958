#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace warden::testing {

/*
  Forwards to an inner repository; while fail_writes is set every write
  reports IOError the way a full disk does.
*/
class FailingRepository final : public warden::db::Repository {
 public:
  explicit FailingRepository(std::shared_ptr<warden::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::atomic<bool> fail_writes{false};

  std::unique_ptr<warden::db::Transaction> Begin() override {
    return inner_->Begin();
  }

  warden::db::Result AppendEvent(warden::db::Transaction& tx, warden::db::model::EventRecord& record) override {
    if (fail_writes) return DiskFull();
    return inner_->AppendEvent(tx, record);
  }

  std::vector<warden::db::model::EventRecord> ListEvents(warden::db::Transaction& tx, int64_t after_id, std::size_t limit) override {
    return inner_->ListEvents(tx, after_id, limit);
  }

  std::vector<warden::db::model::EventRecord> ListEventsForUpdate(warden::db::Transaction& tx, int64_t update_id) override {
    return inner_->ListEventsForUpdate(tx, update_id);
  }

  warden::db::Result InsertUpdate(warden::db::Transaction& tx, warden::db::model::UpdateRecord& record) override {
    if (fail_writes) return DiskFull();
    return inner_->InsertUpdate(tx, record);
  }

  std::optional<warden::db::model::UpdateRecord> GetUpdate(warden::db::Transaction& tx, int64_t id) override {
    return inner_->GetUpdate(tx, id);
  }

  warden::db::Result SetUpdateState(warden::db::Transaction& tx, int64_t id, warden::model::UpdateState expected,
                                    warden::model::UpdateState next, const std::optional<std::string>& meta) override {
    if (fail_writes) return DiskFull();
    return inner_->SetUpdateState(tx, id, expected, next, meta);
  }

  std::vector<warden::db::model::UpdateRecord> ListUpdatesByState(warden::db::Transaction& tx, warden::model::UpdateState state) override {
    return inner_->ListUpdatesByState(tx, state);
  }

  std::vector<warden::db::model::UpdateRecord> ListUpdates(warden::db::Transaction& tx) override {
    return inner_->ListUpdates(tx);
  }

  std::vector<warden::db::model::UpdateRecord> FindUpdates(warden::db::Transaction& tx, const std::string& name,
                                                           const std::optional<std::string>& version) override {
    return inner_->FindUpdates(tx, name, version);
  }

 private:
  static warden::db::Result DiskFull() {
    return warden::db::Result::Err(warden::db::ErrorCode::IOError, "database or disk is full");
  }

  std::shared_ptr<warden::db::Repository> inner_;
};

} // namespace warden::testing
