#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace warden::db::memory {

using warden::model::UpdateState;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();

  uint64_t created_at = warden::util::NowMillis();
  if (!s.events.empty()) {
    created_at = std::max(created_at, s.events.back().created_at_ms);
  }

  r.id            = s.next_event_id++;
  r.created_at_ms = created_at;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, int64_t after_id, std::size_t limit) {
  const auto& s = TX(t).View();

  // events are stored in id order
  auto it = std::upper_bound(s.events.begin(), s.events.end(), after_id,
                             [](int64_t id, const model::EventRecord& e) { return id < e.id; });

  std::vector<model::EventRecord> out;
  for (; it != s.events.end() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

std::vector<model::EventRecord> MemoryRepository::ListEventsForUpdate(Transaction& t, int64_t update_id) {
  std::vector<model::EventRecord> out;
  for (const auto& e : TX(t).View().events)
    if (e.update_id && *e.update_id == update_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Updates
// ------------------------------------------------------------------

Result MemoryRepository::InsertUpdate(Transaction& t, model::UpdateRecord& r) {
  auto& s = TX(t).Mutable();

  for (const auto& [_, existing] : s.updates) {
    if (existing.state == UpdateState::kPending && existing.name == r.name &&
        existing.version.value_or("") == r.version.value_or("")) {
      return Result::Err(ErrorCode::AlreadyExists, "pending update exists for " + r.name);
    }
  }

  r.id            = s.next_update_id++;
  r.state         = UpdateState::kPending;
  r.created_at_ms = warden::util::NowMillis();
  s.updates[r.id] = r;
  return Result::Ok();
}

std::optional<model::UpdateRecord> MemoryRepository::GetUpdate(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.updates.find(id);
  if (it == s.updates.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetUpdateState(Transaction& t, int64_t id, UpdateState expected, UpdateState next,
                                        const std::optional<std::string>& meta) {
  auto& s  = TX(t).Mutable();
  auto  it = s.updates.find(id);
  if (it == s.updates.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.state != expected) {
    return Result::Err(ErrorCode::Conflict, "update state is " + std::string(warden::model::ToString(it->second.state)));
  }
  it->second.state = next;
  it->second.meta  = meta;
  return Result::Ok();
}

std::vector<model::UpdateRecord> MemoryRepository::ListUpdatesByState(Transaction& t, UpdateState state) {
  std::vector<model::UpdateRecord> out;
  for (const auto& [_, record] : TX(t).View().updates)
    if (record.state == state) out.push_back(record);
  return out;
}

std::vector<model::UpdateRecord> MemoryRepository::ListUpdates(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::UpdateRecord> records;
  records.reserve(s.updates.size());
  for (const auto& [_, record] : s.updates) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::UpdateRecord> MemoryRepository::FindUpdates(Transaction& t, const std::string& name,
                                                               const std::optional<std::string>& version) {
  std::vector<model::UpdateRecord> out;
  for (const auto& [_, record] : TX(t).View().updates)
    if (record.name == name && record.version.value_or("") == version.value_or("")) out.push_back(record);
  return out;
}

} // namespace warden::db::memory
