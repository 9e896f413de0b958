#include "event_log.hpp"

#include <string>

#include "internal/db/api/translate.hpp"
#include "internal/util/json.hpp"

namespace warden::events {

using warden::db::Guarded;
using warden::db::ThrowIfDbError;

EventCursor::EventCursor(std::shared_ptr<warden::db::Repository> repository, std::size_t page_size)
    : repository_(std::move(repository)), page_size_(page_size == 0 ? 1 : page_size) {
}

void EventCursor::Fill() {
  page_ = Guarded("read events", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListEvents(*tx, last_id_, page_size_);
    tx->Commit();
    return rows;
  });
  position_ = 0;
  if (page_.size() < page_size_) {
    exhausted_ = true;
  }
}

std::optional<Event> EventCursor::Next() {
  if (position_ >= page_.size()) {
    if (exhausted_) {
      return std::nullopt;
    }
    Fill();
    if (page_.empty()) {
      return std::nullopt;
    }
  }
  const auto& event = page_[position_++];
  last_id_          = event.id;
  return event;
}

void EventCursor::Restart() {
  last_id_   = 0;
  position_  = 0;
  exhausted_ = false;
  page_.clear();
}

EventLog::EventLog(std::shared_ptr<warden::db::Repository> repository) : repository_(std::move(repository)) {
}

Event EventLog::Append(std::string_view kind, const std::optional<warden::v1::EventPayload>& payload) {
  return Guarded("append event", [&] {
    auto tx    = repository_->Begin();
    auto event = Append(*tx, kind, payload);
    tx->Commit();
    return event;
  });
}

Event EventLog::Append(warden::db::Transaction& tx, std::string_view kind, const std::optional<warden::v1::EventPayload>& payload) {
  Event event;
  event.kind = std::string(kind);
  if (payload) {
    event.payload = warden::util::ToJson(*payload);
    if (payload->update_id() != 0) {
      event.update_id = payload->update_id();
    }
  }

  ThrowIfDbError(repository_->AppendEvent(tx, event), "append " + event.kind);
  return event;
}

EventCursor EventLog::ReadAll(std::size_t page_size) const {
  return EventCursor(repository_, page_size);
}

std::vector<Event> EventLog::ReadByReference(int64_t update_id) const {
  return Guarded("read events", [&] {
    auto tx     = repository_->Begin();
    auto events = repository_->ListEventsForUpdate(*tx, update_id);
    tx->Commit();
    return events;
  });
}

std::vector<Event> EventLog::ReadByReference(warden::db::Transaction& tx, int64_t update_id) const {
  return Guarded("read events", [&] { return repository_->ListEventsForUpdate(tx, update_id); });
}

std::optional<warden::v1::EventPayload> EventLog::DecodePayload(const Event& event) {
  if (!event.payload) {
    return std::nullopt;
  }
  warden::v1::EventPayload payload;
  warden::util::FromJson(*event.payload, &payload);
  return payload;
}

} // namespace warden::events
