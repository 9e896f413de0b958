#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/event_record.hpp"
#include "warden/v1/event.pb.h"

namespace warden::events {

using Event = warden::db::model::EventRecord;

/*
  Lazy, finite, restartable walk over the whole log in id order.

  Each page is read in its own short transaction; nothing is held
  between calls to Next().
*/
class EventCursor {
 public:
  EventCursor(std::shared_ptr<warden::db::Repository> repository, std::size_t page_size);

  std::optional<Event> Next();

  // Rewind to the first event.
  void Restart();

 private:
  void Fill();

  std::shared_ptr<warden::db::Repository> repository_;
  std::size_t                             page_size_;
  int64_t                                 last_id_ = 0;
  std::vector<Event>                      page_;
  std::size_t                             position_  = 0;
  bool                                    exhausted_ = false;
};

class EventLog {
 public:
  static constexpr std::size_t kDefaultPageSize = 256;

  explicit EventLog(std::shared_ptr<warden::db::Repository> repository);

  // Appends in its own transaction. Throws StorageError; on failure
  // nothing was written.
  Event Append(std::string_view kind, const std::optional<warden::v1::EventPayload>& payload = std::nullopt);

  // Appends inside the caller's transaction so the event commits (or not)
  // together with the caller's other writes.
  Event Append(warden::db::Transaction& tx, std::string_view kind,
               const std::optional<warden::v1::EventPayload>& payload = std::nullopt);

  EventCursor ReadAll(std::size_t page_size = kDefaultPageSize) const;

  std::vector<Event> ReadByReference(int64_t update_id) const;
  std::vector<Event> ReadByReference(warden::db::Transaction& tx, int64_t update_id) const;

  static std::optional<warden::v1::EventPayload> DecodePayload(const Event& event);

 private:
  std::shared_ptr<warden::db::Repository> repository_;
};

} // namespace warden::events
