#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace warden::db::model {

/*
  Immutable event row.

  - id and created_at_ms are assigned by the repository at append time.
  - payload is JSON text (warden.v1.EventPayload) or absent.
  - update_id duplicates the payload reference so lookups by update stay
    indexed.
*/

struct EventRecord {
  int64_t                    id = 0;
  std::string                kind;
  std::optional<std::string> payload;
  std::optional<int64_t>     update_id;
  uint64_t                   created_at_ms = 0;
};

} // namespace warden::db::model
