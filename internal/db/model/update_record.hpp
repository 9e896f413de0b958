#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/update_state.hpp"

namespace warden::db::model {

/*
  Cached lifecycle projection of one update attempt.

  The event log is authoritative; this row exists so the current state
  can be read without a replay.
*/

struct UpdateRecord {
  int64_t                    id = 0;
  std::string                name;
  std::optional<std::string> version;

  warden::model::UpdateState state = warden::model::UpdateState::kPending;

  // JSON text (warden.v1.UpdateMeta)
  std::optional<std::string> meta;

  uint64_t created_at_ms = 0;
};

} // namespace warden::db::model
