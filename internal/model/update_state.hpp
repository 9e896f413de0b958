#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::model {

enum class UpdateState : std::uint8_t {
  kPending    = 0,
  kApplied    = 1,
  kFailed     = 2,
  kRolledBack = 3,
};

/*
  Transition table:

    pending -> applied
    pending -> failed
    applied -> rolled_back
    failed  -> rolled_back

  pending is the only initial state. rolled_back is terminal.
*/
constexpr bool CanTransition(UpdateState from, UpdateState to) {
  switch (from) {
    case UpdateState::kPending:
      return to == UpdateState::kApplied || to == UpdateState::kFailed;
    case UpdateState::kApplied:
    case UpdateState::kFailed:
      return to == UpdateState::kRolledBack;
    case UpdateState::kRolledBack:
      return false;
  }
  return false;
}

constexpr bool IsTerminal(UpdateState state) {
  return state == UpdateState::kRolledBack;
}

constexpr bool CanRollback(UpdateState state) {
  return CanTransition(state, UpdateState::kRolledBack);
}

constexpr std::string_view ToString(UpdateState state) {
  switch (state) {
    case UpdateState::kPending:
      return "pending";
    case UpdateState::kApplied:
      return "applied";
    case UpdateState::kFailed:
      return "failed";
    case UpdateState::kRolledBack:
      return "rolled_back";
  }
  return "unknown";
}

constexpr std::optional<UpdateState> ParseUpdateState(std::string_view text) {
  if (text == "pending") return UpdateState::kPending;
  if (text == "applied") return UpdateState::kApplied;
  if (text == "failed") return UpdateState::kFailed;
  if (text == "rolled_back") return UpdateState::kRolledBack;
  return std::nullopt;
}

}  // namespace warden::model
