#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::model {

enum class EventKind : std::uint8_t {
  kStarted         = 0,
  kApplied         = 1,
  kFailed          = 2,
  kRollbackStarted = 3,
  kRolledBack      = 4,
  // Written by recovery only.
  kInterrupted     = 5,
  kReconciled      = 6,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kStarted:
      return "update.started";
    case EventKind::kApplied:
      return "update.applied";
    case EventKind::kFailed:
      return "update.failed";
    case EventKind::kRollbackStarted:
      return "update.rollback_started";
    case EventKind::kRolledBack:
      return "update.rolled_back";
    case EventKind::kInterrupted:
      return "update.interrupted";
    case EventKind::kReconciled:
      return "update.reconciled";
  }
  return "update.unknown";
}

// Kinds outside the lifecycle (domain-specific events) parse to nullopt.
constexpr std::optional<EventKind> ParseEventKind(std::string_view text) {
  if (text == "update.started") return EventKind::kStarted;
  if (text == "update.applied") return EventKind::kApplied;
  if (text == "update.failed") return EventKind::kFailed;
  if (text == "update.rollback_started") return EventKind::kRollbackStarted;
  if (text == "update.rolled_back") return EventKind::kRolledBack;
  if (text == "update.interrupted") return EventKind::kInterrupted;
  if (text == "update.reconciled") return EventKind::kReconciled;
  return std::nullopt;
}

}  // namespace warden::model
