#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/events/event_log.hpp"
#include "internal/factory.hpp"
#include "internal/model/update_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using warden::factory::Runtime;
using warden::model::UpdateState;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFatal    = 2;
constexpr int kExitFailed   = 3;
constexpr int kExitConflict = 4;
constexpr int kExitMismatch = 5;
constexpr int kExitInvalid  = 6;
constexpr int kExitNotFound = 7;

void Usage() {
  std::cout << "Usage:\n"
            << "  warden [--config FILE] apply <name> [version]\n"
            << "  warden [--config FILE] rollback <update_id>\n"
            << "  warden [--config FILE] recover\n"
            << "  warden [--config FILE] verify\n"
            << "  warden [--config FILE] status <update_id>\n"
            << "  warden [--config FILE] list [pending|applied|failed|rolled_back]\n"
            << "  warden [--config FILE] history <name> [version]\n"
            << "  warden [--config FILE] events [update_id]\n";
}

std::optional<int64_t> ParseId(const std::string& text) {
  try {
    size_t     used = 0;
    const auto id   = std::stoll(text, &used);
    if (used != text.size() || id <= 0) {
      return std::nullopt;
    }
    return id;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<std::string> OptionalArg(const std::vector<std::string>& args, size_t index) {
  if (index < args.size()) {
    return args[index];
  }
  return std::nullopt;
}

void Print(const warden::updates::UpdateRecord& record) {
  std::cout << "id=" << record.id << " name=" << record.name << " version=" << record.version.value_or("-")
            << " state=" << warden::model::ToString(record.state)
            << " created_at=" << warden::util::FormatMillis(record.created_at_ms);
  if (record.meta) {
    std::cout << " meta=" << *record.meta;
  }
  std::cout << "\n";
}

void Print(const warden::events::Event& event) {
  std::cout << "#" << event.id << " " << event.kind << " at=" << warden::util::FormatMillis(event.created_at_ms);
  if (event.payload) {
    std::cout << " " << *event.payload;
  }
  std::cout << "\n";
}

int RunApply(Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    Usage();
    return kExitUsage;
  }
  auto outcome = runtime.state_machine->Apply(args[1], OptionalArg(args, 2));
  Print(outcome.record);
  if (!outcome.ok()) {
    std::cerr << "apply failed: " << *outcome.applier_error << "\n";
    return kExitFailed;
  }
  return kExitOk;
}

int RunRollback(Runtime& runtime, const std::vector<std::string>& args) {
  auto id = args.size() >= 2 ? ParseId(args[1]) : std::nullopt;
  if (!id) {
    Usage();
    return kExitUsage;
  }
  auto outcome = runtime.state_machine->Rollback(*id);
  Print(outcome.record);
  if (!outcome.ok()) {
    std::cerr << "rollback command failed: " << *outcome.applier_error << "\n";
    return kExitFailed;
  }
  return kExitOk;
}

int RunRecover(Runtime& runtime) {
  auto report = runtime.recovery->Run();
  std::cout << "interrupted=" << report.interrupted << " rollbacks_completed=" << report.rollbacks_completed
            << " reconciled=" << report.reconciled << " skipped=" << report.skipped_in_flight
            << " unreadable=" << report.unreadable.size() << " unrecoverable=" << report.unrecoverable.size() << "\n";
  return report.unreadable.empty() && report.unrecoverable.empty() ? kExitOk : kExitMismatch;
}

int RunVerify(Runtime& runtime) {
  auto mismatches = runtime.recovery->Verify();
  for (const auto& mismatch : mismatches) {
    std::cout << "update " << mismatch.update_id << ": cached=" << warden::model::ToString(mismatch.cached)
              << " log=" << (mismatch.projected ? warden::model::ToString(*mismatch.projected) : "none") << " ("
              << mismatch.detail << ")\n";
  }
  if (!mismatches.empty()) {
    return kExitMismatch;
  }
  std::cout << "consistent\n";
  return kExitOk;
}

int RunStatus(Runtime& runtime, const std::vector<std::string>& args) {
  auto id = args.size() >= 2 ? ParseId(args[1]) : std::nullopt;
  if (!id) {
    Usage();
    return kExitUsage;
  }
  Print(runtime.store->Get(*id));
  for (const auto& event : runtime.event_log->ReadByReference(*id)) {
    std::cout << "  ";
    Print(event);
  }
  return kExitOk;
}

int RunList(Runtime& runtime, const std::vector<std::string>& args) {
  std::vector<warden::updates::UpdateRecord> records;
  if (args.size() >= 2) {
    auto state = warden::model::ParseUpdateState(args[1]);
    if (!state) {
      std::cerr << "unknown state: " << args[1] << "\n";
      return kExitUsage;
    }
    records = runtime.store->ListByState(*state);
  } else {
    records = runtime.store->ListAll();
  }
  for (const auto& record : records) {
    Print(record);
  }
  return kExitOk;
}

int RunHistory(Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    Usage();
    return kExitUsage;
  }
  for (const auto& record : runtime.store->History(args[1], OptionalArg(args, 2))) {
    Print(record);
  }
  return kExitOk;
}

int RunEvents(Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() >= 2) {
    auto id = ParseId(args[1]);
    if (!id) {
      Usage();
      return kExitUsage;
    }
    for (const auto& event : runtime.event_log->ReadByReference(*id)) {
      Print(event);
    }
    return kExitOk;
  }

  auto cursor = runtime.event_log->ReadAll();
  while (auto event = cursor.Next()) {
    Print(*event);
  }
  return kExitOk;
}

int Dispatch(Runtime& runtime, const std::vector<std::string>& args) {
  const auto& cmd = args[0];
  if (cmd == "apply") return RunApply(runtime, args);
  if (cmd == "rollback") return RunRollback(runtime, args);
  if (cmd == "recover") return RunRecover(runtime);
  if (cmd == "verify") return RunVerify(runtime);
  if (cmd == "status") return RunStatus(runtime, args);
  if (cmd == "list") return RunList(runtime, args);
  if (cmd == "history") return RunHistory(runtime, args);
  if (cmd == "events") return RunEvents(runtime, args);

  std::cerr << "unknown command: " << cmd << "\n";
  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && args.empty()) {
      if (i + 1 >= argc) {
        Usage();
        return kExitUsage;
      }
      config_path = argv[++i];
      continue;
    }
    args.push_back(std::move(arg));
  }

  if (args.empty()) {
    Usage();
    return kExitUsage;
  }

  int code = kExitOk;
  try {
    auto config = warden::config::ConfigLoader::Load(config_path);

    // read-only commands never repair
    if (args[0] != "apply" && args[0] != "rollback") {
      config.mutable_recovery()->set_run_on_startup(false);
    }

    warden::observability::InitializeLogging(config);

    auto runtime = warden::factory::Build(config);
    code         = Dispatch(runtime, args);
  } catch (const warden::util::ConflictError& e) {
    std::cerr << "conflict: " << e.what() << "\n";
    code = kExitConflict;
  } catch (const warden::util::InvalidTransitionError& e) {
    std::cerr << "invalid transition: " << e.what() << "\n";
    code = kExitInvalid;
  } catch (const warden::util::NotFoundError& e) {
    std::cerr << "not found: " << e.what() << "\n";
    code = kExitNotFound;
  } catch (const std::exception& e) {
    WARDEN_LOG_ERROR("fatal error", {warden::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    code = kExitFatal;
  }

  warden::observability::ShutdownLogging();
  return code;
}
