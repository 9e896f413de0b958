#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/applier/script_applier.hpp"
#include "internal/db/api/translate.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if WARDEN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace warden::factory {

using warden::observability::BoolField;
using warden::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const warden::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WARDEN_DB_SQLITE
    const auto& sqlite = database.sqlite();

    const auto parent = std::filesystem::path(sqlite.path()).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent);
    }

    db::sqlite::SqliteOptions options;
    options.busy_timeout_ms = sqlite.busy_timeout_ms();
    options.synchronous     = sqlite.synchronous();

    auto sqlite_db = db::Guarded("open " + sqlite.path(), [&] {
      auto handle = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
      db::sqlite::BootstrapSchema(*handle);
      return handle;
    });
    WARDEN_LOG_INFO("database opened", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  WARDEN_LOG_INFO("database opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime Build(const warden::runtime::config::RuntimeConfig& config, std::shared_ptr<applier::Applier> custom_applier) {
  Runtime runtime;
  runtime.repository = BuildRepository(config);
  runtime.event_log  = std::make_shared<events::EventLog>(runtime.repository);
  runtime.store      = std::make_shared<updates::UpdateStore>(runtime.repository);
  runtime.locks      = std::make_shared<core::UpdateLocks>();

  if (custom_applier) {
    runtime.applier = std::move(custom_applier);
  } else {
    const auto& section = config.applier();
    runtime.applier     = std::make_shared<applier::ScriptApplier>(section.apply_command(), section.rollback_command(),
                                                               std::chrono::milliseconds(section.timeout_ms()));
  }

  runtime.state_machine = std::make_shared<core::UpdateStateMachine>(runtime.repository, runtime.event_log, runtime.store,
                                                                     runtime.applier, runtime.locks);
  runtime.recovery = std::make_shared<core::Recovery>(runtime.repository, runtime.event_log, runtime.store, runtime.locks);

  const bool run_recovery = config.recovery().has_run_on_startup() && config.recovery().run_on_startup();
  WARDEN_LOG_DEBUG("runtime built", {BoolField("startup_recovery", run_recovery)});
  if (run_recovery) {
    runtime.recovery->Run();
  }

  return runtime;
}

} // namespace warden::factory
