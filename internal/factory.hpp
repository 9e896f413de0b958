#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/applier/applier.hpp"
#include "internal/core/recovery.hpp"
#include "internal/core/update_locks.hpp"
#include "internal/core/update_state_machine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/updates/update_store.hpp"

namespace warden::factory {

/*
  Runtime

  Owns every long-lived component. All of them share one repository and
  one lock table.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<events::EventLog>          event_log;
  std::shared_ptr<updates::UpdateStore>      store;
  std::shared_ptr<warden::applier::Applier>  applier;
  std::shared_ptr<core::UpdateLocks>         locks;
  std::shared_ptr<core::UpdateStateMachine>  state_machine;
  std::shared_ptr<core::Recovery>            recovery;
};

std::shared_ptr<db::Repository> BuildRepository(const warden::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. The only place that knows concrete backend and
  applier types. With no applier given, a ScriptApplier is built from the
  applier section. Runs recovery before returning when
  recovery.run_on_startup is set.
*/
Runtime Build(const warden::runtime::config::RuntimeConfig& config, std::shared_ptr<applier::Applier> custom_applier = nullptr);

} // namespace warden::factory
