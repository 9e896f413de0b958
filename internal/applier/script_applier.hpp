#pragma once

#include <chrono>
#include <string>

#include "internal/applier/applier.hpp"

namespace warden::applier {

/*
  Runs a shell command per operation:

    /bin/sh -c <command>

  with WARDEN_UPDATE_ID, WARDEN_UPDATE_NAME and WARDEN_UPDATE_VERSION
  exported. Exit status 0 is success. When a timeout is set the child is
  sent SIGTERM (then SIGKILL) once it expires and the attempt fails as
  cancelled. An empty command succeeds without running anything.
*/
class ScriptApplier final : public Applier {
 public:
  ScriptApplier(std::string apply_command, std::string rollback_command, std::chrono::milliseconds timeout);

  ApplierStatus Apply(const UpdateIdentity& update) override;
  ApplierStatus Rollback(const UpdateIdentity& update) override;

 private:
  ApplierStatus Run(const std::string& command, const UpdateIdentity& update) const;

  std::string               apply_command_;
  std::string               rollback_command_;
  std::chrono::milliseconds timeout_;
};

} // namespace warden::applier
