#include "script_applier.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace warden::applier {

using warden::observability::IntField;
using warden::observability::StringField;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kKillGrace    = std::chrono::seconds(2);

std::vector<std::string> BuildEnvironment(const UpdateIdentity& update) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    if (std::strncmp(*entry, "WARDEN_UPDATE_", 14) == 0) continue;
    env.emplace_back(*entry);
  }
  env.push_back("WARDEN_UPDATE_ID=" + std::to_string(update.update_id));
  env.push_back("WARDEN_UPDATE_NAME=" + update.name);
  env.push_back("WARDEN_UPDATE_VERSION=" + update.version.value_or(""));
  return env;
}

std::vector<char*> Pointers(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) out.push_back(value.data());
  out.push_back(nullptr);
  return out;
}

// Returns true once the child has been reaped.
bool TryReap(pid_t pid, int& status) {
  for (;;) {
    const pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) return true;
    if (rc == 0) return false;
    if (errno == EINTR) continue;
    throw warden::util::ApplierError(std::string("waitpid failed: ") + std::strerror(errno));
  }
}

// The child leads its own process group so the whole command tree is signalled.
void Terminate(pid_t pid, int& status) {
  kill(-pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + kKillGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (TryReap(pid, status)) return;
    std::this_thread::sleep_for(kPollInterval);
  }
  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

} // namespace

ScriptApplier::ScriptApplier(std::string apply_command, std::string rollback_command, std::chrono::milliseconds timeout)
    : apply_command_(std::move(apply_command)), rollback_command_(std::move(rollback_command)), timeout_(timeout) {
}

ApplierStatus ScriptApplier::Apply(const UpdateIdentity& update) {
  return Run(apply_command_, update);
}

ApplierStatus ScriptApplier::Rollback(const UpdateIdentity& update) {
  return Run(rollback_command_, update);
}

ApplierStatus ScriptApplier::Run(const std::string& command, const UpdateIdentity& update) const {
  if (command.empty()) {
    return ApplierStatus::Ok();
  }

  // Everything the child needs is built before fork.
  std::string              shell = "/bin/sh";
  std::string              flag  = "-c";
  std::string              body  = command;
  std::vector<std::string> args  = {shell, flag, body};
  auto                     env   = BuildEnvironment(update);
  auto                     argv  = Pointers(args);
  auto                     envp  = Pointers(env);

  const pid_t pid = fork();
  if (pid < 0) {
    throw warden::util::ApplierError(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    setpgid(0, 0);
    execve(shell.c_str(), argv.data(), envp.data());
    _exit(127);
  }
  setpgid(pid, pid);

  WARDEN_LOG_DEBUG("applier command started", {StringField("command", command), IntField("pid", pid), IntField("update_id", update.update_id)});

  int        status   = 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (!TryReap(pid, status)) {
    if (timeout_.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
      Terminate(pid, status);
      return ApplierStatus::Failure("cancelled: timeout after " + std::to_string(timeout_.count()) + " ms");
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    if (code == 0) {
      return ApplierStatus::Ok();
    }
    return ApplierStatus::Failure("command exited with status " + std::to_string(code));
  }
  if (WIFSIGNALED(status)) {
    return ApplierStatus::Failure("command killed by signal " + std::to_string(WTERMSIG(status)));
  }
  return ApplierStatus::Failure("command ended abnormally");
}

} // namespace warden::applier
