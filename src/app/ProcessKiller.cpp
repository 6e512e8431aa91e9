#include "app/ProcessKiller.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>

namespace ideguard::app {

std::string SignalKiller::error_message(int err) {
  switch (err) {
    case EPERM:
      return "permission denied (needs same user or CAP_KILL)";
    case ESRCH:
      return "process not found (already exited)";
    case EINVAL:
      return "invalid signal";
    default:
      return std::string("kill failed: ") + std::strerror(err) + " (errno " + std::to_string(err) + ")";
  }
}

KillResult SignalKiller::kill_process(int32_t pid, bool force) {
  KillResult result;
  // pid <= 1 would address a process group, every process, or init
  if (pid <= 1) {
    result.status = KillStatus::Failed;
    result.error_message = "refusing to signal pid " + std::to_string(pid);
    return result;
  }

  const int sig = force ? SIGKILL : SIGTERM;
  if (::kill(static_cast<pid_t>(pid), sig) == 0) {
    result.status = KillStatus::Sent;
    return result;
  }

  const int err = errno;
  result.error_message = error_message(err);
  if (err == ESRCH) result.status = KillStatus::NotFound;
  else if (err == EPERM) result.status = KillStatus::PermissionDenied;
  else result.status = KillStatus::Failed;
  return result;
}

} // namespace ideguard::app
