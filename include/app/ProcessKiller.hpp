#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ideguard::app {

enum class KillStatus {
  Sent,
  NotFound,          // ESRCH: exited before the signal landed
  PermissionDenied,  // EPERM: different owner and no CAP_KILL
  Failed
};

[[nodiscard]] constexpr std::string_view kill_status_name(KillStatus s) {
  switch (s) {
    case KillStatus::Sent:             return "sent";
    case KillStatus::NotFound:         return "not_found";
    case KillStatus::PermissionDenied: return "permission_denied";
    case KillStatus::Failed:           return "failed";
  }
  return "failed";
}

struct KillResult {
  KillStatus status{KillStatus::Failed};
  std::string error_message;

  [[nodiscard]] bool ok() const { return status == KillStatus::Sent; }
};

class IProcessKiller {
public:
  virtual ~IProcessKiller() = default;

  // Deliver SIGTERM (or SIGKILL when force) to pid. Never blocks.
  virtual KillResult kill_process(int32_t pid, bool force) = 0;
};

class SignalKiller : public IProcessKiller {
public:
  KillResult kill_process(int32_t pid, bool force) override;

private:
  static std::string error_message(int err);
};

} // namespace ideguard::app
