#pragma once
#include <chrono>
#include <set>
#include "model/Process.hpp"

namespace ideguard::model {

// Immutable watchdog configuration; built once at startup from WatchdogConfig
struct ProtectionPolicy {
  std::set<ProcessRole> protected_roles{ProcessRole::Main, ProcessRole::Renderer};
  double cpu_threshold{20.0};                     // inclusive, ps scale
  std::chrono::seconds check_interval{30};
  // Roles the classifier could not place are never killed while this is set
  bool protect_unknown{true};
  // Summed CPU of all killable language servers that triggers killing them all (0 = off)
  double language_server_total_threshold{0.0};
  double memory_warn_pct{80.0};                   // 0 = off
  bool force_kill{false};                         // SIGKILL instead of SIGTERM

  [[nodiscard]] bool is_protected(ProcessRole r) const {
    if (r == ProcessRole::Unknown && protect_unknown) return true;
    return protected_roles.contains(r);
  }
};

} // namespace ideguard::model
