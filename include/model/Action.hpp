#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include "model/Process.hpp"

namespace ideguard::model {

enum class ActionKind {
  Killed,
  SkippedProtected,
  SkippedBelowThreshold,
  KillFailed
};

[[nodiscard]] constexpr std::string_view action_name(ActionKind a) {
  switch (a) {
    case ActionKind::Killed:                return "killed";
    case ActionKind::SkippedProtected:      return "skipped_protected";
    case ActionKind::SkippedBelowThreshold: return "skipped_below_threshold";
    case ActionKind::KillFailed:            return "kill_failed";
  }
  return "unknown";
}

// One line of the append-only action log; one per evaluated sample
struct ActionLogEntry {
  std::chrono::system_clock::time_point timestamp;
  int32_t pid{};
  ProcessRole role{ProcessRole::Unknown};
  double cpu_percent{};
  double memory_percent{};
  ActionKind action{ActionKind::SkippedBelowThreshold};
  std::string command;
  std::string detail;   // failure reason or rule note; empty when nothing to add
};

} // namespace ideguard::model
