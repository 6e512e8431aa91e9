#pragma once
#include <array>
#include <cstdint>
#include "model/Memory.hpp"
#include "model/Process.hpp"

namespace ideguard::model {

// Running totals published by the watchdog after every cycle.
// Plain values only so a reader can copy it under the sequence check.
struct WatchdogStats {
  uint64_t seq{};
  uint64_t cycles{};
  uint64_t killed{};
  uint64_t kill_failed{};
  uint64_t skipped_protected{};
  uint64_t skipped_below_threshold{};
  uint64_t vanished{};
  uint64_t proc_churn{};   // unreadable /proc entries, process lifetime
  // Last cycle only
  uint64_t tracked{};
  std::array<uint64_t, kAllRoles.size()> tracked_by_role{};
  double last_cycle_ms{};
  int64_t last_cycle_epoch_ms{};
  Memory mem{};
};

} // namespace ideguard::model
