#pragma once
#include <atomic>
#include <cstdint>
#include "model/Stats.hpp"

namespace ideguard::app {

// Lock-free double buffer for WatchdogStats: the watchdog thread fills back()
// and publishes; readers copy front() and retry if seq() moved meanwhile.
class StatsBuffers {
public:
  StatsBuffers() = default;
  StatsBuffers(const StatsBuffers&) = delete;
  StatsBuffers& operator=(const StatsBuffers&) = delete;

  ideguard::model::WatchdogStats& back() { return *back_; }
  void publish(); // atomic swap front/back

  const ideguard::model::WatchdogStats& front() const { return *front_.load(std::memory_order_acquire); }
  uint64_t seq() const { return front().seq; }

  // Consistent copy of the published stats
  [[nodiscard]] ideguard::model::WatchdogStats read() const;

private:
  alignas(64) ideguard::model::WatchdogStats a_{};
  alignas(64) ideguard::model::WatchdogStats b_{};
  std::atomic<ideguard::model::WatchdogStats*> front_{&a_};
  ideguard::model::WatchdogStats* back_{&b_};
};

} // namespace ideguard::app
