#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/ActionLog.hpp"
#include "app/Alerts.hpp"
#include "app/ProcessKiller.hpp"
#include "app/StatsBuffers.hpp"
#include "collectors/IProcessCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Action.hpp"
#include "model/Policy.hpp"

namespace ideguard::app {

struct Decision {
  ideguard::model::ActionKind action{ideguard::model::ActionKind::SkippedBelowThreshold};
  std::string detail;
};

// Summed CPU of the language-server samples the policy allows killing.
[[nodiscard]] double language_server_total(const std::vector<ideguard::model::ProcessSample>& samples,
                                           const ideguard::model::ProtectionPolicy& policy);

// Decision rule for one sample, in order:
//   1. protected role                      -> SkippedProtected
//   2. cpu_percent >= cpu_threshold        -> Killed
//   3. language server and ls_total >= language_server_total_threshold (> 0) -> Killed
//   4. otherwise                           -> SkippedBelowThreshold
[[nodiscard]] Decision decide(const ideguard::model::ProcessSample& s,
                              const ideguard::model::ProtectionPolicy& policy,
                              double ls_total);

// Periodically samples the target's process table and terminates the
// non-protected processes that exceed the policy's CPU threshold.
class Watchdog {
public:
  Watchdog(ideguard::model::ProtectionPolicy policy,
           ideguard::collectors::IProcessCollector& procs,
           IProcessKiller& killer,
           ActionLog& log,
           StatsBuffers* stats = nullptr);
  ~Watchdog();
  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;

  // One sample-classify-act pass. Returns one entry per evaluated sample,
  // ordered by pid. Signals at most once per pid. Cycles are serialized:
  // a call made while the worker is mid-cycle waits for it to finish.
  std::vector<ideguard::model::ActionLogEntry> run_cycle(const ideguard::model::ProtectionPolicy& policy);

  // Same evaluation without signalling or logging
  std::vector<ideguard::model::ActionLogEntry> preview(const ideguard::model::ProtectionPolicy& policy);

  // Run cycles on a worker thread every check_interval until stop().
  // iterations > 0 ends the loop after that many cycles.
  void start(uint64_t iterations = 0);
  void stop();
  [[nodiscard]] bool finished() const { return finished_.load(std::memory_order_acquire); }

  [[nodiscard]] const ideguard::model::ProtectionPolicy& policy() const { return policy_; }

private:
  void run(std::stop_token st, uint64_t iterations);
  std::vector<ideguard::model::ActionLogEntry> evaluate(const ideguard::model::ProtectionPolicy& policy,
                                                        bool act, size_t& vanished);
  void check_memory(const ideguard::model::ProtectionPolicy& policy, ideguard::model::Memory& mem);
  void publish_stats(const std::vector<ideguard::model::ActionLogEntry>& entries, size_t vanished,
                     const ideguard::model::Memory& mem, std::chrono::steady_clock::duration took);

  const ideguard::model::ProtectionPolicy policy_;
  ideguard::collectors::IProcessCollector& procs_;
  IProcessKiller& killer_;
  ActionLog& log_;
  StatsBuffers* stats_;
  ideguard::collectors::MemoryCollector mem_{};
  AlertEngine alerts_;
  int32_t self_pid_;
  int32_t parent_pid_;

  std::mutex cycle_mu_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::atomic<bool> finished_{false};
  std::jthread thread_{};
};

} // namespace ideguard::app
