#include "app/Watchdog.hpp"
#include "util/Churn.hpp"
#include <algorithm>
#include <cstdio>
#include <unistd.h>

namespace ideguard::app {

using ideguard::model::ActionKind;
using ideguard::model::ActionLogEntry;
using ideguard::model::ProcessRole;
using ideguard::model::ProcessSample;
using ideguard::model::ProtectionPolicy;

double language_server_total(const std::vector<ProcessSample>& samples, const ProtectionPolicy& policy) {
  if (policy.is_protected(ProcessRole::LanguageServer)) return 0.0;
  double total = 0.0;
  for (const auto& s : samples) {
    if (s.role == ProcessRole::LanguageServer) total += s.cpu_percent;
  }
  return total;
}

Decision decide(const ProcessSample& s, const ProtectionPolicy& policy, double ls_total) {
  if (policy.is_protected(s.role)) return {ActionKind::SkippedProtected, {}};
  if (s.cpu_percent >= policy.cpu_threshold) return {ActionKind::Killed, {}};
  if (s.role == ProcessRole::LanguageServer && policy.language_server_total_threshold > 0.0 &&
      ls_total >= policy.language_server_total_threshold) {
    char detail[64];
    std::snprintf(detail, sizeof(detail), "language servers aggregate %.1f%%", ls_total);
    return {ActionKind::Killed, detail};
  }
  return {ActionKind::SkippedBelowThreshold, {}};
}

Watchdog::Watchdog(ProtectionPolicy policy,
                   ideguard::collectors::IProcessCollector& procs,
                   IProcessKiller& killer,
                   ActionLog& log,
                   StatsBuffers* stats)
    : policy_(std::move(policy)), procs_(procs), killer_(killer), log_(log), stats_(stats),
      self_pid_(static_cast<int32_t>(::getpid())), parent_pid_(static_cast<int32_t>(::getppid())) {}

Watchdog::~Watchdog() { stop(); }

std::vector<ActionLogEntry> Watchdog::evaluate(const ProtectionPolicy& policy, bool act, size_t& vanished) {
  std::vector<ActionLogEntry> entries;
  ideguard::model::ProcessTable table;
  if (!procs_.sample(table)) {
    if (act) log_.note("error", std::string("process table unavailable from ") + procs_.name());
    return entries;
  }
  vanished = table.vanished;

  // Fixed evaluation order makes the outcome independent of /proc listing order
  auto& samples = table.processes;
  std::sort(samples.begin(), samples.end(),
            [](const ProcessSample& a, const ProcessSample& b){ return a.pid < b.pid; });
  samples.erase(std::unique(samples.begin(), samples.end(),
                            [](const ProcessSample& a, const ProcessSample& b){ return a.pid == b.pid; }),
                samples.end());

  const double ls_total = language_server_total(samples, policy);
  const auto now = std::chrono::system_clock::now();
  entries.reserve(samples.size());

  for (auto& s : samples) {
    Decision d = decide(s, policy, ls_total);
    if (s.pid == self_pid_ || s.pid == parent_pid_) d = {ActionKind::SkippedProtected, "watchdog itself"};

    if (act && d.action == ActionKind::Killed) {
      auto r = killer_.kill_process(s.pid, policy.force_kill);
      if (!r.ok()) {
        d.action = ActionKind::KillFailed;
        d.detail = r.error_message.empty() ? std::string(kill_status_name(r.status)) : r.error_message;
      }
    }

    ActionLogEntry e;
    e.timestamp = now;
    e.pid = s.pid;
    e.role = s.role;
    e.cpu_percent = s.cpu_percent;
    e.memory_percent = s.memory_percent;
    e.action = d.action;
    e.command = std::move(s.command);
    e.detail = std::move(d.detail);
    if (act) log_.append(e);
    entries.push_back(std::move(e));
  }
  return entries;
}

std::vector<ActionLogEntry> Watchdog::run_cycle(const ProtectionPolicy& policy) {
  std::scoped_lock lk(cycle_mu_);
  const auto t0 = std::chrono::steady_clock::now();
  size_t vanished = 0;
  auto entries = evaluate(policy, true, vanished);
  ideguard::model::Memory mem{};
  check_memory(policy, mem);
  publish_stats(entries, vanished, mem, std::chrono::steady_clock::now() - t0);
  return entries;
}

std::vector<ActionLogEntry> Watchdog::preview(const ProtectionPolicy& policy) {
  std::scoped_lock lk(cycle_mu_);
  size_t vanished = 0;
  return evaluate(policy, false, vanished);
}

void Watchdog::check_memory(const ProtectionPolicy& policy, ideguard::model::Memory& mem) {
  // The threshold follows the policy of the current cycle
  if (alerts_.rules().mem_high_pct != policy.memory_warn_pct) {
    AlertRules rules = alerts_.rules();
    rules.mem_high_pct = policy.memory_warn_pct;
    alerts_.set_rules(rules);
  }
  if (policy.memory_warn_pct <= 0.0) return;
  if (!mem_.sample(mem)) return;
  for (const auto& a : alerts_.evaluate(mem)) log_.note(a.severity == "crit" ? "error" : "warn", a.message);
}

void Watchdog::publish_stats(const std::vector<ActionLogEntry>& entries, size_t vanished,
                             const ideguard::model::Memory& mem, std::chrono::steady_clock::duration took) {
  if (!stats_) return;
  auto& st = stats_->back();
  st.cycles++;
  st.vanished += vanished;
  st.tracked = entries.size();
  st.tracked_by_role.fill(0);
  for (const auto& e : entries) {
    st.tracked_by_role[static_cast<size_t>(e.role)]++;
    switch (e.action) {
      case ActionKind::Killed:                st.killed++; break;
      case ActionKind::KillFailed:            st.kill_failed++; break;
      case ActionKind::SkippedProtected:      st.skipped_protected++; break;
      case ActionKind::SkippedBelowThreshold: st.skipped_below_threshold++; break;
    }
  }
  st.mem = mem;
  st.proc_churn = ideguard::util::churn_total();
  st.last_cycle_ms = std::chrono::duration<double, std::milli>(took).count();
  st.last_cycle_epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  stats_->publish();
}

void Watchdog::start(uint64_t iterations) {
  if (thread_.joinable()) return;
  finished_.store(false, std::memory_order_release);
  thread_ = std::jthread([this, iterations](std::stop_token st){ run(st, iterations); });
}

void Watchdog::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Watchdog::run(std::stop_token st, uint64_t iterations) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "watchdog started: threshold %.1f%%, interval %llds, collector %s",
                policy_.cpu_threshold, static_cast<long long>(policy_.check_interval.count()), procs_.name());
  log_.note("info", buf);

  for (uint64_t done = 0;;) {
    const auto next = std::chrono::steady_clock::now() + policy_.check_interval;
    run_cycle(policy_);
    if (iterations > 0 && ++done >= iterations) break;
    // Sleep until the next tick; a stop request wakes us immediately
    std::unique_lock<std::mutex> lk(mu_);
    if (cv_.wait_until(lk, st, next, []{ return false; }) || st.stop_requested()) break;
  }

  log_.note("info", "watchdog stopped");
  finished_.store(true, std::memory_order_release);
}

} // namespace ideguard::app
