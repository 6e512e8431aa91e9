#include "app/MetricsServer.hpp"
#include "model/Action.hpp"
#include <charconv>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// Label values here are fixed enum names: no escaping needed
void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";  out += lv;
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

} // anonymous namespace

namespace ideguard::app {

using ideguard::model::ActionKind;
using ideguard::model::action_name;

std::string stats_to_prometheus(const ideguard::model::WatchdogStats& s) {
  std::string out;
  out.reserve(2048);

  emit_header(out, "ideguard_cycles_total", "Watchdog cycles completed", "counter");
  emit_u(out, "ideguard_cycles_total", s.cycles);

  emit_header(out, "ideguard_actions_total", "Per-process decisions by outcome", "counter");
  emit_labeled_u(out, "ideguard_actions_total", "action", action_name(ActionKind::Killed), s.killed);
  emit_labeled_u(out, "ideguard_actions_total", "action", action_name(ActionKind::KillFailed), s.kill_failed);
  emit_labeled_u(out, "ideguard_actions_total", "action", action_name(ActionKind::SkippedProtected), s.skipped_protected);
  emit_labeled_u(out, "ideguard_actions_total", "action", action_name(ActionKind::SkippedBelowThreshold),
                 s.skipped_below_threshold);

  emit_header(out, "ideguard_kill_failures_total", "Signals that could not be delivered", "counter");
  emit_u(out, "ideguard_kill_failures_total", s.kill_failed);

  emit_header(out, "ideguard_vanished_total", "Processes that exited between listing and reading", "counter");
  emit_u(out, "ideguard_vanished_total", s.vanished);

  emit_header(out, "ideguard_proc_churn_total", "/proc entries that became unreadable mid-read", "counter");
  emit_u(out, "ideguard_proc_churn_total", s.proc_churn);

  emit_header(out, "ideguard_tracked_processes", "Target processes seen in the last cycle", "gauge");
  emit_u(out, "ideguard_tracked_processes", s.tracked);

  emit_header(out, "ideguard_tracked_processes_by_role", "Target processes in the last cycle by role", "gauge");
  for (size_t i = 0; i < ideguard::model::kAllRoles.size(); ++i) {
    emit_labeled_u(out, "ideguard_tracked_processes_by_role", "role",
                   ideguard::model::role_name(ideguard::model::kAllRoles[i]), s.tracked_by_role[i]);
  }

  emit_header(out, "ideguard_memory_used_percent", "System memory in use at the last cycle", "gauge");
  emit_d(out, "ideguard_memory_used_percent", s.mem.used_pct);

  emit_header(out, "ideguard_last_cycle_duration_seconds", "Wall time of the last cycle", "gauge");
  emit_d(out, "ideguard_last_cycle_duration_seconds", s.last_cycle_ms / 1000.0);

  emit_header(out, "ideguard_last_cycle_timestamp_seconds", "Unix time the last cycle finished", "gauge");
  emit_d(out, "ideguard_last_cycle_timestamp_seconds", static_cast<double>(s.last_cycle_epoch_ms) / 1000.0);

  return out;
}

} // namespace ideguard::app
