#include "app/Alerts.hpp"
#include <cstdio>

namespace ideguard::app {

AlertEngine::AlertEngine(AlertRules rules) : rules_(rules) {}

void AlertEngine::set_rules(AlertRules rules) {
  rules_ = rules;
  mem_high_since_ = {};
}

std::vector<Alert> AlertEngine::evaluate(const ideguard::model::Memory& m,
                                         std::chrono::steady_clock::time_point now) {
  std::vector<Alert> out;
  if (rules_.mem_high_pct <= 0.0 || m.total_kb == 0) return out;

  if (m.used_pct >= rules_.mem_high_pct) {
    if (mem_high_since_.time_since_epoch().count() == 0) mem_high_since_ = now;
    if (now - mem_high_since_ >= rules_.sustain) {
      char msg[128];
      std::snprintf(msg, sizeof(msg), "memory usage %.1f%% (%llu of %llu MB used)", m.used_pct,
                    static_cast<unsigned long long>(m.used_kb / 1024),
                    static_cast<unsigned long long>(m.total_kb / 1024));
      out.push_back({m.used_pct >= rules_.mem_crit_pct ? "crit" : "warn", msg});
    }
  } else {
    mem_high_since_ = {};
  }
  return out;
}

} // namespace ideguard::app
