#pragma once
#include "model/Memory.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace ideguard::app {

struct Alert {
  std::string severity; // warn|crit
  std::string message;
};

struct AlertRules {
  double mem_high_pct = 80.0;   // warn; 0 disables
  double mem_crit_pct = 95.0;   // crit
  std::chrono::seconds sustain = std::chrono::seconds(0);
};

// System memory pressure check run once per watchdog cycle
class AlertEngine {
public:
  explicit AlertEngine(AlertRules rules = {});
  [[nodiscard]] const AlertRules& rules() const { return rules_; }
  // Replacing the rules restarts the sustain timer
  void set_rules(AlertRules rules);
  std::vector<Alert> evaluate(const ideguard::model::Memory& m,
                              std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
private:
  AlertRules rules_;
  std::chrono::steady_clock::time_point mem_high_since_{};
};

} // namespace ideguard::app
