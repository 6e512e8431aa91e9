#pragma once
#include "model/Process.hpp"

namespace ideguard::collectors {

// Source of the target application's process table. The watchdog only
// depends on this interface so tests can feed it synthetic tables.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Sample the current table into out (replacing its contents). Return true on success.
  [[nodiscard]] virtual bool sample(ideguard::model::ProcessTable& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace ideguard::collectors
