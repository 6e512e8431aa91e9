#pragma once
#include <cstdint>

namespace ideguard::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t available_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_used_kb{};
  double   used_pct{}; // 0..100
};

} // namespace ideguard::model
