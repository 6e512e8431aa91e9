// Shared counter for /proc entries that vanished or became unreadable mid-read
#pragma once

#include <cstdint>

namespace ideguard::util {

void note_churn();

// Monotonic total since process start
[[nodiscard]] uint64_t churn_total();

} // namespace ideguard::util
