#include "util/Churn.hpp"

#include <atomic>

namespace ideguard::util {

static std::atomic<uint64_t> g_total{0};

void note_churn() { g_total.fetch_add(1, std::memory_order_relaxed); }

uint64_t churn_total() { return g_total.load(std::memory_order_relaxed); }

} // namespace ideguard::util
