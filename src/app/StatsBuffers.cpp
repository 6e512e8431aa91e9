#include "app/StatsBuffers.hpp"

namespace ideguard::app {

void StatsBuffers::publish() {
  auto* old_front = front_.load(std::memory_order_relaxed);
  back_->seq = old_front->seq + 1;
  front_.store(back_, std::memory_order_release);
  back_ = old_front;
  // Totals are cumulative, so the next back buffer starts from what was just published
  *back_ = *front_.load(std::memory_order_relaxed);
}

ideguard::model::WatchdogStats StatsBuffers::read() const {
  ideguard::model::WatchdogStats out{};
  uint64_t before = 0, after = 0;
  do {
    before = seq();
    out = front();
    after = seq();
  } while (before != after);
  return out;
}

} // namespace ideguard::app
