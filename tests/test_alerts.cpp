#include "minitest.hpp"
#include "app/Alerts.hpp"

static ideguard::model::Memory mem(double pct) {
  ideguard::model::Memory m{};
  m.total_kb = 1000000;
  m.used_kb = static_cast<uint64_t>(pct * 10000);
  m.used_pct = pct;
  return m;
}

TEST(alert_memory_warn_and_crit) {
  ideguard::app::AlertEngine eng({.mem_high_pct = 80.0, .mem_crit_pct = 95.0, .sustain = std::chrono::seconds(0)});
  ASSERT_TRUE(eng.evaluate(mem(50.0)).empty());
  auto warn = eng.evaluate(mem(80.0));
  ASSERT_EQ(warn.size(), 1u);
  ASSERT_EQ(warn[0].severity, std::string("warn"));
  ASSERT_TRUE(warn[0].message.find("80.0%") != std::string::npos);
  auto crit = eng.evaluate(mem(97.0));
  ASSERT_EQ(crit[0].severity, std::string("crit"));
}

TEST(alert_memory_sustain) {
  using namespace std::chrono;
  ideguard::app::AlertEngine eng({.mem_high_pct = 80.0, .mem_crit_pct = 95.0, .sustain = seconds(60)});
  auto t0 = steady_clock::time_point(seconds(1000));
  ASSERT_TRUE(eng.evaluate(mem(85.0), t0).empty());
  ASSERT_TRUE(eng.evaluate(mem(85.0), t0 + seconds(30)).empty());
  ASSERT_EQ(eng.evaluate(mem(85.0), t0 + seconds(61)).size(), 1u);
  // Dropping below resets the timer
  ASSERT_TRUE(eng.evaluate(mem(10.0), t0 + seconds(62)).empty());
  ASSERT_TRUE(eng.evaluate(mem(85.0), t0 + seconds(63)).empty());
}

TEST(alert_disabled) {
  ideguard::app::AlertEngine eng({.mem_high_pct = 0.0});
  ASSERT_TRUE(eng.evaluate(mem(99.0)).empty());
}
