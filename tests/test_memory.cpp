#include "minitest.hpp"
#include "collectors/MemoryCollector.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root() {
  auto root = fs::temp_directory_path() / fs::path("ideguard_test_mem_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(memory_collector_parses_meminfo) {
  auto root = make_root();
  std::ofstream(root / "proc/meminfo") <<
    "MemTotal:       2097152 kB\n"
    "MemAvailable:   1048576 kB\n"
    "MemFree:         524288 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n"
    "SwapTotal:       100000 kB\n"
    "SwapFree:         40000 kB\n";
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);
  ideguard::collectors::MemoryCollector c; ideguard::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.total_kb, 2097152u);
  ASSERT_EQ(m.used_kb, 1048576u);
  ASSERT_EQ(m.swap_used_kb, 60000u);
  ASSERT_NEAR(m.used_pct, 50.0, 1.0);
  unsetenv("IDEGUARD_PROC_ROOT");
}

TEST(memory_collector_without_memavailable) {
  auto root = make_root();
  std::ofstream(root / "proc/meminfo") <<
    "MemTotal:       1000000 kB\n"
    "MemFree:         100000 kB\n"
    "Buffers:          50000 kB\n"
    "Cached:           50000 kB\n";
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);
  ideguard::collectors::MemoryCollector c; ideguard::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.available_kb, 200000u);
  ASSERT_EQ(m.used_kb, 800000u);
  unsetenv("IDEGUARD_PROC_ROOT");
}

TEST(memory_collector_empty_meminfo_fails) {
  auto root = make_root();
  std::ofstream(root / "proc/meminfo") << "";
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);
  ideguard::collectors::MemoryCollector c; ideguard::model::Memory m{};
  ASSERT_TRUE(!c.sample(m));
  unsetenv("IDEGUARD_PROC_ROOT");
}
