#include "minitest.hpp"
#include "collectors/ProcessCollector.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using ideguard::model::ProcessRole;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("ideguard_test_proc_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

static void write_text(const fs::path& p, const std::string& s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

// Fields after comm: state ppid pgrp session tty tpgid flags minflt cminflt majflt cmajflt
// utime stime cutime cstime priority nice threads itreal starttime vsize rss
static std::string stat_line(int pid, const char* comm, unsigned long utime, unsigned long stime,
                             unsigned long starttime, long rss_pages) {
  return std::to_string(pid) + " (" + comm + ") S 1 1 1 0 -1 0 0 0 0 0 " +
         std::to_string(utime) + " " + std::to_string(stime) + " 0 0 20 0 4 0 " +
         std::to_string(starttime) + " 100000 " + std::to_string(rss_pages) + "\n";
}

static void add_proc(const fs::path& root, int pid, const std::string& cmdline_nul, const std::string& stat) {
  auto dir = root / "proc" / std::to_string(pid);
  write_text(dir / "cmdline", cmdline_nul);
  write_text(dir / "stat", stat);
}

static std::string nul_join(std::initializer_list<const char*> parts) {
  std::string out;
  for (const char* p : parts) { out += p; out.push_back('\0'); }
  return out;
}

TEST(process_collector_filters_and_classifies) {
  auto root = make_root("classify");
  const long hz = ::sysconf(_SC_CLK_TCK);
  write_text(root / "proc/uptime", "1000.00 4000.00\n");
  write_text(root / "proc/meminfo", "MemTotal: 1000000 kB\nMemAvailable: 500000 kB\n");
  add_proc(root, 4101, nul_join({"/opt/Cursor/cursor", "--no-sandbox"}), stat_line(4101, "cursor", 0, 0, 0, 10));
  add_proc(root, 4102, nul_join({"/opt/Cursor/cursor", "--type=gpu-process"}),
           stat_line(4102, "cursor", static_cast<unsigned long>(hz * 100), 0, 0, 10));
  add_proc(root, 4103, nul_join({"/usr/bin/bash"}), stat_line(4103, "bash", 0, 0, 0, 10));
  add_proc(root, 4104, "", stat_line(4104, "kworker/0:1", 0, 0, 0, 0));
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);

  ideguard::collectors::ProcessCollector c("CURSOR");
  ideguard::model::ProcessTable t;
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.processes.size(), 2u);
  const auto* gpu = &t.processes[0];
  if (gpu->pid != 4102) gpu = &t.processes[1];
  ASSERT_EQ(gpu->pid, 4102);
  ASSERT_TRUE(gpu->role == ProcessRole::Gpu);
  ASSERT_EQ(gpu->command, std::string("/opt/Cursor/cursor --type=gpu-process"));
  // 100 s of CPU over a 1000 s lifetime
  ASSERT_NEAR(gpu->cpu_percent, 10.0, 0.1);
  ASSERT_TRUE(gpu->memory_percent > 0.0);
  unsetenv("IDEGUARD_PROC_ROOT");
  fs::remove_all(root);
}

TEST(process_collector_uses_delta_on_second_sample) {
  auto root = make_root("delta");
  const long hz = ::sysconf(_SC_CLK_TCK);
  write_text(root / "proc/uptime", "100.00 400.00\n");
  write_text(root / "proc/meminfo", "MemTotal: 1000000 kB\nMemAvailable: 500000 kB\n");
  add_proc(root, 5001, nul_join({"cursor", "--type=utility"}), stat_line(5001, "cursor", 0, 0, 0, 1));
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);

  ideguard::collectors::ProcessCollector c("cursor");
  ideguard::model::ProcessTable t;
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.processes.size(), 1u);
  ASSERT_NEAR(t.processes[0].cpu_percent, 0.0, 0.01);

  // 10 s later it burned 5 s of CPU (utime + stime): 50% of one core
  write_text(root / "proc/uptime", "110.00 440.00\n");
  add_proc(root, 5001, nul_join({"cursor", "--type=utility"}),
           stat_line(5001, "cursor", static_cast<unsigned long>(hz * 3), static_cast<unsigned long>(hz * 2), 0, 1));
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.processes.size(), 1u);
  ASSERT_NEAR(t.processes[0].cpu_percent, 50.0, 0.1);
  unsetenv("IDEGUARD_PROC_ROOT");
  fs::remove_all(root);
}

TEST(process_collector_excludes_pids_and_survives_vanished) {
  auto root = make_root("exclude");
  write_text(root / "proc/uptime", "50.00 100.00\n");
  write_text(root / "proc/meminfo", "MemTotal: 1000000 kB\n");
  add_proc(root, 6001, nul_join({"cursor"}), stat_line(6001, "cursor", 0, 0, 0, 1));
  add_proc(root, 6002, nul_join({"cursor", "--type=renderer"}), stat_line(6002, "cursor", 0, 0, 0, 1));
  // Directory without cmdline: process exited mid-scan
  fs::create_directories(root / "proc/6003");
  // Stat with a comm containing spaces and parens
  add_proc(root, 6004, nul_join({"cursor", "--type=utility"}), stat_line(6004, "Cursor (x) helper", 0, 0, 0, 1));
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);

  ideguard::collectors::ProcessCollector c("cursor", {6001});
  ideguard::model::ProcessTable t;
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.processes.size(), 2u);
  ASSERT_EQ(t.vanished, 1u);
  for (const auto& p : t.processes) ASSERT_NE(p.pid, 6001);
  unsetenv("IDEGUARD_PROC_ROOT");
  fs::remove_all(root);
}

TEST(process_collector_without_uptime_fails) {
  auto root = make_root("nouptime");
  setenv("IDEGUARD_PROC_ROOT", root.c_str(), 1);
  ideguard::collectors::ProcessCollector c("cursor");
  ideguard::model::ProcessTable t;
  ASSERT_TRUE(!c.sample(t));
  unsetenv("IDEGUARD_PROC_ROOT");
  fs::remove_all(root);
}
