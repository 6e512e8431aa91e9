#include "app/ActionLog.hpp"
#include "app/CacheReclaimer.hpp"
#include "app/Config.hpp"
#include "app/Launcher.hpp"
#include "app/MetricsServer.hpp"
#include "app/ProcessKiller.hpp"
#include "app/StatsBuffers.hpp"
#include "app/Watchdog.hpp"
#include "collectors/ProcessCollector.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace std::chrono_literals;
using ideguard::app::WatchdogConfig;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static constexpr int kExitOk = 0;
static constexpr int kExitRuntime = 1;
static constexpr int kExitUsage = 2;

static void print_usage(std::FILE* out) {
  std::fputs(
    "Usage: ideguard [--config PATH] [--quiet] <command> [options]\n"
    "  watch   [--iterations N] [--interval S] [--threshold PCT] [--target NAME]\n"
    "          [--metrics-port PORT]\n"
    "  ps      [--target NAME]\n"
    "  reclaim [--profile safe|full] [PATH ...]\n"
    "  launch  [--profile safe|crash-fix|low-gpu] [--wait] [--reclaim] [-- ARGS ...]\n", out);
}

static bool parse_int(std::string_view s, int& out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && p == s.data() + s.size();
}

static bool parse_double(std::string_view s, double& out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && p == s.data() + s.size();
}

static int usage_error(const std::string& msg) {
  std::fprintf(stderr, "ideguard: %s\n", msg.c_str());
  print_usage(stderr);
  return kExitUsage;
}

static bool check_config(const WatchdogConfig& cfg) {
  auto problems = ideguard::app::validate(cfg);
  for (const auto& p : problems) std::fprintf(stderr, "ideguard: config: %s\n", p.c_str());
  return problems.empty();
}

static std::vector<int32_t> own_pids() {
  return {static_cast<int32_t>(::getpid()), static_cast<int32_t>(::getppid())};
}

static int cmd_watch(WatchdogConfig& cfg, bool quiet, const std::vector<std::string>& args) {
  int iterations = 0;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& a = args[i];
    bool has_val = i + 1 < args.size();
    if (a == "--iterations" && has_val) {
      if (!parse_int(args[++i], iterations) || iterations < 0) return usage_error("bad --iterations: " + args[i]);
    } else if (a == "--interval" && has_val) {
      int s = 0;
      if (!parse_int(args[++i], s)) return usage_error("bad --interval: " + args[i]);
      cfg.policy.check_interval = std::chrono::seconds(s);
    } else if (a == "--threshold" && has_val) {
      if (!parse_double(args[++i], cfg.policy.cpu_threshold)) return usage_error("bad --threshold: " + args[i]);
    } else if (a == "--target" && has_val) {
      cfg.target.match = args[++i];
    } else if (a == "--metrics-port" && has_val) {
      if (!parse_int(args[++i], cfg.metrics_port)) return usage_error("bad --metrics-port: " + args[i]);
    } else {
      return usage_error("watch: unexpected argument " + a);
    }
  }
  if (!check_config(cfg)) return kExitUsage;

  ideguard::app::ActionLog log(cfg.log_path, !quiet);
  ideguard::collectors::ProcessCollector procs(cfg.target.match, own_pids());
  ideguard::app::SignalKiller killer;
  ideguard::app::StatsBuffers stats;
  ideguard::app::Watchdog wd(cfg.policy, procs, killer, log, &stats);

  std::unique_ptr<ideguard::app::MetricsServer> metrics;
  if (cfg.metrics_port > 0) {
    metrics = std::make_unique<ideguard::app::MetricsServer>(stats, static_cast<uint16_t>(cfg.metrics_port));
    metrics->start();
  }

  wd.start(static_cast<uint64_t>(iterations));
  while (!g_stop.load() && !wd.finished()) std::this_thread::sleep_for(100ms);
  wd.stop();
  if (metrics) metrics->stop();
  return kExitOk;
}

static int cmd_ps(WatchdogConfig& cfg, const std::vector<std::string>& args) {
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--target" && i + 1 < args.size()) cfg.target.match = args[++i];
    else return usage_error("ps: unexpected argument " + args[i]);
  }
  if (!check_config(cfg)) return kExitUsage;

  ideguard::app::ActionLog log({}, false);
  ideguard::collectors::ProcessCollector procs(cfg.target.match, own_pids());
  ideguard::app::SignalKiller killer;
  ideguard::app::Watchdog wd(cfg.policy, procs, killer, log);
  auto rows = wd.preview(cfg.policy);

  std::printf("%7s  %-15s %6s %5s  %-23s %s\n", "PID", "ROLE", "CPU%", "MEM%", "VERDICT", "COMMAND");
  for (const auto& r : rows) {
    auto role = ideguard::model::role_name(r.role);
    auto verdict = r.action == ideguard::model::ActionKind::Killed ? std::string_view("would_kill")
                                                                   : ideguard::model::action_name(r.action);
    std::printf("%7d  %-15.*s %6.1f %5.1f  %-23.*s %.80s\n", r.pid,
                static_cast<int>(role.size()), role.data(), r.cpu_percent, r.memory_percent,
                static_cast<int>(verdict.size()), verdict.data(), r.command.c_str());
  }
  if (rows.empty()) std::printf("no processes matching \"%s\"\n", cfg.target.match.c_str());
  return kExitOk;
}

static int cmd_reclaim(WatchdogConfig& cfg, bool quiet, const std::vector<std::string>& args) {
  auto profile = ideguard::app::ReclaimProfile::Safe;
  std::vector<std::filesystem::path> paths;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--profile" && i + 1 < args.size()) {
      auto p = ideguard::app::parse_reclaim_profile(args[++i]);
      if (!p) return usage_error("unknown reclaim profile: " + args[i]);
      profile = *p;
    } else if (args[i].starts_with("--")) {
      return usage_error("reclaim: unexpected argument " + args[i]);
    } else {
      paths.push_back(ideguard::app::expand_user(args[i]));
    }
  }
  if (paths.empty()) paths = ideguard::app::reclaim_paths(profile, cfg.target.config_dir, ideguard::app::home_dir());

  ideguard::app::ActionLog log(cfg.log_path, !quiet);
  ideguard::app::CacheReclaimer reclaimer(&log);
  size_t n = reclaimer.reclaim(paths);
  if (!quiet) std::printf("cleared %zu of %zu cache paths\n", n, paths.size());
  return kExitOk;
}

static int cmd_launch(WatchdogConfig& cfg, bool quiet, const std::vector<std::string>& args) {
  bool wait = false;
  bool reclaim_first = false;
  std::vector<std::string> extra;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& a = args[i];
    if (a == "--") {
      extra.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
      break;
    }
    if (a == "--profile" && i + 1 < args.size()) cfg.launch_profile = args[++i];
    else if (a == "--wait") wait = true;
    else if (a == "--reclaim") reclaim_first = true;
    else return usage_error("launch: unexpected argument " + a);
  }
  if (!check_config(cfg)) return kExitUsage;
  const auto* profile = ideguard::app::find_launch_profile(cfg.launch_profile);

  std::vector<std::string> searched;
  auto exe = ideguard::app::resolve_executable(cfg.target, &searched);
  if (!exe) {
    std::fprintf(stderr, "ideguard: launch: target executable not found; searched:\n");
    for (const auto& s : searched) std::fprintf(stderr, "  %s\n", s.c_str());
    std::fprintf(stderr, "ideguard: install the application or set target.executable in %s\n",
                 ideguard::app::config_file_path().c_str());
    return kExitRuntime;
  }

  ideguard::app::ActionLog log(cfg.log_path, !quiet);
  if (reclaim_first) {
    ideguard::app::CacheReclaimer reclaimer(&log);
    reclaimer.reclaim(ideguard::app::reclaim_paths(ideguard::app::ReclaimProfile::Safe,
                                                   cfg.target.config_dir, ideguard::app::home_dir()));
  }

  auto argv = ideguard::app::build_argv(*exe, *profile, extra);
  auto env = ideguard::app::build_env(*profile, ideguard::app::current_environment());
  auto mode = wait ? ideguard::app::LaunchMode::Attached : ideguard::app::LaunchMode::Detached;
  auto res = ideguard::app::spawn(argv, env, mode);
  if (!res.ok) {
    log.note("error", "launch failed: " + res.error);
    return kExitRuntime;
  }
  log.note("info", "launched " + exe->string() + " (profile " + std::string(profile->name) +
                   ", pid " + std::to_string(res.pid) + ")");
  return wait ? res.exit_status : kExitOk;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::string config_path;
  bool quiet = false;
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--quiet" || a == "-q") quiet = true;
    else if (a == "-h" || a == "--help") { print_usage(stdout); return kExitOk; }
    else if (a.starts_with("-")) return usage_error("unknown option " + std::string(a));
    else break;
  }
  if (i >= argc) return usage_error("missing command");

  const std::string cmd = argv[i++];
  std::vector<std::string> args(argv + i, argv + argc);
  WatchdogConfig cfg = ideguard::app::load_config(config_path);

  if (cmd == "watch")   return cmd_watch(cfg, quiet, args);
  if (cmd == "ps")      return cmd_ps(cfg, args);
  if (cmd == "reclaim") return cmd_reclaim(cfg, quiet, args);
  if (cmd == "launch")  return cmd_launch(cfg, quiet, args);
  return usage_error("unknown command " + cmd);
}
