#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using ideguard::model::ProcessRole;

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          (std::string("ideguard_test_config_") + suffix + "_" + std::to_string(::getpid()) + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void clear_env() {
  for (const char* n : {"IDEGUARD_CPU_THRESHOLD", "IDEGUARD_CHECK_INTERVAL", "IDEGUARD_PROTECTED_ROLES",
                        "IDEGUARD_PROTECT_UNKNOWN", "IDEGUARD_LS_TOTAL_THRESHOLD", "IDEGUARD_MEMORY_WARN_PCT",
                        "IDEGUARD_FORCE_KILL", "IDEGUARD_LOG_PATH", "IDEGUARD_TARGET", "IDEGUARD_EXECUTABLE",
                        "IDEGUARD_APP_CONFIG_DIR", "IDEGUARD_LAUNCH_PROFILE", "IDEGUARD_METRICS_PORT",
                        "ideguard_cpu_threshold"}) {
    unsetenv(n);
  }
}

TEST(config_defaults) {
  clear_env();
  auto path = tmp_path("empty");
  write_file(path, "");
  auto c = ideguard::app::load_config(path);
  ASSERT_TRUE(c.policy.cpu_threshold == 20.0);
  ASSERT_EQ(c.policy.check_interval.count(), 30);
  ASSERT_EQ(c.policy.protected_roles.size(), 2u);
  ASSERT_TRUE(c.policy.protected_roles.contains(ProcessRole::Main));
  ASSERT_TRUE(c.policy.protected_roles.contains(ProcessRole::Renderer));
  ASSERT_TRUE(c.policy.protect_unknown);
  ASSERT_TRUE(!c.policy.force_kill);
  ASSERT_EQ(c.target.match, std::string("cursor"));
  ASSERT_EQ(c.launch_profile, std::string("safe"));
  ASSERT_EQ(c.metrics_port, 0);
  ASSERT_TRUE(ideguard::app::validate(c).empty());
  std::filesystem::remove(path);
}

TEST(config_toml_beats_env_beats_default) {
  clear_env();
  auto path = tmp_path("precedence");
  write_file(path,
    "[watchdog]\n"
    "cpu_threshold = 35.5\n"
    "protected_roles = [\"main\", \"renderer\", \"terminal_host\"]\n"
    "\n"
    "[target]\n"
    "match = \"code\"  # VS Code\n");
  setenv("IDEGUARD_CPU_THRESHOLD", "50", 1);
  setenv("IDEGUARD_CHECK_INTERVAL", "5", 1);
  setenv("IDEGUARD_FORCE_KILL", "true", 1);
  auto c = ideguard::app::load_config(path);
  ASSERT_TRUE(c.policy.cpu_threshold == 35.5);
  ASSERT_EQ(c.policy.check_interval.count(), 5);
  ASSERT_TRUE(c.policy.force_kill);
  ASSERT_TRUE(c.policy.protected_roles.contains(ProcessRole::TerminalHost));
  ASSERT_EQ(c.target.match, std::string("code"));
  ASSERT_EQ(c.source.string(), path);
  clear_env();
  std::filesystem::remove(path);
}

TEST(config_env_list_and_lowercase_alias) {
  clear_env();
  auto path = tmp_path("envlist");
  write_file(path, "[other]\nx = 1\n");
  setenv("IDEGUARD_PROTECTED_ROLES", "main,language-server", 1);
  setenv("ideguard_cpu_threshold", "12.5", 1);
  auto c = ideguard::app::load_config(path);
  ASSERT_EQ(c.policy.protected_roles.size(), 2u);
  ASSERT_TRUE(c.policy.protected_roles.contains(ProcessRole::LanguageServer));
  ASSERT_TRUE(c.policy.cpu_threshold == 12.5);
  clear_env();
  std::filesystem::remove(path);
}

TEST(config_env_alias_both_directions) {
  unsetenv("IDEGUARD_METRICS_PORT");
  unsetenv("ideguard_metrics_port");
  setenv("ideguard_metrics_port", "9464", 1);
  const char* v = ideguard::app::getenv_compat("IDEGUARD_METRICS_PORT");
  ASSERT_TRUE(v != nullptr);
  ASSERT_EQ(std::string(v), std::string("9464"));
  ASSERT_EQ(ideguard::app::getenv_int("IDEGUARD_METRICS_PORT", 0), 9464);
  unsetenv("ideguard_metrics_port");

  setenv("IDEGUARD_METRICS_PORT", "9100", 1);
  ASSERT_EQ(ideguard::app::getenv_int("ideguard_metrics_port", 0), 9100);
  unsetenv("IDEGUARD_METRICS_PORT");
  ASSERT_TRUE(ideguard::app::getenv_compat("IDEGUARD_METRICS_PORT") == nullptr);
}

TEST(config_unknown_role_is_a_problem) {
  clear_env();
  auto path = tmp_path("badrole");
  write_file(path, "[watchdog]\nprotected_roles = \"main,browser\"\n");
  auto c = ideguard::app::load_config(path);
  auto problems = ideguard::app::validate(c);
  ASSERT_EQ(problems.size(), 1u);
  ASSERT_TRUE(problems[0].find("browser") != std::string::npos);
  std::filesystem::remove(path);
}

TEST(config_missing_explicit_file_is_a_problem) {
  clear_env();
  auto c = ideguard::app::load_config("/nonexistent/ideguard/config.toml");
  ASSERT_TRUE(c.source.empty());
  ASSERT_TRUE(!ideguard::app::validate(c).empty());
}

TEST(config_validation_bounds) {
  ideguard::app::WatchdogConfig c;
  c.policy.cpu_threshold = 0.0;
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.cpu_threshold = 1000.0;
  ASSERT_TRUE(ideguard::app::validate(c).empty());
  c.policy.cpu_threshold = 1000.5;
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.cpu_threshold = 20.0;

  c.policy.check_interval = std::chrono::seconds(0);
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.check_interval = std::chrono::seconds(3601);
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.check_interval = std::chrono::seconds(30);

  c.target.match.clear();
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.target.match = "cursor";

  c.policy.language_server_total_threshold = -1.0;
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.language_server_total_threshold = 0.0;

  c.launch_profile = "turbo";
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.launch_profile = "low-gpu";
  ASSERT_TRUE(ideguard::app::validate(c).empty());
}

TEST(config_all_roles_protected_rejected) {
  ideguard::app::WatchdogConfig c;
  for (auto r : ideguard::model::kAllRoles) c.policy.protected_roles.insert(r);
  auto problems = ideguard::app::validate(c);
  ASSERT_EQ(problems.size(), 1u);
  // Unknown is covered by protect_unknown alone
  c.policy.protected_roles.erase(ProcessRole::Unknown);
  ASSERT_EQ(ideguard::app::validate(c).size(), 1u);
  c.policy.protect_unknown = false;
  ASSERT_TRUE(ideguard::app::validate(c).empty());
}

TEST(config_paths_follow_xdg) {
  setenv("XDG_CONFIG_HOME", "/tmp/xdgc", 1);
  setenv("XDG_STATE_HOME", "/tmp/xdgs", 1);
  ASSERT_EQ(ideguard::app::config_file_path(), std::string("/tmp/xdgc/ideguard/config.toml"));
  ASSERT_EQ(ideguard::app::default_log_path().string(), std::string("/tmp/xdgs/ideguard/actions.log"));
  unsetenv("XDG_CONFIG_HOME");
  unsetenv("XDG_STATE_HOME");
  setenv("HOME", "/home/tester", 1);
  ASSERT_EQ(ideguard::app::default_log_path().string(), std::string("/home/tester/.local/state/ideguard/actions.log"));
  ASSERT_EQ(ideguard::app::expand_user("~/Downloads").string(), std::string("/home/tester/Downloads"));
  ASSERT_EQ(ideguard::app::expand_user("/abs").string(), std::string("/abs"));
}
