#include "app/Config.hpp"
#include "app/Launcher.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <system_error>

namespace ideguard::app {

using ideguard::model::ProcessRole;
using ideguard::util::TomlReader;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // IDEGUARD_FOO <-> ideguard_foo
  std::string n(name);
  std::string alt;
  if (n.starts_with("IDEGUARD_")) {
    alt = n;
    std::transform(alt.begin(), alt.end(), alt.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  } else if (n.starts_with("ideguard_")) {
    alt = n;
    std::transform(alt.begin(), alt.end(), alt.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stod(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::filesystem::path home_dir() {
  if (const char* home = std::getenv("HOME"); home && *home) return home;
  return {};
}

std::filesystem::path expand_user(std::string_view p) {
  if (p == "~") return home_dir();
  if (p.starts_with("~/")) {
    auto h = home_dir();
    if (!h.empty()) return h / std::string(p.substr(2));
  }
  return std::filesystem::path(std::string(p));
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ideguard/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/ideguard/config.toml";
  return {};
}

std::filesystem::path default_log_path() {
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "ideguard" / "actions.log";
  auto home = home_dir();
  if (!home.empty()) return home / ".local" / "state" / "ideguard" / "actions.log";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Lists come from a TOML array or a comma-separated env value
static std::vector<std::string> resolve_list(const TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return TomlReader::split_list(v);
  }
  return def;
}

WatchdogConfig load_config(const std::string& path) {
  WatchdogConfig c;
  TomlReader toml;
  const bool explicit_path = !path.empty();
  const std::string file = explicit_path ? path : config_file_path();
  const bool have_toml = !file.empty() && toml.load(file);
  if (have_toml) {
    c.source = file;
  } else if (explicit_path) {
    c.problems.push_back("cannot read config file " + file);
  }

  auto& p = c.policy;
  p.cpu_threshold = resolve_double(toml, have_toml, "watchdog", "cpu_threshold", "IDEGUARD_CPU_THRESHOLD", 20.0);
  p.check_interval = std::chrono::seconds(
      resolve_int(toml, have_toml, "watchdog", "check_interval_s", "IDEGUARD_CHECK_INTERVAL", 30));
  p.protect_unknown = resolve_bool(toml, have_toml, "watchdog", "protect_unknown", "IDEGUARD_PROTECT_UNKNOWN", true);
  p.language_server_total_threshold = resolve_double(toml, have_toml, "watchdog", "language_server_total_threshold",
                                                     "IDEGUARD_LS_TOTAL_THRESHOLD", 0.0);
  p.memory_warn_pct = resolve_double(toml, have_toml, "watchdog", "memory_warn_pct", "IDEGUARD_MEMORY_WARN_PCT", 80.0);
  p.force_kill = resolve_bool(toml, have_toml, "watchdog", "force_kill", "IDEGUARD_FORCE_KILL", false);

  auto roles = resolve_list(toml, have_toml, "watchdog", "protected_roles", "IDEGUARD_PROTECTED_ROLES",
                            {"main", "renderer"});
  p.protected_roles.clear();
  for (const auto& r : roles) {
    if (auto role = ideguard::model::parse_role(r)) p.protected_roles.insert(*role);
    else c.problems.push_back("unknown role in protected_roles: " + r);
  }

  auto log = resolve_string(toml, have_toml, "watchdog", "log_path", "IDEGUARD_LOG_PATH", "");
  c.log_path = log.empty() ? default_log_path() : expand_user(log);

  auto& t = c.target;
  t.match = resolve_string(toml, have_toml, "target", "match", "IDEGUARD_TARGET", "cursor");
  auto exe = resolve_string(toml, have_toml, "target", "executable", "IDEGUARD_EXECUTABLE", "");
  t.executable = exe.empty() ? std::filesystem::path{} : expand_user(exe);
  t.binary_name = resolve_string(toml, have_toml, "target", "binary_name", nullptr, "cursor");
  t.app_image_prefix = resolve_string(toml, have_toml, "target", "app_image_prefix", nullptr, "Cursor");
  for (const auto& d : resolve_list(toml, have_toml, "target", "search_dirs", nullptr,
                                    {"~/Downloads", "~/Applications"})) {
    t.search_dirs.push_back(expand_user(d));
  }
  t.config_dir = expand_user(resolve_string(toml, have_toml, "target", "config_dir", "IDEGUARD_APP_CONFIG_DIR",
                                            "~/.config/Cursor"));

  c.launch_profile = resolve_string(toml, have_toml, "launch", "profile", "IDEGUARD_LAUNCH_PROFILE", "safe");
  c.metrics_port = resolve_int(toml, have_toml, "metrics", "port", "IDEGUARD_METRICS_PORT", 0);
  return c;
}

std::vector<std::string> validate(const WatchdogConfig& cfg) {
  std::vector<std::string> out = cfg.problems;
  const auto& p = cfg.policy;
  char buf[128];
  if (!(p.cpu_threshold > 0.0 && p.cpu_threshold <= 1000.0)) {
    std::snprintf(buf, sizeof(buf), "cpu_threshold %.2f must be in (0, 1000]", p.cpu_threshold);
    out.emplace_back(buf);
  }
  const auto secs = p.check_interval.count();
  if (secs < 1 || secs > 3600) {
    std::snprintf(buf, sizeof(buf), "check_interval_s %lld must be in [1, 3600]", static_cast<long long>(secs));
    out.emplace_back(buf);
  }
  bool all_protected = true;
  for (auto r : ideguard::model::kAllRoles) {
    if (!p.is_protected(r)) { all_protected = false; break; }
  }
  if (all_protected) out.emplace_back("every role is protected; the watchdog could never act");
  if (p.language_server_total_threshold < 0.0) out.emplace_back("language_server_total_threshold must not be negative");
  if (p.memory_warn_pct < 0.0 || p.memory_warn_pct > 100.0) out.emplace_back("memory_warn_pct must be in [0, 100]");
  if (cfg.target.match.empty()) out.emplace_back("target.match must not be empty");
  if (!find_launch_profile(cfg.launch_profile)) out.push_back("unknown launch profile: " + cfg.launch_profile);
  if (cfg.metrics_port < 0 || cfg.metrics_port > 65535) out.emplace_back("metrics.port must be in [0, 65535]");
  return out;
}

} // namespace ideguard::app
