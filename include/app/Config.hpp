#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "model/Policy.hpp"
#include "model/Target.hpp"

namespace ideguard::app {

// Everything resolved at startup. CLI flags are applied on top by the caller,
// then validate() runs before any component is built.
struct WatchdogConfig {
  ideguard::model::ProtectionPolicy policy{};
  ideguard::model::TargetSpec target{};
  std::filesystem::path log_path{};
  std::string launch_profile{"safe"};
  int metrics_port{0};
  std::filesystem::path source{};        // config file actually read, empty if none
  std::vector<std::string> problems{};   // values that could not be parsed
};

// Environment variable helpers (IDEGUARD_FOO or ideguard_foo)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);

std::filesystem::path home_dir();
// "~" and "~/x" expand against $HOME; anything else is returned as is
std::filesystem::path expand_user(std::string_view p);
// $XDG_CONFIG_HOME/ideguard/config.toml or ~/.config/ideguard/config.toml
std::string config_file_path();
// $XDG_STATE_HOME/ideguard/actions.log or ~/.local/state/ideguard/actions.log
std::filesystem::path default_log_path();

// TOML -> env -> compiled default. An empty path means config_file_path(),
// whose absence is not an error; an explicit path that cannot be read is.
WatchdogConfig load_config(const std::string& path = {});

// Problems that make the configuration unusable; empty when valid
[[nodiscard]] std::vector<std::string> validate(const WatchdogConfig& cfg);

} // namespace ideguard::app
