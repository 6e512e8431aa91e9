#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "model/Target.hpp"

namespace ideguard::app {

// Fixed environment and flag set the target is started with
struct LaunchProfile {
  std::string_view name;
  std::vector<std::pair<std::string, std::string>> env;
  std::vector<std::string> flags;
};

[[nodiscard]] const std::vector<LaunchProfile>& launch_profiles();
[[nodiscard]] const LaunchProfile* find_launch_profile(std::string_view name);

// Configured executable, then binary_name on PATH, then the first
// <app_image_prefix>*.AppImage in the search dirs (sorted by name). A found
// AppImage without an execute bit gets one. Every location tried is
// appended to searched when given.
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(const ideguard::model::TargetSpec& target,
                                                                      std::vector<std::string>* searched = nullptr);

// exe, profile flags, then caller args
[[nodiscard]] std::vector<std::string> build_argv(const std::filesystem::path& exe, const LaunchProfile& profile,
                                                  const std::vector<std::string>& extra);
// base ("KEY=VALUE" entries) with the profile's variables set or replaced
[[nodiscard]] std::vector<std::string> build_env(const LaunchProfile& profile, const std::vector<std::string>& base);
[[nodiscard]] std::vector<std::string> current_environment();

enum class LaunchMode { Detached, Attached };

struct SpawnResult {
  bool ok{false};
  int32_t pid{-1};
  int exit_status{-1};   // attached only: exit code, or 128+signal
  std::string error;
};

// Detached: new session, stdio on /dev/null, returns once exec succeeded.
// Attached: inherits stdio and waits for the child.
SpawnResult spawn(const std::vector<std::string>& argv, const std::vector<std::string>& env, LaunchMode mode);

} // namespace ideguard::app
