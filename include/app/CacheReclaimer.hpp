#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ideguard::app {

class ActionLog;

enum class ReclaimProfile { Safe, Full };

[[nodiscard]] constexpr std::string_view reclaim_profile_name(ReclaimProfile p) {
  return p == ReclaimProfile::Full ? "full" : "safe";
}
[[nodiscard]] std::optional<ReclaimProfile> parse_reclaim_profile(std::string_view s);

// Built-in cache directory set. Only rebuildable caches: globalStorage and
// workspaceStorage hold user state and are never listed as a whole.
[[nodiscard]] std::vector<std::filesystem::path> reclaim_paths(ReclaimProfile p,
                                                               const std::filesystem::path& app_config_dir,
                                                               const std::filesystem::path& home);

// Deletes cache directories recursively. Missing paths are not errors;
// failures are logged and skipped.
class CacheReclaimer {
public:
  explicit CacheReclaimer(ActionLog* log = nullptr) : log_(log) {}

  // Returns the number of paths actually removed
  size_t reclaim(const std::vector<std::filesystem::path>& paths);

  [[nodiscard]] size_t failures() const { return failures_; }
  [[nodiscard]] uintmax_t entries_removed() const { return entries_removed_; }

private:
  void report(std::string_view level, const std::string& message);

  ActionLog* log_;
  size_t failures_{};
  uintmax_t entries_removed_{};
};

} // namespace ideguard::app
