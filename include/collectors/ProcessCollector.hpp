#pragma once
#include "collectors/IProcessCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ideguard::collectors {

// Scans /proc for processes whose command line contains the target
// substring (case-insensitive) and turns each into a classified sample.
class ProcessCollector : public IProcessCollector {
public:
  explicit ProcessCollector(std::string match, std::vector<int32_t> exclude_pids = {});
  const char* name() const override { return "/proc scanner"; }
  bool sample(ideguard::model::ProcessTable& out) override;

private:
  struct StatFields {
    uint64_t utime{};
    uint64_t stime{};
    uint64_t starttime{};  // clock ticks after boot
    int64_t rss_pages{};
  };

  std::string match_lower_;
  std::vector<int32_t> exclude_pids_;
  std::unordered_map<int32_t, uint64_t> last_ticks_{}; // pid -> utime+stime at previous sample
  double last_uptime_s_{};
  long hz_{100};
  long page_kb_{4};
  MemoryCollector mem_{};

  static bool parse_stat_line(const std::string& content, StatFields& out);
  static std::optional<std::string> read_cmdline(int32_t pid);
  static std::optional<double> read_uptime_s();
};

} // namespace ideguard::collectors
