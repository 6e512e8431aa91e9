#include "collectors/ProcessCollector.hpp"
#include "collectors/RoleClassifier.hpp"
#include "util/Churn.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unistd.h>

namespace ideguard::collectors {

using ideguard::util::note_churn;

static std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

ProcessCollector::ProcessCollector(std::string match, std::vector<int32_t> exclude_pids)
  : match_lower_(ascii_lower(match)), exclude_pids_(std::move(exclude_pids)) {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) hz_ = hz;
  long page = ::sysconf(_SC_PAGESIZE);
  if (page > 0) page_kb_ = page / 1024;
}

bool ProcessCollector::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may contain spaces and parens, so split after the last ')'
  auto rp = content.rfind(')');
  if (rp == std::string::npos || rp + 2 > content.size()) return false;
  std::string_view rest(content.data() + rp + 2, content.size() - rp - 2);

  // rest[0] is field 3 (state); we need utime(14) stime(15) starttime(22) rss(24)
  std::vector<std::string_view> fields;
  fields.reserve(24);
  size_t pos = 0;
  while (pos < rest.size() && fields.size() < 22) {
    while (pos < rest.size() && (rest[pos] == ' ' || rest[pos] == '\n')) ++pos;
    size_t end = pos;
    while (end < rest.size() && rest[end] != ' ' && rest[end] != '\n') ++end;
    if (end > pos) fields.push_back(rest.substr(pos, end - pos));
    pos = end;
  }
  if (fields.size() < 22) return false;

  auto num = [](std::string_view sv, auto& v) {
    auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    return ec == std::errc{};
  };
  return num(fields[11], out.utime) && num(fields[12], out.stime) &&
         num(fields[19], out.starttime) && num(fields[21], out.rss_pages);
}

std::optional<std::string> ProcessCollector::read_cmdline(int32_t pid) {
  auto bytes = ideguard::util::read_file_bytes("/proc/" + std::to_string(pid) + "/cmdline");
  if (!bytes) return std::nullopt;
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::optional<double> ProcessCollector::read_uptime_s() {
  auto txt = ideguard::util::read_file_string("/proc/uptime");
  if (!txt) return std::nullopt;
  try { return std::stod(*txt); } catch (const std::exception&) { return std::nullopt; }
}

bool ProcessCollector::sample(ideguard::model::ProcessTable& out) {
  out.processes.clear(); out.scanned = 0; out.vanished = 0;

  auto uptime = read_uptime_s();
  if (!uptime) return false;
  ideguard::model::Memory mem{};
  bool have_mem = mem_.sample(mem);

  const double elapsed_s = last_uptime_s_ > 0.0 ? (*uptime - last_uptime_s_) : 0.0;
  std::unordered_map<int32_t, uint64_t> ticks_now;

  for (const auto& name : ideguard::util::list_dir("/proc")) {
    if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;
    int32_t pid = 0;
    auto [p, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || p != name.data() + name.size()) continue;
    if (std::find(exclude_pids_.begin(), exclude_pids_.end(), pid) != exclude_pids_.end()) continue;
    ++out.scanned;

    auto cmd = read_cmdline(pid);
    if (!cmd) { ++out.vanished; note_churn(); continue; }
    if (cmd->empty()) continue; // kernel thread or zombie
    if (ascii_lower(*cmd).find(match_lower_) == std::string::npos) continue;

    auto stat = ideguard::util::read_file_string("/proc/" + name + "/stat");
    StatFields f{};
    if (!stat || !parse_stat_line(*stat, f)) { ++out.vanished; note_churn(); continue; }

    ideguard::model::ProcessSample s;
    s.pid = pid;
    s.command = std::move(*cmd);
    s.total_ticks = f.utime + f.stime;
    s.rss_kb = f.rss_pages > 0 ? static_cast<uint64_t>(f.rss_pages) * static_cast<uint64_t>(page_kb_) : 0;
    s.role = classify_role(s.command);

    auto it = last_ticks_.find(pid);
    if (it != last_ticks_.end() && elapsed_s > 0.0) {
      uint64_t dt = s.total_ticks > it->second ? s.total_ticks - it->second : 0;
      s.cpu_percent = 100.0 * static_cast<double>(dt) / (elapsed_s * static_cast<double>(hz_));
    } else {
      // First sighting: lifetime average, same as ps(1)
      double age_ticks = *uptime * static_cast<double>(hz_) - static_cast<double>(f.starttime);
      if (age_ticks > 0.0) s.cpu_percent = 100.0 * static_cast<double>(s.total_ticks) / age_ticks;
    }
    if (have_mem && mem.total_kb > 0) {
      s.memory_percent = 100.0 * static_cast<double>(s.rss_kb) / static_cast<double>(mem.total_kb);
    }
    ticks_now[pid] = s.total_ticks;
    out.processes.push_back(std::move(s));
  }

  last_ticks_ = std::move(ticks_now);
  last_uptime_s_ = *uptime;
  return true;
}

} // namespace ideguard::collectors
