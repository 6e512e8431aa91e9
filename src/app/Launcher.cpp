#include "app/Launcher.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace ideguard::app {

static const std::vector<std::string>& safe_flags() {
  static const std::vector<std::string> f{
    "--disable-gpu",
    "--no-sandbox",
    "--disable-dev-shm-usage",
    "--disable-features=VizDisplayCompositor",
    "--js-flags=--max-old-space-size=1024",
  };
  return f;
}

static std::vector<LaunchProfile> make_profiles() {
  std::vector<LaunchProfile> out;
  out.push_back(LaunchProfile{.name = "safe", .env = {}, .flags = safe_flags()});

  auto crash = safe_flags();
  for (const char* f : {"--disable-background-timer-throttling",
                        "--disable-renderer-backgrounding",
                        "--disable-backgrounding-occluded-windows",
                        "--disable-ipc-flooding-protection",
                        "--memory-pressure-off",
                        "--disable-features=TranslateUI",
                        "--disable-features=BlinkGenPropertyTrees"}) {
    crash.emplace_back(f);
  }
  out.push_back(LaunchProfile{.name = "crash-fix", .env = {}, .flags = std::move(crash)});

  // Old integrated GPUs: keep Electron off the GPU entirely and cap V8 heaps
  LaunchProfile low{.name = "low-gpu", .env = {}, .flags = {}};
  for (const char* k : {"ELECTRON_DISABLE_GPU", "ELECTRON_DISABLE_SOFTWARE_RASTERIZER",
                        "ELECTRON_DISABLE_GPU_SANDBOX", "ELECTRON_DISABLE_GPU_PROCESS",
                        "ELECTRON_DISABLE_GPU_MEMORY_BUFFER", "ELECTRON_DISABLE_GPU_MEMORY_STATS",
                        "ELECTRON_DISABLE_GPU_MEMORY_PRESSURE", "ELECTRON_DISABLE_GPU_MEMORY_LIMIT",
                        "ELECTRON_DISABLE_GPU_MEMORY_GROWTH", "ELECTRON_DISABLE_GPU_MEMORY_SHRINK",
                        "CURSOR_DISABLE_GPU", "CURSOR_DISABLE_SOFTWARE_RASTERIZER",
                        "ELECTRON_DISABLE_DEV_SHM_USAGE",
                        "ELECTRON_DISABLE_BACKGROUND_TIMER_THROTTLING",
                        "ELECTRON_DISABLE_BACKGROUNDING_OCCLUDED_WINDOWS",
                        "ELECTRON_DISABLE_RENDERER_BACKGROUNDING",
                        "ELECTRON_DISABLE_FIELD_TRIAL_CONFIG",
                        "ELECTRON_DISABLE_IPC_FLOODING_PROTECTION"}) {
    low.env.emplace_back(k, "1");
  }
  low.env.emplace_back("ELECTRON_DISABLE_FEATURES", "VizDisplayCompositor");
  low.env.emplace_back("ELECTRON_FORCE_GPU_MEM_AVAILABLE_MB", "128");
  low.env.emplace_back("ELECTRON_GPU_MEMORY_LIMIT", "256");
  low.env.emplace_back("ELECTRON_GPU_MEMORY_GROWTH_LIMIT", "128");
  low.env.emplace_back("ELECTRON_MAX_OLD_SPACE_SIZE", "512");
  low.env.emplace_back("NODE_OPTIONS", "--max-old-space-size=512");
  low.flags = {
    "--disable-gpu",
    "--disable-software-rasterizer",
    "--disable-dev-shm-usage",
    "--no-sandbox",
    "--disable-setuid-sandbox",
    "--disable-features=VizDisplayCompositor",
    "--disable-background-timer-throttling",
    "--disable-backgrounding-occluded-windows",
    "--disable-renderer-backgrounding",
    "--disable-field-trial-config",
    "--disable-ipc-flooding-protection",
    "--force-gpu-mem-available-mb=128",
    "--js-flags=--max-old-space-size=512",
  };
  out.push_back(std::move(low));
  return out;
}

const std::vector<LaunchProfile>& launch_profiles() {
  static const std::vector<LaunchProfile> profiles = make_profiles();
  return profiles;
}

const LaunchProfile* find_launch_profile(std::string_view name) {
  for (const auto& p : launch_profiles()) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

static bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

static std::optional<fs::path> search_path(const std::string& name, std::vector<std::string>* searched) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (searched) searched->push_back(name);
    if (is_executable_file(name)) return fs::path(name);
    return std::nullopt;
  }
  const char* env = std::getenv("PATH");
  std::string_view path = env ? env : "/usr/local/bin:/usr/bin:/bin";
  if (searched) searched->push_back("$PATH/" + name);
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find(':', pos);
    if (end == std::string_view::npos) end = path.size();
    std::string_view dir = path.substr(pos, end - pos);
    if (!dir.empty()) {
      fs::path cand = fs::path(std::string(dir)) / name;
      if (is_executable_file(cand)) return cand;
    }
    pos = end + 1;
  }
  return std::nullopt;
}

static std::optional<fs::path> find_app_image(const ideguard::model::TargetSpec& t, std::vector<std::string>* searched) {
  if (t.app_image_prefix.empty()) return std::nullopt;
  for (const auto& dir : t.search_dirs) {
    if (searched) searched->push_back((dir / (t.app_image_prefix + "*.AppImage")).string());
    std::error_code ec;
    std::vector<fs::path> hits;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      auto name = it->path().filename().string();
      if (name.starts_with(t.app_image_prefix) && name.ends_with(".AppImage") &&
          it->is_regular_file(ec)) {
        hits.push_back(it->path());
      }
    }
    if (hits.empty()) continue;
    std::sort(hits.begin(), hits.end());
    const auto& img = hits.front();
    if (::access(img.c_str(), X_OK) != 0) {
      fs::permissions(img, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                      fs::perm_options::add, ec);
      if (ec) {
        std::fprintf(stderr, "ideguard: launch: cannot make %s executable: %s\n", img.c_str(), ec.message().c_str());
        continue;
      }
    }
    return img;
  }
  return std::nullopt;
}

std::optional<fs::path> resolve_executable(const ideguard::model::TargetSpec& target, std::vector<std::string>* searched) {
  if (!target.executable.empty()) {
    if (searched) searched->push_back(target.executable.string());
    if (is_executable_file(target.executable)) return target.executable;
  }
  if (auto p = search_path(target.binary_name, searched)) return p;
  return find_app_image(target, searched);
}

std::vector<std::string> build_argv(const fs::path& exe, const LaunchProfile& profile,
                                    const std::vector<std::string>& extra) {
  std::vector<std::string> argv;
  argv.reserve(1 + profile.flags.size() + extra.size());
  argv.push_back(exe.string());
  argv.insert(argv.end(), profile.flags.begin(), profile.flags.end());
  argv.insert(argv.end(), extra.begin(), extra.end());
  return argv;
}

std::vector<std::string> build_env(const LaunchProfile& profile, const std::vector<std::string>& base) {
  std::vector<std::string> out;
  out.reserve(base.size() + profile.env.size());
  for (const auto& kv : base) {
    auto eq = kv.find('=');
    std::string_view key = std::string_view(kv).substr(0, eq);
    bool overridden = std::any_of(profile.env.begin(), profile.env.end(),
                                  [&](const auto& p){ return p.first == key; });
    if (!overridden) out.push_back(kv);
  }
  for (const auto& [k, v] : profile.env) out.push_back(k + "=" + v);
  return out;
}

std::vector<std::string> current_environment() {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) out.emplace_back(*e);
  return out;
}

static std::vector<char*> c_array(const std::vector<std::string>& v) {
  std::vector<char*> out;
  out.reserve(v.size() + 1);
  for (const auto& s : v) out.push_back(const_cast<char*>(s.c_str()));
  out.push_back(nullptr);
  return out;
}

SpawnResult spawn(const std::vector<std::string>& argv, const std::vector<std::string>& env, LaunchMode mode) {
  SpawnResult res;
  if (argv.empty()) { res.error = "empty argv"; return res; }
  auto cargv = c_array(argv);
  auto cenv = c_array(env);

  // The child reports an exec failure through this close-on-exec pipe; EOF means exec succeeded
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    res.error = std::string("pipe: ") + std::strerror(errno);
    return res;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    res.error = std::string("fork: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return res;
  }
  if (pid == 0) {
    ::close(fds[0]);
    if (mode == LaunchMode::Detached) {
      ::setsid();
      int devnull = ::open("/dev/null", O_RDWR);
      if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
      }
    }
    ::execve(cargv[0], cargv.data(), cenv.data());
    int err = errno;
    ssize_t w = ::write(fds[1], &err, sizeof(err));
    (void)w;
    ::_exit(127);
  }

  ::close(fds[1]);
  int child_err = 0;
  ssize_t n;
  do { n = ::read(fds[0], &child_err, sizeof(child_err)); } while (n < 0 && errno == EINTR);
  ::close(fds[0]);
  res.pid = static_cast<int32_t>(pid);

  if (n == static_cast<ssize_t>(sizeof(child_err))) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    res.error = "exec " + argv[0] + ": " + std::strerror(child_err);
    return res;
  }

  if (mode == LaunchMode::Detached) {
    res.ok = true;
    return res;
  }

  int st = 0;
  pid_t w;
  do { w = ::waitpid(pid, &st, 0); } while (w < 0 && errno == EINTR);
  if (w < 0) {
    res.error = std::string("waitpid: ") + std::strerror(errno);
    return res;
  }
  res.ok = true;
  if (WIFEXITED(st)) res.exit_status = WEXITSTATUS(st);
  else if (WIFSIGNALED(st)) res.exit_status = 128 + WTERMSIG(st);
  return res;
}

} // namespace ideguard::app
