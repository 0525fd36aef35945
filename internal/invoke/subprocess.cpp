#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <system_error>
#include <unordered_set>

#include "internal/util/time.hpp"

extern char** environ;

namespace fleet::invoke {

namespace {

// How long output already written by a SIGKILLed group may still be read.
constexpr std::chrono::milliseconds kKillDrain{50};

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&)            = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {
  }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = other.Release();
    }
    return *this;
  }

  int Get() const {
    return fd_;
  }
  bool Valid() const {
    return fd_ >= 0;
  }

  int Release() {
    int fd = fd_;
    fd_    = -1;
    return fd;
  }

  void Reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

Pipe MakePipe() {
  int fds[2];
  // O_CLOEXEC keeps concurrent invocations from inheriting each other's pipes
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::string ResolveExecutable(const std::string& name) {
  if (name.find('/') != std::string::npos) return name;

  const char* path = std::getenv("PATH");
  if (!path) return name;

  std::string dirs(path);
  size_t      start = 0;
  while (start <= dirs.size()) {
    auto end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();

    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0) return candidate;

    start = end + 1;
  }
  return name;
}

std::vector<std::string> BuildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::unordered_set<std::string> overridden;
  for (const auto& [key, value] : overrides) overridden.insert(key);

  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string item(*entry);
    auto        eq = item.find('=');
    if (eq != std::string::npos && overridden.count(item.substr(0, eq))) continue;
    env.push_back(std::move(item));
  }

  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> CStrings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) out.push_back(value.data());
  out.push_back(nullptr);
  return out;
}

// Reads what is available; returns false on EOF or a hard error.
bool DrainOnce(int fd, std::string* out) {
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out->append(buf, static_cast<size_t>(n));
      return true;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return false;
  }
}

void SignalGroup(pid_t pid, int sig) {
  // the child may not have called setpgid yet; fall back to the pid itself
  if (::kill(-pid, sig) != 0) ::kill(pid, sig);
}

} // namespace

ProcessOutput RunProcess(const ProcessSpec& spec) {
  ProcessOutput output;
  const auto    started = util::Now();

  std::vector<std::string> argv_storage;
  argv_storage.push_back(spec.executable);
  argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<std::string> env_storage = BuildEnvironment(spec.env);

  auto argv = CStrings(argv_storage);
  auto envp = CStrings(env_storage);

  const std::string executable = ResolveExecutable(spec.executable);

  Pipe out_pipe = MakePipe();
  Pipe err_pipe = MakePipe();

  UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // child: only async-signal-safe calls from here on
    ::setpgid(0, 0);
    if (dev_null.Valid()) ::dup2(dev_null.Get(), STDIN_FILENO);
    ::dup2(out_pipe.write.Get(), STDOUT_FILENO);
    ::dup2(err_pipe.write.Get(), STDERR_FILENO);
    ::execve(executable.c_str(), argv.data(), envp.data());
    ::_exit(127);
  }

  ::setpgid(pid, pid);

  out_pipe.write.Reset();
  err_pipe.write.Reset();
  dev_null.Reset();

  std::optional<util::TimePoint> deadline;
  if (spec.timeout.count() > 0) deadline = started + spec.timeout;
  std::optional<util::TimePoint> kill_at;
  std::optional<util::TimePoint> abandon_at;

  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    const auto now = util::Now();

    if (deadline && !output.timed_out && now >= *deadline) {
      output.timed_out = true;
      SignalGroup(pid, SIGTERM);
      kill_at = now + spec.kill_grace;
    }
    if (kill_at && now >= *kill_at) {
      SignalGroup(pid, SIGKILL);
      kill_at.reset();
      // a descendant that left the group can still hold the pipes open
      abandon_at = now + std::min(spec.kill_grace, kKillDrain);
    }
    if (abandon_at && now >= *abandon_at) break;

    int wait_ms = -1;
    if (abandon_at) {
      wait_ms = util::RemainingMillis(*abandon_at);
    } else if (kill_at) {
      wait_ms = util::RemainingMillis(*kill_at);
    } else if (deadline && !output.timed_out) {
      wait_ms = util::RemainingMillis(*deadline);
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = pollfd{out_pipe.read.Get(), POLLIN, 0};
    if (err_open) fds[count++] = pollfd{err_pipe.read.Get(), POLLIN, 0};

    const int ready = ::poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) continue;

    for (nfds_t i = 0; i < count; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

      if (fds[i].fd == out_pipe.read.Get()) {
        out_open = DrainOnce(fds[i].fd, &output.stdout_str);
      } else {
        err_open = DrainOnce(fds[i].fd, &output.stderr_str);
      }
    }
  }

  // stdout/stderr may close before the child exits; keep enforcing the deadline
  int   status = 0;
  pid_t waited = -1;
  for (;;) {
    waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) break;
    if (waited < 0 && errno != EINTR) break;

    const auto now = util::Now();
    if (deadline && !output.timed_out && now >= *deadline) {
      output.timed_out = true;
      SignalGroup(pid, SIGTERM);
      kill_at = now + spec.kill_grace;
    }
    if (kill_at && now >= *kill_at) {
      SignalGroup(pid, SIGKILL);
      kill_at.reset();
    }

    if (!deadline || (output.timed_out && !kill_at)) {
      do {
        waited = ::waitpid(pid, &status, 0);
      } while (waited < 0 && errno == EINTR);
      break;
    }

    ::usleep(5000);
  }

  if (waited == pid) {
    if (WIFEXITED(status)) {
      output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      output.term_signal = WTERMSIG(status);
      output.exit_code   = 128 + output.term_signal;
    }
  }

  output.duration_ms = util::MillisSince(started);
  return output;
}

} // namespace fleet::invoke
