#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fleet::invoke {

struct ProcessSpec {
  std::string executable;

  // argv[1..]
  std::vector<std::string> args;

  // Set in the child on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;

  // zero = no deadline
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds kill_grace{500};
};

struct ProcessOutput {
  // WEXITSTATUS, or 128 + signal number when the child was killed
  int  exit_code   = -1;
  int  term_signal = 0;
  bool timed_out   = false;

  std::string stdout_str;
  std::string stderr_str;

  uint64_t duration_ms = 0;
};

/*
  Runs one child process to completion.

  The child gets its own process group, stdin from /dev/null and private
  stdout/stderr pipes. On timeout the whole group receives SIGTERM, then
  SIGKILL once kill_grace has elapsed. Pipes still open shortly after the
  SIGKILL are abandoned, so a call returns within about timeout + kill_grace
  however the child behaves. Throws std::system_error only when the
  OS refuses pipe/fork; an executable that cannot be exec'd exits with 127.
*/
ProcessOutput RunProcess(const ProcessSpec& spec);

} // namespace fleet::invoke
