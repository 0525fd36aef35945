#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "fleet/v1/module.pb.h"
#include "internal/invoke/subprocess.hpp"

namespace fleet::invoke {

struct ChannelOptions {
  // Environment variable that carries the encoded arguments.
  std::string args_env_var = "ANSIBLE_MODULE_ARGS";

  std::chrono::milliseconds kill_grace{500};
};

/*
  ModuleChannel

  Runs a module executable and interprets its exit code, stdout and stderr
  into a ModuleCallResult. Nothing about the module is trusted beyond that
  contract. Stateless after construction; safe to share between threads.
*/
class ModuleChannel {
 public:
  explicit ModuleChannel(ChannelOptions options = {});

  fleet::v1::ModuleCallResult Invoke(const std::string& executable_path, const google::protobuf::Struct& arguments,
                                     std::chrono::milliseconds timeout) const;

  // Same, passing argv[1..] (dynamic inventory sources take --list/--host).
  fleet::v1::ModuleCallResult Invoke(const std::string& executable_path, const google::protobuf::Struct& arguments,
                                     std::chrono::milliseconds timeout, const std::vector<std::string>& argv) const;

  // Builds the result for a finished process.
  static fleet::v1::ModuleCallResult Interpret(const std::string& module, ProcessOutput output);

  const ChannelOptions& options() const {
    return options_;
  }

 private:
  ChannelOptions options_;
};

/*
  Locates the result object in module stdout.

  Each line that starts with '{' opens a candidate document, which runs to
  its matching '}' and may span many lines (pretty-printed output). The
  first candidate that parses as a JSON object wins. Lines nested inside a
  candidate are never candidates of their own, and a candidate that is never
  closed ends the search. Output with no such line falls back to the first
  '{' anywhere.
*/
std::optional<google::protobuf::Struct> ExtractResultObject(std::string_view stdout_text);

bool Succeeded(const fleet::v1::ModuleCallResult& result);

// Throws ProtocolError / TimeoutError / std::runtime_error for failed results.
void ThrowIfFailed(const fleet::v1::ModuleCallResult& result);

std::string_view ErrorKindName(fleet::v1::ModuleErrorKind kind);

} // namespace fleet::invoke
