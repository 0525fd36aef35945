#include "module_channel.hpp"

#include "internal/invoke/args_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::invoke {

using fleet::v1::ModuleCallResult;
using fleet::v1::ModuleErrorKind;

namespace {

constexpr char kChanged[] = "changed";
constexpr char kFailed[]  = "failed";
constexpr char kSkipped[] = "skipped";
constexpr char kMsg[]     = "msg";

std::string_view TrimLeft(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) return {};
  return text.substr(first);
}

bool BoolField(const google::protobuf::Struct& object, const char* key) {
  auto it = object.fields().find(key);
  return it != object.fields().end() && it->second.has_bool_value() && it->second.bool_value();
}

// One past the bracket that closes the one at `open`, or npos if the text ends
// first. Brackets inside string literals do not count.
size_t MatchClose(std::string_view text, size_t open) {
  int  depth     = 0;
  bool in_string = false;
  for (size_t i = open; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    switch (c) {
      case '"':
        in_string = true;
        break;
      case '{':
      case '[':
        ++depth;
        break;
      case '}':
      case ']':
        if (--depth == 0) return i + 1;
        break;
      default:
        break;
    }
  }
  return std::string_view::npos;
}

} // namespace

std::optional<google::protobuf::Struct> ExtractResultObject(std::string_view stdout_text) {
  bool   saw_candidate = false;
  size_t start         = 0;
  while (start < stdout_text.size()) {
    auto end = stdout_text.find('\n', start);
    if (end == std::string_view::npos) end = stdout_text.size();

    const auto line = TrimLeft(stdout_text.substr(start, end - start));
    if (!line.empty() && line.front() == '{') {
      saw_candidate    = true;
      const auto open  = static_cast<size_t>(line.data() - stdout_text.data());
      const auto close = MatchClose(stdout_text, open);
      // an object that never closes swallows every later line
      if (close == std::string_view::npos) return std::nullopt;
      if (auto object = util::ParseJsonObject(stdout_text.substr(open, close - open))) return object;

      // lines inside a rejected candidate are not candidates themselves
      end = stdout_text.find('\n', close);
      if (end == std::string_view::npos) break;
    }
    start = end + 1;
  }
  if (saw_candidate) return std::nullopt;

  // the object does not start a line, e.g. "result: {...}"
  const auto brace = stdout_text.find('{');
  if (brace == std::string_view::npos) return std::nullopt;
  const auto close = MatchClose(stdout_text, brace);
  if (close == std::string_view::npos) return std::nullopt;
  return util::ParseJsonObject(stdout_text.substr(brace, close - brace));
}

ModuleChannel::ModuleChannel(ChannelOptions options) : options_(std::move(options)) {
}

ModuleCallResult ModuleChannel::Invoke(const std::string& executable_path, const google::protobuf::Struct& arguments,
                                       std::chrono::milliseconds timeout) const {
  return Invoke(executable_path, arguments, timeout, {});
}

ModuleCallResult ModuleChannel::Invoke(const std::string& executable_path, const google::protobuf::Struct& arguments,
                                       std::chrono::milliseconds timeout, const std::vector<std::string>& argv) const {
  ProcessSpec spec;
  spec.executable = executable_path;
  spec.args       = argv;
  spec.env.emplace_back(options_.args_env_var, ArgsCodec::Encode(arguments));
  spec.timeout    = timeout;
  spec.kill_grace = options_.kill_grace;

  observability::SpanScope span("fleet.module.invoke");
  span.SetAttribute("module", executable_path);
  span.SetAttribute("timeout_ms", static_cast<std::int64_t>(timeout.count()));

  FLEET_LOG_DEBUG("Invoking module", {observability::StringField("module", executable_path),
                                      observability::IntField("timeout_ms", timeout.count())});

  auto result = Interpret(executable_path, RunProcess(spec));

  span.SetAttribute("exit_code", static_cast<std::int64_t>(result.exit_code()));
  span.SetAttribute("changed", result.changed());
  span.SetAttribute("failed", result.failed());
  if (result.failed()) span.RecordException(result.msg());

  if (result.error() == fleet::v1::MODULE_ERROR_KIND_TIMEOUT || result.error() == fleet::v1::MODULE_ERROR_KIND_PROTOCOL_ERROR) {
    FLEET_LOG_WARN("Module invocation failed", {observability::StringField("module", executable_path),
                                                observability::StringField("error", ErrorKindName(result.error())),
                                                observability::IntField("exit_code", result.exit_code())});
  } else {
    FLEET_LOG_DEBUG("Module finished", {observability::StringField("module", executable_path),
                                        observability::BoolField("failed", result.failed()),
                                        observability::BoolField("changed", result.changed()),
                                        observability::IntField("duration_ms", static_cast<int64_t>(result.duration_ms()))});
  }

  return result;
}

ModuleCallResult ModuleChannel::Interpret(const std::string& module, ProcessOutput output) {
  ModuleCallResult result;
  result.set_module(module);
  result.set_exit_code(output.exit_code);
  result.set_duration_ms(output.duration_ms);
  result.set_stderr(std::move(output.stderr_str));

  if (output.timed_out) {
    result.set_failed(true);
    result.set_error(fleet::v1::MODULE_ERROR_KIND_TIMEOUT);
    result.set_msg("module timed out after " + std::to_string(output.duration_ms) + " ms");
    result.set_raw_stdout(std::move(output.stdout_str));
    return result;
  }

  auto object = ExtractResultObject(output.stdout_str);
  result.set_raw_stdout(std::move(output.stdout_str));

  if (!object) {
    result.set_failed(true);
    result.set_error(fleet::v1::MODULE_ERROR_KIND_PROTOCOL_ERROR);
    result.set_msg("module output is not a JSON object (exit code " + std::to_string(output.exit_code) + ")");
    return result;
  }

  result.set_changed(BoolField(*object, kChanged));
  result.set_skipped(BoolField(*object, kSkipped));

  auto msg = object->fields().find(kMsg);
  if (msg != object->fields().end()) {
    result.set_msg(msg->second.has_string_value() ? msg->second.string_value() : util::ValueToJson(msg->second));
  }

  for (const auto& [key, value] : object->fields()) {
    if (key == kChanged || key == kFailed || key == kSkipped || key == kMsg) continue;
    (*result.mutable_data()->mutable_fields())[key] = value;
  }

  // either condition alone is a failure
  const bool failed = BoolField(*object, kFailed) || output.exit_code != 0;
  result.set_failed(failed);
  if (failed) {
    result.set_error(fleet::v1::MODULE_ERROR_KIND_MODULE_FAILED);
    if (result.msg().empty()) result.set_msg("module exited with code " + std::to_string(output.exit_code));
  }

  return result;
}

bool Succeeded(const ModuleCallResult& result) {
  return !result.failed() && result.exit_code() == 0 && result.error() == fleet::v1::MODULE_ERROR_KIND_NONE;
}

void ThrowIfFailed(const ModuleCallResult& result) {
  switch (result.error()) {
    case fleet::v1::MODULE_ERROR_KIND_NONE:
      return;
    case fleet::v1::MODULE_ERROR_KIND_TIMEOUT:
      throw util::TimeoutError(result.module() + ": " + result.msg(), result.raw_stdout());
    case fleet::v1::MODULE_ERROR_KIND_PROTOCOL_ERROR:
      throw util::ProtocolError(result.module() + ": " + result.msg(), result.raw_stdout(), result.exit_code());
    default:
      throw std::runtime_error(result.module() + ": " + result.msg());
  }
}

std::string_view ErrorKindName(ModuleErrorKind kind) {
  switch (kind) {
    case fleet::v1::MODULE_ERROR_KIND_NONE:
      return "none";
    case fleet::v1::MODULE_ERROR_KIND_MODULE_FAILED:
      return "module_failed";
    case fleet::v1::MODULE_ERROR_KIND_PROTOCOL_ERROR:
      return "protocol_error";
    case fleet::v1::MODULE_ERROR_KIND_TIMEOUT:
      return "timeout";
    default:
      return "unknown";
  }
}

} // namespace fleet::invoke
