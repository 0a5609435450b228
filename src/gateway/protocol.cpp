#include "sos/gateway/protocol.hpp"

#include "sos/common/fs.hpp"
#include "sos/common/json_util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sos::gateway {

namespace {

common::Status check_object(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (!trimmed.empty() && (trimmed.front() != '{' || trimmed.back() != '}')) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "request body must be a JSON object");
  }
  return common::Status::success();
}

common::Result<bool> optional_flag(const std::string &json, const std::string &field) {
  if (!common::json_has_key(json, field)) {
    return common::Result<bool>::success(false);
  }
  const auto value = common::json_get_bool(json, field);
  if (!value.has_value()) {
    return common::Result<bool>::failure(common::ErrorCode::InvalidArgument,
                                         field + " must be true or false");
  }
  return common::Result<bool>::success(*value);
}

std::string optional_int(const std::optional<int> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

} // namespace

common::Result<CreateSandboxBody> parse_create_body(const std::string &json) {
  using BodyResult = common::Result<CreateSandboxBody>;
  if (auto shape = check_object(json); !shape.ok()) {
    return BodyResult::failure(shape);
  }
  CreateSandboxBody body;
  body.image = common::trim(common::json_get_string(json, "image"));
  if (common::json_has_key(json, "setup_commands")) {
    const std::string array = common::json_get_array(json, "setup_commands");
    if (!array.empty()) {
      body.setup_commands = common::json_get_string_array(json, "setup_commands");
    } else {
      // A single string is accepted as one command.
      const std::string single = common::json_get_string(json, "setup_commands");
      if (!common::trim(single).empty()) {
        body.setup_commands.push_back(single);
      }
    }
  }
  auto start = optional_flag(json, "start");
  if (!start.ok()) {
    return BodyResult::failure(start.status());
  }
  body.start = start.value();
  return BodyResult::success(std::move(body));
}

common::Result<ExecBody> parse_exec_body(const std::string &json) {
  using BodyResult = common::Result<ExecBody>;
  if (auto shape = check_object(json); !shape.ok()) {
    return BodyResult::failure(shape);
  }
  ExecBody body;
  body.command = common::json_get_string(json, "command");
  if (common::trim(body.command).empty()) {
    return BodyResult::failure(common::ErrorCode::InvalidArgument, "command is required");
  }
  auto standalone = optional_flag(json, "standalone");
  if (!standalone.ok()) {
    return BodyResult::failure(standalone.status());
  }
  body.standalone = standalone.value();

  const std::string timeout = common::json_get_number(json, "timeout_ms");
  if (!timeout.empty() && timeout != "null") {
    try {
      const long long millis = std::stoll(timeout);
      if (millis <= 0) {
        return BodyResult::failure(common::ErrorCode::InvalidArgument,
                                   "timeout_ms must be positive");
      }
      body.timeout = std::chrono::milliseconds(millis);
    } catch (const std::exception &) {
      return BodyResult::failure(common::ErrorCode::InvalidArgument,
                                 "timeout_ms must be an integer");
    }
  }
  return BodyResult::success(std::move(body));
}

common::Result<StopBody> parse_stop_body(const std::string &json) {
  if (auto shape = check_object(json); !shape.ok()) {
    return common::Result<StopBody>::failure(shape);
  }
  auto remove = optional_flag(json, "remove");
  if (!remove.ok()) {
    return common::Result<StopBody>::failure(remove.status());
  }
  return common::Result<StopBody>::success(StopBody{.remove = remove.value()});
}

int http_status_for(const common::ErrorCode code) {
  switch (code) {
  case common::ErrorCode::None:
    return 200;
  case common::ErrorCode::InvalidArgument:
  case common::ErrorCode::SetupFailed:
    return 400;
  case common::ErrorCode::NotFound:
    return 404;
  case common::ErrorCode::InvalidTransition:
    return 409;
  case common::ErrorCode::AdmissionExhausted:
  case common::ErrorCode::Cancelled:
    return 503;
  case common::ErrorCode::SessionTimeout:
    return 504;
  case common::ErrorCode::Runtime:
  case common::ErrorCode::SessionClosed:
    return 502;
  case common::ErrorCode::Internal:
    return 500;
  }
  return 500;
}

common::ErrorCode error_code_from_name(const std::string &name) {
  for (const auto code :
       {common::ErrorCode::InvalidArgument, common::ErrorCode::NotFound,
        common::ErrorCode::InvalidTransition, common::ErrorCode::AdmissionExhausted,
        common::ErrorCode::Runtime, common::ErrorCode::SetupFailed,
        common::ErrorCode::SessionTimeout, common::ErrorCode::SessionClosed,
        common::ErrorCode::Cancelled}) {
    if (name == common::error_code_name(code)) {
      return code;
    }
  }
  return common::ErrorCode::Internal;
}

std::string format_timestamp(const std::chrono::system_clock::time_point at) {
  const auto seconds = std::chrono::system_clock::to_time_t(at);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count() % 1000;
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0')
      << millis << "Z";
  return out.str();
}

std::string error_json(const common::Status &status) {
  return std::string("{\"error\":") + common::json_string(common::error_code_name(status.code())) +
         ",\"message\":" + common::json_string(status.error()) + "}";
}

std::string summary_json(const sandbox::SandboxSummary &summary) {
  std::ostringstream body;
  body << "{";
  body << "\"id\":" << common::json_string(summary.id) << ",";
  body << "\"image\":" << common::json_string(summary.image) << ",";
  body << "\"setup_commands\":" << common::json_string_array(summary.setup_commands) << ",";
  body << "\"status\":" << common::json_string(sandbox::to_string(summary.state)) << ",";
  if (!summary.failure_reason.empty()) {
    body << "\"failure_reason\":" << common::json_string(summary.failure_reason) << ",";
  }
  body << "\"created_at\":" << common::json_string(format_timestamp(summary.created_at)) << ",";
  body << "\"started_at\":"
       << (summary.started_at.has_value() ? common::json_string(format_timestamp(*summary.started_at))
                                          : "null")
       << ",";
  body << "\"session_command_count\":" << summary.session_command_count << ",";
  body << "\"standalone_command_count\":" << summary.standalone_command_count << ",";
  body << "\"last_standalone_exit_code\":" << optional_int(summary.last_standalone_exit_code);
  body << "}";
  return body.str();
}

std::string summaries_json(const std::vector<sandbox::SandboxSummary> &summaries) {
  std::string out = "[";
  for (std::size_t i = 0; i < summaries.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += summary_json(summaries[i]);
  }
  return out + "]";
}

std::string command_result_json(const sandbox::CommandResult &result,
                                 const sandbox::ExecMode mode) {
  std::ostringstream body;
  body << "{";
  body << "\"stdout\":" << common::json_string(result.stdout_text) << ",";
  body << "\"stderr\":" << common::json_string(result.stderr_text) << ",";
  body << "\"exit_code\":" << result.exit_code << ",";
  body << "\"mode\":" << common::json_string(sandbox::to_string(mode));
  body << "}";
  return body.str();
}

std::string trajectory_json(const std::string &sandbox_id,
                            const sandbox::TrajectorySnapshot &snapshot) {
  std::ostringstream body;
  body << "{";
  body << "\"sandbox_id\":" << common::json_string(sandbox_id) << ",";
  body << "\"command_count\":" << snapshot.records.size() << ",";
  body << "\"truncated\":" << (snapshot.truncated ? "true" : "false") << ",";
  body << "\"dropped\":" << snapshot.dropped << ",";
  body << "\"trajectory\":[";
  for (std::size_t i = 0; i < snapshot.records.size(); ++i) {
    const auto &record = snapshot.records[i];
    if (i > 0) {
      body << ",";
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.finished_at - record.started_at);
    body << "{";
    body << "\"index\":" << record.index << ",";
    body << "\"command\":" << common::json_string(record.command) << ",";
    body << "\"mode\":" << common::json_string(sandbox::to_string(record.mode)) << ",";
    body << "\"started_at\":" << common::json_string(format_timestamp(record.started_at)) << ",";
    body << "\"finished_at\":" << common::json_string(format_timestamp(record.finished_at))
         << ",";
    body << "\"duration_ms\":" << duration.count() << ",";
    body << "\"result\":{";
    body << "\"stdout\":" << common::json_string(record.stdout_text) << ",";
    body << "\"stderr\":" << common::json_string(record.stderr_text) << ",";
    body << "\"exit_code\":" << record.exit_code;
    body << "}";
    if (!record.error.empty()) {
      body << ",\"error\":" << common::json_string(record.error);
    }
    body << "}";
  }
  body << "]}";
  return body.str();
}

} // namespace sos::gateway
