#pragma once

#include "sos/common/result.hpp"
#include "sos/sandbox/trajectory.hpp"
#include "sos/sandbox/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sos::gateway {

struct CreateSandboxBody {
  std::string image;
  std::vector<std::string> setup_commands;
  bool start = false;
};

struct ExecBody {
  std::string command;
  bool standalone = false;
  std::optional<std::chrono::milliseconds> timeout;
};

struct StopBody {
  bool remove = false;
};

/// Empty bodies are accepted and yield the defaults.
[[nodiscard]] common::Result<CreateSandboxBody> parse_create_body(const std::string &json);
[[nodiscard]] common::Result<ExecBody> parse_exec_body(const std::string &json);
[[nodiscard]] common::Result<StopBody> parse_stop_body(const std::string &json);

[[nodiscard]] int http_status_for(common::ErrorCode code);
/// Inverse of common::error_code_name; unknown names map to Internal.
[[nodiscard]] common::ErrorCode error_code_from_name(const std::string &name);

/// RFC 3339 UTC with milliseconds.
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point at);

[[nodiscard]] std::string error_json(const common::Status &status);
[[nodiscard]] std::string summary_json(const sandbox::SandboxSummary &summary);
[[nodiscard]] std::string summaries_json(const std::vector<sandbox::SandboxSummary> &summaries);
[[nodiscard]] std::string command_result_json(const sandbox::CommandResult &result,
                                              sandbox::ExecMode mode);
[[nodiscard]] std::string trajectory_json(const std::string &sandbox_id,
                                          const sandbox::TrajectorySnapshot &snapshot);

} // namespace sos::gateway
