#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sos::sandbox {

enum class SandboxState {
  Created,
  Starting,
  Running,
  Stopping,
  Stopped,
  Failed,
};

[[nodiscard]] const char *to_string(SandboxState state);
[[nodiscard]] bool is_terminal(SandboxState state);

/// Forward edges of the lifecycle plus `* -> Failed` from any live state.
[[nodiscard]] bool is_legal_transition(SandboxState from, SandboxState to);

struct SandboxSpec {
  std::string image;
  std::vector<std::string> setup_commands;
};

enum class ExecMode { Session, Standalone };

[[nodiscard]] const char *to_string(ExecMode mode);

struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
};

/// One trajectory entry. `index` is assigned on append and keeps counting
/// across evictions.
struct CommandRecord {
  std::uint64_t index = 0;
  std::string command;
  ExecMode mode = ExecMode::Session;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  // Set when the engine, not the command, failed (timeout, closed session).
  std::string error;
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

struct SandboxSummary {
  std::string id;
  std::string image;
  std::vector<std::string> setup_commands;
  SandboxState state = SandboxState::Created;
  std::string failure_reason;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::uint64_t session_command_count = 0;
  std::uint64_t standalone_command_count = 0;
  std::optional<int> last_standalone_exit_code;
};

} // namespace sos::sandbox
