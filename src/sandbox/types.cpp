#include "sos/sandbox/types.hpp"

namespace sos::sandbox {

const char *to_string(const SandboxState state) {
  switch (state) {
  case SandboxState::Created:
    return "created";
  case SandboxState::Starting:
    return "starting";
  case SandboxState::Running:
    return "running";
  case SandboxState::Stopping:
    return "stopping";
  case SandboxState::Stopped:
    return "stopped";
  case SandboxState::Failed:
    return "failed";
  }
  return "failed";
}

bool is_terminal(const SandboxState state) {
  return state == SandboxState::Stopped || state == SandboxState::Failed;
}

bool is_legal_transition(const SandboxState from, const SandboxState to) {
  if (is_terminal(from)) {
    return false;
  }
  if (to == SandboxState::Failed) {
    return true;
  }
  switch (from) {
  case SandboxState::Created:
    return to == SandboxState::Starting;
  case SandboxState::Starting:
    return to == SandboxState::Running || to == SandboxState::Stopping;
  case SandboxState::Running:
    return to == SandboxState::Stopping;
  case SandboxState::Stopping:
    return to == SandboxState::Stopped;
  case SandboxState::Stopped:
  case SandboxState::Failed:
    return false;
  }
  return false;
}

const char *to_string(const ExecMode mode) {
  return mode == ExecMode::Standalone ? "standalone" : "session";
}

} // namespace sos::sandbox
