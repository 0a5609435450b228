#pragma once

#include "sos/common/result.hpp"
#include "sos/sandbox/process.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sos::sandbox {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
};

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  /// Runs `docker <args...>`.
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;

  /// argv prefix for long-lived docker processes (attach).
  [[nodiscard]] virtual std::vector<std::string> command_prefix() const = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker") : binary_(std::move(binary)) {}

  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

  [[nodiscard]] std::vector<std::string> command_prefix() const override { return {binary_}; }

private:
  std::string binary_;
};

} // namespace sos::sandbox
