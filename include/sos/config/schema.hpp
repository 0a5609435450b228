#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sos::config {

struct ServerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 3000;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct SandboxConfig {
  std::uint32_t max_sandboxes = 10;
  std::string default_image = "ubuntu:latest";
  // 0: reject immediately when no capacity is free.
  std::uint64_t admission_wait_ms = 0;
  std::uint64_t exec_timeout_ms = 30'000;
  std::uint64_t standalone_timeout_ms = 60'000;
  std::uint64_t session_init_timeout_ms = 10'000;
  std::uint64_t probe_timeout_ms = 2'000;
  // 0 disables the lifetime reaper.
  std::uint64_t max_lifetime_secs = 600;
  std::uint64_t reap_interval_secs = 60;
  // 0 keeps every record.
  std::size_t trajectory_max_records = 0;
  std::string workdir;
};

struct RuntimeConfig {
  std::string kind = "docker";
  std::string docker_binary = "docker";
  std::string shell = "/bin/bash";
  std::uint64_t command_timeout_ms = 60'000;
  std::uint64_t pull_timeout_ms = 600'000;
  bool pull_missing_images = true;
  std::uint32_t start_poll_attempts = 6;
  std::uint64_t start_poll_interval_ms = 500;
  std::uint64_t retry_backoff_ms = 250;
  std::string network;
  std::string memory_limit;
  std::string cpu_limit;
  std::uint32_t pids_limit = 0;
  std::vector<std::string> env;
  std::string container_prefix = "sos-";
  std::string native_root;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  SandboxConfig sandbox;
  RuntimeConfig runtime;
  ObservabilityConfig observability;
};

} // namespace sos::config
