#pragma once

#include "sos/client/http_client.hpp"
#include "sos/common/result.hpp"
#include "sos/sandbox/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sos::client {

constexpr const char *kDefaultServerUrl = "http://localhost:3000";

/// Typed wrapper over the sandbox HTTP API. Non-2xx responses become
/// failures carrying the server's error code and message.
class SandboxClient {
public:
  SandboxClient(std::string base_url, std::shared_ptr<HttpClient> http,
                std::uint64_t timeout_ms = 600'000);

  [[nodiscard]] common::Result<std::string> health();
  [[nodiscard]] common::Result<std::string> create(const std::string &image,
                                                   const std::vector<std::string> &setup_commands,
                                                   bool start = false);
  [[nodiscard]] common::Result<std::string> list();
  [[nodiscard]] common::Result<std::string> show(const std::string &id);
  [[nodiscard]] common::Result<std::string> start(const std::string &id);
  [[nodiscard]] common::Result<sandbox::CommandResult>
  exec(const std::string &id, const std::string &command, bool standalone = false,
       std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  [[nodiscard]] common::Result<std::string> stop(const std::string &id, bool remove = false);
  [[nodiscard]] common::Status remove(const std::string &id);
  [[nodiscard]] common::Result<std::string> trajectory(const std::string &id, bool formatted);

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] std::string url(const std::string &path) const;
  [[nodiscard]] common::Result<std::string> check(const HttpResponse &response) const;

  std::string base_url_;
  std::shared_ptr<HttpClient> http_;
  std::uint64_t timeout_ms_;
};

} // namespace sos::client
