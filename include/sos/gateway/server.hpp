#pragma once

#include "sos/common/cancellation.hpp"
#include "sos/common/result.hpp"
#include "sos/sandbox/orchestrator.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sos::gateway {

struct GatewayOptions {
  std::string host = "0.0.0.0";
  std::uint16_t port = 3000;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// HTTP control plane over an Orchestrator. Each connection is served on its
/// own thread so a long exec never blocks other sandboxes.
class GatewayServer {
public:
  explicit GatewayServer(std::shared_ptr<sandbox::Orchestrator> orchestrator);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  /// Stops accepting, cancels admission waits of in-flight requests and
  /// waits for their threads to finish.
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse route(const HttpRequest &request, std::string &route_label);
  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_create(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_list() const;
  [[nodiscard]] HttpResponse handle_describe(const std::string &id) const;
  [[nodiscard]] HttpResponse handle_discard(const std::string &id);
  [[nodiscard]] HttpResponse handle_start(const std::string &id);
  [[nodiscard]] HttpResponse handle_exec(const std::string &id, const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_stop(const std::string &id, const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_trajectory(const std::string &id, bool formatted) const;

  void accept_loop();
  void handle_client(int client_fd);

  std::shared_ptr<sandbox::Orchestrator> orchestrator_;
  common::CancellationToken shutdown_token_;
  std::size_t max_body_bytes_ = 1024 * 1024;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;

  std::mutex clients_mutex_;
  std::condition_variable clients_done_;
  std::size_t active_clients_ = 0;
};

} // namespace sos::gateway
