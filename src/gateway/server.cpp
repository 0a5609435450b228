#include "sos/gateway/server.hpp"

#include "sos/common/fs.hpp"
#include "sos/common/json_util.hpp"
#include "sos/gateway/protocol.hpp"
#include "sos/observability/global.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#ifndef SOS_VERSION
#define SOS_VERSION "0.1.0"
#endif

namespace sos::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderSize = 16 * 1024;
constexpr int kClientReadTimeoutSecs = 30;
const std::string kSandboxPrefix = "/sandboxes/";

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const std::string lowered = common::to_lower(key);
  auto it = request.headers.find(lowered);
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::string status_text(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

HttpResponse make_json_response(int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_text_response(int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "text/plain; charset=utf-8";
  response.body = body;
  return response;
}

HttpResponse make_error_response(const common::Status &status) {
  return make_json_response(http_status_for(status.code()), error_json(status));
}

HttpResponse method_not_allowed(const std::string &allow) {
  auto response = make_json_response(
      405, error_json(common::Status::error(common::ErrorCode::InvalidArgument,
                                            "method not allowed; use " + allow)));
  response.headers["Allow"] = allow;
  return response;
}

HttpResponse not_found(const std::string &path) {
  return make_error_response(
      common::Status::error(common::ErrorCode::NotFound, "no route for " + path));
}

void send_all(const int fd, const std::string &text) {
  std::size_t offset = 0;
  while (offset < text.size()) {
    const ssize_t sent = send(fd, text.data() + offset, text.size() - offset, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return;
    }
    offset += static_cast<std::size_t>(sent);
  }
}

} // namespace

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::InvalidArgument,
                                                "incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  const std::string body = raw.substr(header_end + 4);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::InvalidArgument,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::InvalidArgument,
                                                "invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    const std::string value = common::trim(line.substr(colon + 1));
    request.headers[key] = value;
  }

  request.body = body;
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  while (request.path.size() > 1 && request.path.back() == '/') {
    request.path.pop_back();
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

GatewayServer::GatewayServer(std::shared_ptr<sandbox::Orchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }
  max_body_bytes_ = options.max_body_bytes;

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  observability::record_server("listening", host + ":" + std::to_string(bound_port_));
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  shutdown_token_.cancel();
  std::unique_lock<std::mutex> lock(clients_mutex_);
  clients_done_.wait(lock, [this] { return active_clients_ == 0; });
  observability::record_server("stopped");
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

HttpResponse GatewayServer::dispatch_for_test(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  std::string route_label = request.path;
  HttpResponse response = route(request, route_label);
  observability::record_metric(observability::RequestLatencyMetric{
      .route = request.method + " " + route_label,
      .status = response.status,
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started),
  });
  return response;
}

HttpResponse GatewayServer::route(const HttpRequest &request, std::string &route_label) {
  const std::string &method = request.method;
  if (request.path == "/health") {
    return method == "GET" ? handle_health() : method_not_allowed("GET");
  }
  if (request.path == "/sandboxes") {
    if (method == "POST") {
      return handle_create(request);
    }
    if (method == "GET") {
      return handle_list();
    }
    return method_not_allowed("GET, POST");
  }
  if (!common::starts_with(request.path, kSandboxPrefix)) {
    return not_found(request.path);
  }

  const std::string rest = request.path.substr(kSandboxPrefix.size());
  const auto slash = rest.find('/');
  const std::string id = rest.substr(0, slash);
  const std::string action = slash == std::string::npos ? "" : rest.substr(slash + 1);
  if (id.empty()) {
    return not_found(request.path);
  }
  route_label = "/sandboxes/{id}" + (action.empty() ? "" : "/" + action);

  if (action.empty()) {
    if (method == "GET") {
      return handle_describe(id);
    }
    if (method == "DELETE") {
      return handle_discard(id);
    }
    return method_not_allowed("GET, DELETE");
  }
  if (action == "start" || action == "exec" || action == "stop") {
    if (method != "POST") {
      return method_not_allowed("POST");
    }
    if (action == "start") {
      return handle_start(id);
    }
    if (action == "exec") {
      return handle_exec(id, request);
    }
    return handle_stop(id, request);
  }
  if (action == "trajectory" || action == "trajectory/formatted") {
    if (method != "GET") {
      return method_not_allowed("GET");
    }
    return handle_trajectory(id, action == "trajectory/formatted");
  }
  return not_found(request.path);
}

HttpResponse GatewayServer::handle_health() const {
  const auto &admission = orchestrator_->admission();
  std::ostringstream body;
  body << "{";
  body << "\"status\":\"ok\",";
  body << "\"version\":" << common::json_string(SOS_VERSION) << ",";
  body << "\"runtime\":" << common::json_string(std::string(orchestrator_->runtime_name()))
       << ",";
  body << "\"admission\":{";
  body << "\"capacity\":" << admission.capacity() << ",";
  body << "\"in_use\":" << admission.in_use() << ",";
  body << "\"waiting\":" << admission.waiting();
  body << "}";
  body << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_create(const HttpRequest &request) {
  auto body = parse_create_body(request.body);
  if (!body.ok()) {
    return make_error_response(body.status());
  }
  auto created = orchestrator_->create(sandbox::SandboxSpec{
      .image = body.value().image,
      .setup_commands = body.value().setup_commands,
  });
  if (!created.ok()) {
    return make_error_response(created.status());
  }
  const std::string id = created.value();

  if (body.value().start) {
    auto started = orchestrator_->start(id, &shutdown_token_);
    if (!started.ok()) {
      auto state = orchestrator_->describe(id);
      if (state.ok() && state.value().state == sandbox::SandboxState::Created) {
        // Never admitted: drop the record so a retry does not leave debris.
        if (auto dropped = orchestrator_->discard(id); !dropped.ok()) {
          observability::record_error("gateway", dropped.error());
        }
      }
      return make_error_response(started);
    }
  }

  auto summary = orchestrator_->describe(id);
  const std::string state = summary.ok() ? sandbox::to_string(summary.value().state)
                                         : sandbox::to_string(sandbox::SandboxState::Created);
  return make_json_response(201, "{\"id\":" + common::json_string(id) +
                                     ",\"status\":" + common::json_string(state) + "}");
}

HttpResponse GatewayServer::handle_list() const {
  return make_json_response(200, summaries_json(orchestrator_->list()));
}

HttpResponse GatewayServer::handle_describe(const std::string &id) const {
  auto summary = orchestrator_->describe(id);
  if (!summary.ok()) {
    return make_error_response(summary.status());
  }
  return make_json_response(200, summary_json(summary.value()));
}

HttpResponse GatewayServer::handle_discard(const std::string &id) {
  if (auto discarded = orchestrator_->discard(id); !discarded.ok()) {
    return make_error_response(discarded);
  }
  return make_json_response(200, "{\"id\":" + common::json_string(id) + ",\"removed\":true}");
}

HttpResponse GatewayServer::handle_start(const std::string &id) {
  if (auto started = orchestrator_->start(id, &shutdown_token_); !started.ok()) {
    return make_error_response(started);
  }
  return handle_describe(id);
}

HttpResponse GatewayServer::handle_exec(const std::string &id, const HttpRequest &request) {
  auto body = parse_exec_body(request.body);
  if (!body.ok()) {
    return make_error_response(body.status());
  }
  const auto mode =
      body.value().standalone ? sandbox::ExecMode::Standalone : sandbox::ExecMode::Session;
  auto result = orchestrator_->exec(
      id,
      sandbox::ExecRequest{
          .command = body.value().command, .mode = mode, .timeout = body.value().timeout},
      &shutdown_token_);
  if (!result.ok()) {
    return make_error_response(result.status());
  }
  return make_json_response(200, command_result_json(result.value(), mode));
}

HttpResponse GatewayServer::handle_stop(const std::string &id, const HttpRequest &request) {
  auto body = parse_stop_body(request.body);
  if (!body.ok()) {
    return make_error_response(body.status());
  }
  auto stopped = orchestrator_->stop(id, body.value().remove);
  if (!stopped.ok()) {
    return make_error_response(stopped.status());
  }
  return make_json_response(200, summary_json(stopped.value()));
}

HttpResponse GatewayServer::handle_trajectory(const std::string &id, const bool formatted) const {
  if (formatted) {
    auto text = orchestrator_->formatted_trajectory(id);
    if (!text.ok()) {
      return make_error_response(text.status());
    }
    return make_text_response(200, text.value());
  }
  auto snapshot = orchestrator_->trajectory(id);
  if (!snapshot.ok()) {
    return make_error_response(snapshot.status());
  }
  return make_json_response(200, trajectory_json(id, snapshot.value()));
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client =
        accept4(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len, SOCK_CLOEXEC);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    timeval read_timeout{};
    read_timeout.tv_sec = kClientReadTimeoutSecs;
    setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &read_timeout, sizeof(read_timeout));

    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      ++active_clients_;
    }
    std::thread([this, client]() {
      handle_client(client);
      close(client);
      {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        --active_clients_;
      }
      clients_done_.notify_all();
    }).detach();
  }
}

void GatewayServer::handle_client(int client_fd) {
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (max_body_bytes_ + kMaxHeaderSize)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (!header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        header_parsed = true;
        auto parsed = parse_http_request(raw.substr(0, header_end + 4));
        if (parsed.ok()) {
          const std::string cl = header_lookup(parsed.value(), "content-length");
          if (!cl.empty()) {
            try {
              content_length = static_cast<std::size_t>(std::stoull(cl));
            } catch (const std::exception &) {
              content_length = 0;
            }
          }
        }
        if (content_length > max_body_bytes_) {
          send_all(client_fd, render_http_response(make_json_response(
                                  413, error_json(common::Status::error(
                                           common::ErrorCode::InvalidArgument,
                                           "request body too large")))));
          return;
        }
      } else if (raw.size() > kMaxHeaderSize) {
        break;
      }
    }

    if (header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos &&
          raw.size() >= header_end + 4 + content_length) {
        break;
      }
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_error_response(parsed.status());
  } else {
    response = dispatch_for_test(parsed.value());
  }
  send_all(client_fd, render_http_response(response));
}

} // namespace sos::gateway
