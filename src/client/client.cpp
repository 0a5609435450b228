#include "sos/client/client.hpp"

#include "sos/common/fs.hpp"
#include "sos/common/json_util.hpp"
#include "sos/gateway/protocol.hpp"

namespace sos::client {

namespace {

common::Result<int> parse_exit_code(const std::string &body) {
  const std::string raw = common::json_get_number(body, "exit_code");
  try {
    return common::Result<int>::success(std::stoi(raw));
  } catch (const std::exception &) {
    return common::Result<int>::failure(common::ErrorCode::Internal,
                                        "response has no exit_code: " + body);
  }
}

} // namespace

SandboxClient::SandboxClient(std::string base_url, std::shared_ptr<HttpClient> http,
                             const std::uint64_t timeout_ms)
    : base_url_(std::move(base_url)), http_(std::move(http)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string SandboxClient::url(const std::string &path) const { return base_url_ + path; }

common::Result<std::string> SandboxClient::check(const HttpResponse &response) const {
  using BodyResult = common::Result<std::string>;
  if (response.network_error) {
    return BodyResult::failure(common::ErrorCode::Runtime,
                               "cannot reach " + base_url_ + ": " +
                                   response.network_error_message);
  }
  if (response.status >= 200 && response.status < 300) {
    return BodyResult::success(response.body);
  }
  const std::string name = common::json_get_string(response.body, "error");
  std::string message = common::json_get_string(response.body, "message");
  if (message.empty()) {
    message = common::trim(response.body);
  }
  const auto code = name.empty() ? common::ErrorCode::Internal
                                 : gateway::error_code_from_name(name);
  return BodyResult::failure(code, "HTTP " + std::to_string(response.status) + ": " + message);
}

common::Result<std::string> SandboxClient::health() {
  return check(http_->get(url("/health"), {}, timeout_ms_));
}

common::Result<std::string> SandboxClient::create(const std::string &image,
                                                  const std::vector<std::string> &setup_commands,
                                                  const bool start) {
  std::string body = "{";
  if (!image.empty()) {
    body += "\"image\":" + common::json_string(image) + ",";
  }
  body += "\"setup_commands\":" + common::json_string_array(setup_commands) + ",";
  body += std::string("\"start\":") + (start ? "true" : "false") + "}";

  auto response = check(http_->post_json(url("/sandboxes"), {}, body, timeout_ms_));
  if (!response.ok()) {
    return response;
  }
  const std::string id = common::json_get_string(response.value(), "id");
  if (id.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::Internal,
                                                "response has no id: " + response.value());
  }
  return common::Result<std::string>::success(id);
}

common::Result<std::string> SandboxClient::list() {
  return check(http_->get(url("/sandboxes"), {}, timeout_ms_));
}

common::Result<std::string> SandboxClient::show(const std::string &id) {
  return check(http_->get(url("/sandboxes/" + id), {}, timeout_ms_));
}

common::Result<std::string> SandboxClient::start(const std::string &id) {
  return check(http_->post_json(url("/sandboxes/" + id + "/start"), {}, "{}", timeout_ms_));
}

common::Result<sandbox::CommandResult>
SandboxClient::exec(const std::string &id, const std::string &command, const bool standalone,
                    const std::optional<std::chrono::milliseconds> timeout) {
  using ExecResult = common::Result<sandbox::CommandResult>;
  std::string body = "{\"command\":" + common::json_string(command) +
                     ",\"standalone\":" + (standalone ? "true" : "false");
  if (timeout.has_value()) {
    body += ",\"timeout_ms\":" + std::to_string(timeout->count());
  }
  body += "}";

  auto response =
      check(http_->post_json(url("/sandboxes/" + id + "/exec"), {}, body, timeout_ms_));
  if (!response.ok()) {
    return ExecResult::failure(response.status());
  }
  auto exit_code = parse_exit_code(response.value());
  if (!exit_code.ok()) {
    return ExecResult::failure(exit_code.status());
  }
  return ExecResult::success(sandbox::CommandResult{
      .stdout_text = common::json_get_string(response.value(), "stdout"),
      .stderr_text = common::json_get_string(response.value(), "stderr"),
      .exit_code = exit_code.value(),
  });
}

common::Result<std::string> SandboxClient::stop(const std::string &id, const bool remove) {
  const std::string body = std::string("{\"remove\":") + (remove ? "true" : "false") + "}";
  return check(http_->post_json(url("/sandboxes/" + id + "/stop"), {}, body, timeout_ms_));
}

common::Status SandboxClient::remove(const std::string &id) {
  return check(http_->del(url("/sandboxes/" + id), {}, timeout_ms_)).status();
}

common::Result<std::string> SandboxClient::trajectory(const std::string &id,
                                                      const bool formatted) {
  const std::string path =
      "/sandboxes/" + id + (formatted ? "/trajectory/formatted" : "/trajectory");
  return check(http_->get(url(path), {}, timeout_ms_));
}

} // namespace sos::client
