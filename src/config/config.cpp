#include "sos/config/config.hpp"

#include "sos/common/fs.hpp"
#include "sos/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sos::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sos";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SOS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SOS_ENV_FILE"); env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one (first writer wins).
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string text = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::string> env_string(const char *name) {
  if (const char *raw = std::getenv(name); raw != nullptr && *raw != '\0') {
    return std::string(raw);
  }
  return std::nullopt;
}

void load_server_config(Config &config, const common::TomlDocument &doc) {
  config.server.host = doc.get_string("server.host", config.server.host);
  const auto port = doc.get_u64("server.port", config.server.port);
  config.server.port = port > 65535 ? 0 : static_cast<std::uint16_t>(port);
  config.server.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("server.max_body_bytes", config.server.max_body_bytes));
}

void load_sandbox_config(Config &config, const common::TomlDocument &doc) {
  auto &sandbox = config.sandbox;
  sandbox.max_sandboxes =
      static_cast<std::uint32_t>(doc.get_u64("sandbox.max_sandboxes", sandbox.max_sandboxes));
  sandbox.default_image = doc.get_string("sandbox.default_image", sandbox.default_image);
  sandbox.admission_wait_ms = doc.get_u64("sandbox.admission_wait_ms", sandbox.admission_wait_ms);
  sandbox.exec_timeout_ms = doc.get_u64("sandbox.exec_timeout_ms", sandbox.exec_timeout_ms);
  sandbox.standalone_timeout_ms =
      doc.get_u64("sandbox.standalone_timeout_ms", sandbox.standalone_timeout_ms);
  sandbox.session_init_timeout_ms =
      doc.get_u64("sandbox.session_init_timeout_ms", sandbox.session_init_timeout_ms);
  sandbox.probe_timeout_ms = doc.get_u64("sandbox.probe_timeout_ms", sandbox.probe_timeout_ms);
  sandbox.max_lifetime_secs = doc.get_u64("sandbox.max_lifetime_secs", sandbox.max_lifetime_secs);
  sandbox.reap_interval_secs =
      doc.get_u64("sandbox.reap_interval_secs", sandbox.reap_interval_secs);
  sandbox.trajectory_max_records = static_cast<std::size_t>(
      doc.get_u64("sandbox.trajectory_max_records", sandbox.trajectory_max_records));
  sandbox.workdir = doc.get_string("sandbox.workdir", sandbox.workdir);
}

void load_runtime_config(Config &config, const common::TomlDocument &doc) {
  auto &runtime = config.runtime;
  runtime.kind = common::to_lower(doc.get_string("runtime.kind", runtime.kind));
  runtime.docker_binary = doc.get_string("runtime.docker_binary", runtime.docker_binary);
  runtime.shell = doc.get_string("runtime.shell", runtime.shell);
  runtime.command_timeout_ms =
      doc.get_u64("runtime.command_timeout_ms", runtime.command_timeout_ms);
  runtime.pull_timeout_ms = doc.get_u64("runtime.pull_timeout_ms", runtime.pull_timeout_ms);
  runtime.pull_missing_images =
      doc.get_bool("runtime.pull_missing_images", runtime.pull_missing_images);
  runtime.start_poll_attempts = static_cast<std::uint32_t>(
      doc.get_u64("runtime.start_poll_attempts", runtime.start_poll_attempts));
  runtime.start_poll_interval_ms =
      doc.get_u64("runtime.start_poll_interval_ms", runtime.start_poll_interval_ms);
  runtime.retry_backoff_ms = doc.get_u64("runtime.retry_backoff_ms", runtime.retry_backoff_ms);
  runtime.network = doc.get_string("runtime.network", runtime.network);
  runtime.memory_limit = doc.get_string("runtime.memory_limit", runtime.memory_limit);
  runtime.cpu_limit = doc.get_string("runtime.cpu_limit", runtime.cpu_limit);
  runtime.pids_limit =
      static_cast<std::uint32_t>(doc.get_u64("runtime.pids_limit", runtime.pids_limit));
  runtime.env = doc.get_string_array("runtime.env", runtime.env);
  runtime.container_prefix = doc.get_string("runtime.container_prefix", runtime.container_prefix);
  runtime.native_root =
      common::expand_path(doc.get_string("runtime.native_root", runtime.native_root));
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  for (const char ch : host) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '-' ||
          ch == ':')) {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.status());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (auto host = env_string("SOS_HOST")) {
    config.server.host = *host;
  }
  if (auto port = env_u64("SOS_PORT"); port.has_value() && *port <= 65535) {
    config.server.port = static_cast<std::uint16_t>(*port);
  }
  if (auto max = env_u64("SOS_MAX_SANDBOXES")) {
    config.sandbox.max_sandboxes = static_cast<std::uint32_t>(*max);
  }
  if (auto kind = env_string("SOS_RUNTIME")) {
    config.runtime.kind = common::to_lower(*kind);
  }
  if (auto image = env_string("SOS_DEFAULT_IMAGE")) {
    config.sandbox.default_image = *image;
  }
  if (auto timeout = env_u64("SOS_EXEC_TIMEOUT_MS")) {
    config.sandbox.exec_timeout_ms = *timeout;
  }
  if (auto wait = env_u64("SOS_ADMISSION_WAIT_MS")) {
    config.sandbox.admission_wait_ms = *wait;
  }
  if (auto backend = env_string("SOS_OBSERVABILITY")) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }

  const auto path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }

  const auto &doc = parsed.value();
  load_server_config(config, doc);
  load_sandbox_config(config, doc);
  load_runtime_config(config, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.server.port == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument, "server.port must be 1-65535");
  }
  if (!is_valid_host(config.server.host)) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "server.host is invalid: " + config.server.host);
  }
  if (config.sandbox.max_sandboxes == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox.max_sandboxes must be > 0");
  }
  if (config.sandbox.exec_timeout_ms == 0 || config.sandbox.standalone_timeout_ms == 0 ||
      config.sandbox.session_init_timeout_ms == 0 || config.sandbox.probe_timeout_ms == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox timeouts must be > 0");
  }
  if (common::trim(config.sandbox.default_image).empty()) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox.default_image must not be empty");
  }

  const std::string kind = common::to_lower(config.runtime.kind);
  if (kind != "docker" && kind != "native") {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "unsupported runtime.kind: " + config.runtime.kind);
  }
  if (config.runtime.command_timeout_ms == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "runtime.command_timeout_ms must be > 0");
  }
  if (config.runtime.shell.empty() || config.runtime.shell.front() != '/') {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "runtime.shell must be an absolute path");
  }

  if (kind == "native") {
    warnings.push_back("runtime.kind = native runs commands on the host without isolation");
  }
  if (config.sandbox.max_lifetime_secs > 0 && config.sandbox.reap_interval_secs == 0) {
    warnings.push_back("sandbox.reap_interval_secs is 0; lifetime reaper disabled");
  }
  if (config.sandbox.exec_timeout_ms < 500) {
    warnings.push_back("sandbox.exec_timeout_ms below 500ms will time out most commands");
  }
  if (config.server.host == "0.0.0.0" || config.server.host == "::") {
    warnings.push_back("server listens on all interfaces; the API is unauthenticated");
  }

  return Warnings::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  const auto bool_str = [](const bool value) { return value ? "true" : "false"; };
  std::ostringstream out;
  out << "[server]\n";
  out << "host = " << common::quote_toml_string(config.server.host) << "\n";
  out << "port = " << config.server.port << "\n";
  out << "max_body_bytes = " << config.server.max_body_bytes << "\n\n";

  const auto &sandbox = config.sandbox;
  out << "[sandbox]\n";
  out << "max_sandboxes = " << sandbox.max_sandboxes << "\n";
  out << "default_image = " << common::quote_toml_string(sandbox.default_image) << "\n";
  out << "admission_wait_ms = " << sandbox.admission_wait_ms << "\n";
  out << "exec_timeout_ms = " << sandbox.exec_timeout_ms << "\n";
  out << "standalone_timeout_ms = " << sandbox.standalone_timeout_ms << "\n";
  out << "session_init_timeout_ms = " << sandbox.session_init_timeout_ms << "\n";
  out << "probe_timeout_ms = " << sandbox.probe_timeout_ms << "\n";
  out << "max_lifetime_secs = " << sandbox.max_lifetime_secs << "\n";
  out << "reap_interval_secs = " << sandbox.reap_interval_secs << "\n";
  out << "trajectory_max_records = " << sandbox.trajectory_max_records << "\n";
  out << "workdir = " << common::quote_toml_string(sandbox.workdir) << "\n\n";

  const auto &runtime = config.runtime;
  out << "[runtime]\n";
  out << "kind = " << common::quote_toml_string(runtime.kind) << "\n";
  out << "docker_binary = " << common::quote_toml_string(runtime.docker_binary) << "\n";
  out << "shell = " << common::quote_toml_string(runtime.shell) << "\n";
  out << "command_timeout_ms = " << runtime.command_timeout_ms << "\n";
  out << "pull_timeout_ms = " << runtime.pull_timeout_ms << "\n";
  out << "pull_missing_images = " << bool_str(runtime.pull_missing_images) << "\n";
  out << "start_poll_attempts = " << runtime.start_poll_attempts << "\n";
  out << "start_poll_interval_ms = " << runtime.start_poll_interval_ms << "\n";
  out << "retry_backoff_ms = " << runtime.retry_backoff_ms << "\n";
  out << "network = " << common::quote_toml_string(runtime.network) << "\n";
  out << "memory_limit = " << common::quote_toml_string(runtime.memory_limit) << "\n";
  out << "cpu_limit = " << common::quote_toml_string(runtime.cpu_limit) << "\n";
  out << "pids_limit = " << runtime.pids_limit << "\n";
  out << "env = [";
  for (std::size_t i = 0; i < runtime.env.size(); ++i) {
    out << (i > 0 ? ", " : "") << common::quote_toml_string(runtime.env[i]);
  }
  out << "]\n";
  out << "container_prefix = " << common::quote_toml_string(runtime.container_prefix) << "\n";
  out << "native_root = " << common::quote_toml_string(runtime.native_root) << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

} // namespace sos::config
