#include "sos/cli/commands.hpp"

#include "sos/client/client.hpp"
#include "sos/client/http_client.hpp"
#include "sos/common/fs.hpp"
#include "sos/common/json_util.hpp"
#include "sos/config/config.hpp"
#include "sos/gateway/server.hpp"
#include "sos/observability/factory.hpp"
#include "sos/observability/global.hpp"
#include "sos/sandbox/factory.hpp"
#include "sos/sandbox/orchestrator.hpp"

#include <signal.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sos::cli {

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void handle_stop_signal(const int signal_number) { g_stop_signal = signal_number; }

std::string version_string() {
#ifdef SOS_VERSION
  std::string version = SOS_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SOS_GIT_COMMIT
  const std::string commit = SOS_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "sos " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_u64(const std::string &raw, const std::string &flag, std::uint64_t &out) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(raw, &consumed);
    if (consumed != raw.size()) {
      throw std::invalid_argument(raw);
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    std::cerr << "invalid value for " << flag << ": " << raw << "\n";
    return false;
  }
}

std::string default_server_url() {
  if (const char *env = std::getenv("SOS_SERVER"); env != nullptr && *env != '\0') {
    return env;
  }
  return client::kDefaultServerUrl;
}

client::SandboxClient make_client(const std::string &server) {
  return client::SandboxClient(server, std::make_shared<client::CurlHttpClient>());
}

int print_body(const common::Result<std::string> &result) {
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  std::cout << result.value();
  if (result.value().empty() || result.value().back() != '\n') {
    std::cout << "\n";
  }
  return 0;
}

int print_sandbox_table(const common::Result<std::string> &result) {
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  const auto rows = common::json_split_top_level_objects(common::trim(result.value()));
  if (rows.empty()) {
    std::cout << "no sandboxes\n";
    return 0;
  }
  for (const auto &row : rows) {
    std::cout << common::json_get_string(row, "id") << "  "
              << common::json_get_string(row, "status") << "  "
              << common::json_get_string(row, "image") << "\n";
  }
  return 0;
}

void print_command_result(const sandbox::CommandResult &result) {
  if (!result.stdout_text.empty()) {
    std::cout << result.stdout_text << "\n";
  }
  if (!result.stderr_text.empty()) {
    std::cerr << result.stderr_text << "\n";
  }
}

int run_serve(std::vector<std::string> args) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  config::Config cfg = loaded.value();

  std::string value;
  std::uint64_t number = 0;
  if (take_option(args, "--host", "", value)) {
    cfg.server.host = value;
  }
  if (take_option(args, "--port", "-p", value)) {
    if (!parse_u64(value, "--port", number) || number > 65535) {
      return 1;
    }
    cfg.server.port = static_cast<std::uint16_t>(number);
  }
  if (take_option(args, "--max-sandboxes", "", value)) {
    if (!parse_u64(value, "--max-sandboxes", number)) {
      return 1;
    }
    cfg.sandbox.max_sandboxes = static_cast<std::uint32_t>(number);
  }
  if (take_option(args, "--runtime", "", value)) {
    cfg.runtime.kind = common::to_lower(value);
  }
  if (take_option(args, "--timeout", "", value)) {
    if (!parse_u64(value, "--timeout", number)) {
      return 1;
    }
    cfg.sandbox.max_lifetime_secs = number;
  }
  if (take_option(args, "--exec-timeout-ms", "", value)) {
    if (!parse_u64(value, "--exec-timeout-ms", number)) {
      return 1;
    }
    cfg.sandbox.exec_timeout_ms = number;
  }
  if (take_option(args, "--admission-wait-ms", "", value)) {
    if (!parse_u64(value, "--admission-wait-ms", number)) {
      return 1;
    }
    cfg.sandbox.admission_wait_ms = number;
  }
  if (take_option(args, "--trajectory-max", "", value)) {
    if (!parse_u64(value, "--trajectory-max", number)) {
      return 1;
    }
    cfg.sandbox.trajectory_max_records = static_cast<std::size_t>(number);
  }
  std::uint64_t duration_secs = 0;
  if (take_option(args, "--duration-secs", "", value) &&
      !parse_u64(value, "--duration-secs", duration_secs)) {
    return 1;
  }
  if (!args.empty()) {
    std::cerr << "unknown option for serve: " << args.front() << "\n";
    return 1;
  }

  auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  observability::set_global_observer(observability::create_observer(cfg));

  auto runtime = sandbox::create_runtime(cfg);
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto orchestrator = std::make_shared<sandbox::Orchestrator>(
      runtime.value(), sandbox::orchestrator_options(cfg));
  orchestrator->start_reaper();

  gateway::GatewayServer server(orchestrator);
  const gateway::GatewayOptions options{
      .host = cfg.server.host,
      .port = cfg.server.port,
      .max_body_bytes = cfg.server.max_body_bytes,
  };
  auto status = server.start(options);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    orchestrator->shutdown();
    return 1;
  }

  std::cout << "sos listening on " << options.host << ":" << server.port() << " (runtime "
            << orchestrator->runtime_name() << ", max " << cfg.sandbox.max_sandboxes
            << " sandboxes)\n"
            << std::flush;

  struct sigaction action {};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  (void)sigaction(SIGINT, &action, nullptr);
  (void)sigaction(SIGTERM, &action, nullptr);

  const auto started = std::chrono::steady_clock::now();
  while (g_stop_signal == 0) {
    if (duration_secs > 0 &&
        std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration_secs)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "shutting down\n";
  server.stop();
  orchestrator->shutdown();
  if (auto observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

void print_sandbox_usage() {
  std::cerr << "usage: sos sandbox [--server URL] <action>\n"
               "  create [--image IMAGE] [--setup CMD]... [--start]\n"
               "  list [--json]\n"
               "  show <id>\n"
               "  start <id>\n"
               "  exec [-s|--standalone] [--timeout-ms N] <id> <command...>\n"
               "  stop [--remove] <id>\n"
               "  rm <id>\n"
               "  trajectory [--formatted] <id>\n";
}

int run_sandbox(std::vector<std::string> args) {
  std::string server = default_server_url();
  std::string value;
  if (take_option(args, "--server", "", value)) {
    server = value;
  }
  if (args.empty()) {
    print_sandbox_usage();
    return 1;
  }
  const std::string action = args.front();
  args.erase(args.begin());
  auto client = make_client(server);

  if (action == "create") {
    std::string image;
    (void)take_option(args, "--image", "-i", image);
    const auto setup = take_repeated_option(args, "--setup");
    const bool start = take_flag(args, "--start");
    if (!args.empty()) {
      print_sandbox_usage();
      return 1;
    }
    auto created = client.create(image, setup, start);
    if (!created.ok()) {
      std::cerr << created.error() << "\n";
      return 1;
    }
    std::cout << created.value() << "\n";
    return 0;
  }
  if (action == "list") {
    const bool raw = take_flag(args, "--json");
    return raw ? print_body(client.list()) : print_sandbox_table(client.list());
  }

  if (action == "exec") {
    const bool standalone = take_flag(args, "--standalone") || take_flag(args, "-s");
    std::optional<std::chrono::milliseconds> timeout;
    if (take_option(args, "--timeout-ms", "", value)) {
      std::uint64_t ms = 0;
      if (!parse_u64(value, "--timeout-ms", ms)) {
        return 1;
      }
      timeout = std::chrono::milliseconds(ms);
    }
    if (args.size() < 2) {
      print_sandbox_usage();
      return 1;
    }
    auto result = client.exec(args[0], join_tokens(args, 1), standalone, timeout);
    if (!result.ok()) {
      std::cerr << result.error() << "\n";
      return 1;
    }
    print_command_result(result.value());
    return result.value().exit_code < 0 ? 1 : (result.value().exit_code & 0xff);
  }

  const bool remove = action == "stop" && take_flag(args, "--remove");
  const bool formatted = action == "trajectory" && take_flag(args, "--formatted");
  if (args.size() != 1) {
    print_sandbox_usage();
    return 1;
  }
  const std::string &id = args.front();

  if (action == "show") {
    return print_body(client.show(id));
  }
  if (action == "start") {
    return print_body(client.start(id));
  }
  if (action == "stop") {
    return print_body(client.stop(id, remove));
  }
  if (action == "rm") {
    auto status = client.remove(id);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "removed " << id << "\n";
    return 0;
  }
  if (action == "trajectory") {
    return print_body(client.trajectory(id, formatted));
  }

  std::cerr << "unknown sandbox action: " << action << "\n";
  print_sandbox_usage();
  return 1;
}

int run_session(std::vector<std::string> args) {
  std::string server = default_server_url();
  std::string value;
  if (take_option(args, "--server", "", value)) {
    server = value;
  }
  std::string image;
  (void)take_option(args, "--image", "-i", image);
  const auto setup = take_repeated_option(args, "--setup");
  if (!args.empty()) {
    std::cerr << "usage: sos session [--server URL] [--image IMAGE] [--setup CMD]...\n";
    return 1;
  }

  auto client = make_client(server);
  auto created = client.create(image, setup, true);
  if (!created.ok()) {
    std::cerr << created.error() << "\n";
    return 1;
  }
  const std::string id = created.value();
  std::cout << "sandbox " << id << " is running. Prefix a command with '!' to run it "
            << "standalone; 'exit' leaves.\n";

  const std::string prompt = "sos:" + id.substr(0, 8) + "$ ";
  std::string line;
  while (true) {
    std::cout << prompt << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    std::string command = common::trim(line);
    if (command.empty()) {
      continue;
    }
    if (command == "exit" || command == "quit") {
      break;
    }
    bool standalone = false;
    if (command.front() == '!') {
      standalone = true;
      command = common::trim(command.substr(1));
      if (command.empty()) {
        continue;
      }
    }

    auto result = client.exec(id, command, standalone);
    if (!result.ok()) {
      std::cerr << result.error() << "\n";
      if (result.code() == common::ErrorCode::SessionTimeout ||
          result.code() == common::ErrorCode::SessionClosed ||
          result.code() == common::ErrorCode::NotFound ||
          result.code() == common::ErrorCode::InvalidTransition) {
        break;
      }
      continue;
    }
    print_command_result(result.value());
    if (result.value().exit_code != 0) {
      std::cout << "[exit " << result.value().exit_code << "]\n";
    }
  }

  auto stopped = client.stop(id, true);
  if (!stopped.ok()) {
    // A sandbox demoted to Failed can no longer be stopped, only removed.
    auto removed = client.remove(id);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "usage: sos config [show|path]\n";
    return 1;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::cout << config::render_config(cfg.value());
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  sos" << RESET << DIM << " sandbox orchestration server" << RESET
            << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "sos [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SERVER" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "          Start the HTTP API (--port, --host, --max-sandboxes, --runtime, "
               "--timeout)"
            << RESET << "\n\n";

  std::cout << BOLD << "  CLIENT" << RESET << DIM << " (--server URL, default "
            << client::kDefaultServerUrl << ")" << RESET << "\n";
  std::cout << "  " << GREEN << "sandbox create" << RESET << DIM << " Create a sandbox" << RESET
            << "\n";
  std::cout << "  " << GREEN << "sandbox list" << RESET << DIM << "   List sandboxes" << RESET
            << "\n";
  std::cout << "  " << GREEN << "sandbox exec" << RESET << DIM
            << "   Run a command (-s for standalone)" << RESET << "\n";
  std::cout << "  " << GREEN << "sandbox stop" << RESET << DIM << "   Stop a sandbox" << RESET
            << "\n";
  std::cout << "  " << GREEN << "session" << RESET << DIM
            << "        Interactive shell in a fresh sandbox" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "    Display effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "    Print config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "sandbox") {
    return run_sandbox(std::move(args));
  }
  if (subcommand == "session") {
    return run_session(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sos::cli
