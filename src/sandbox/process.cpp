#include "sos/sandbox/process.hpp"

#include "sos/common/fs.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sos::sandbox {

namespace {

struct PipePair {
  int read_end = -1;
  int write_end = -1;

  void close_both() {
    if (read_end >= 0) {
      close(read_end);
      read_end = -1;
    }
    if (write_end >= 0) {
      close(write_end);
      write_end = -1;
    }
  }
};

bool open_pipe(PipePair &pair) {
  int fds[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  pair.read_end = fds[0];
  pair.write_end = fds[1];
  return true;
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return;
  }
}

// Forks argv[0] in its own process group with the given descriptors as its
// standard streams (-1 for stdin means /dev/null). Exec failures are reported
// through a close-on-exec pipe so the caller sees them synchronously.
common::Result<pid_t> fork_exec(const std::vector<std::string> &args,
                                const std::filesystem::path &working_dir, const int stdin_fd,
                                const int stdout_fd, const int stderr_fd) {
  if (args.empty()) {
    return common::Result<pid_t>::failure(common::ErrorCode::InvalidArgument,
                                          "command is empty");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::string cwd = working_dir.string();

  PipePair exec_error;
  if (!open_pipe(exec_error)) {
    return common::Result<pid_t>::failure(common::ErrorCode::Runtime,
                                          "failed to create pipe: " +
                                              std::string(std::strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    exec_error.close_both();
    return common::Result<pid_t>::failure(common::ErrorCode::Runtime,
                                          "failed to fork " + args.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)signal(SIGPIPE, SIG_DFL);
    int input = stdin_fd;
    if (input < 0) {
      input = open("/dev/null", O_RDONLY);
    }
    (void)dup2(input, STDIN_FILENO);
    (void)dup2(stdout_fd, STDOUT_FILENO);
    (void)dup2(stderr_fd, STDERR_FILENO);
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      const int err = errno;
      (void)write(exec_error.write_end, &err, sizeof(err));
      _exit(126);
    }
    execvp(argv[0], argv.data());
    const int err = errno;
    (void)write(exec_error.write_end, &err, sizeof(err));
    _exit(127);
  }

  close(exec_error.write_end);
  exec_error.write_end = -1;
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = read(exec_error.read_end, &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  exec_error.close_both();

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    return common::Result<pid_t>::failure(common::ErrorCode::Runtime,
                                          "failed to start " + args.front() + ": " +
                                              std::strerror(child_errno));
  }
  return common::Result<pid_t>::success(pid);
}

} // namespace

common::Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                          const ProcessOptions &options) {
  PipePair out;
  PipePair err;
  if (!open_pipe(out) || !open_pipe(err)) {
    out.close_both();
    err.close_both();
    return common::Result<ProcessResult>::failure(common::ErrorCode::Runtime,
                                                  "failed to create pipes");
  }

  const auto spawned = fork_exec(argv, options.working_dir, -1, out.write_end, err.write_end);
  close(out.write_end);
  close(err.write_end);
  out.write_end = -1;
  err.write_end = -1;
  if (!spawned.ok()) {
    out.close_both();
    err.close_both();
    return common::Result<ProcessResult>::failure(spawned.status());
  }
  const pid_t pid = spawned.value();

  set_non_blocking(out.read_end);
  set_non_blocking(err.read_end);

  ProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(out.read_end, result.stdout_text);
    read_into_buffer(err.read_end, result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = out.read_end, .events = POLLIN, .revents = 0},
        {.fd = err.read_end, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(out.read_end, result.stdout_text);
  read_into_buffer(err.read_end, result.stderr_text);
  out.close_both();
  err.close_both();

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  const std::string command_line = common::join(argv, " ");
  if (result.timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<ProcessResult>::failure(
          common::ErrorCode::Runtime,
          "timed out after " + std::to_string(options.timeout.count()) + "ms: " + command_line);
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string detail = common::trim(result.stderr_text);
    return common::Result<ProcessResult>::failure(
        common::ErrorCode::Runtime,
        detail.empty() ? command_line + " exited with " + std::to_string(result.exit_code)
                       : detail);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

common::Result<std::unique_ptr<ChildProcess>>
ChildProcess::spawn(const std::vector<std::string> &argv, const std::filesystem::path &working_dir) {
  PipePair in;
  PipePair out;
  PipePair err;
  if (!open_pipe(in) || !open_pipe(out) || !open_pipe(err)) {
    in.close_both();
    out.close_both();
    err.close_both();
    return common::Result<std::unique_ptr<ChildProcess>>::failure(common::ErrorCode::Runtime,
                                                                  "failed to create pipes");
  }

  const auto spawned = fork_exec(argv, working_dir, in.read_end, out.write_end, err.write_end);
  close(in.read_end);
  close(out.write_end);
  close(err.write_end);
  if (!spawned.ok()) {
    close(in.write_end);
    close(out.read_end);
    close(err.read_end);
    return common::Result<std::unique_ptr<ChildProcess>>::failure(spawned.status());
  }

  set_non_blocking(in.write_end);
  set_non_blocking(out.read_end);
  set_non_blocking(err.read_end);
  return common::Result<std::unique_ptr<ChildProcess>>::success(std::unique_ptr<ChildProcess>(
      new ChildProcess(spawned.value(), in.write_end, out.read_end, err.read_end)));
}

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
  terminate();
  for (int *fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) {
      close(*fd);
      *fd = -1;
    }
  }
}

bool ChildProcess::is_running() const {
  if (pid_ <= 0) {
    return false;
  }
  return kill(pid_, 0) == 0 || errno == EPERM;
}

void ChildProcess::kill_now() {
  if (pid_ > 0) {
    (void)kill(-pid_, SIGKILL);
  }
}

void ChildProcess::terminate() {
  if (pid_ <= 0) {
    return;
  }
  (void)kill(-pid_, SIGTERM);
  for (int i = 0; i < 20; ++i) {
    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) == pid_) {
      (void)kill(-pid_, SIGKILL);
      pid_ = 0;
      return;
    }
    usleep(50 * 1000);
  }
  (void)kill(-pid_, SIGKILL);
  int status = 0;
  (void)waitpid(pid_, &status, 0);
  pid_ = 0;
}

} // namespace sos::sandbox
