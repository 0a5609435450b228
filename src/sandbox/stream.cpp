#include "sos/sandbox/stream.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace sos::sandbox {

namespace {

int millis_until(const std::chrono::steady_clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return static_cast<int>(std::clamp<std::int64_t>(remaining.count(), 0, 60'000));
}

// Drains fd into chunks; returns false on end of file.
bool drain(const int fd, const StreamChannel channel, std::vector<StreamChunk> &chunks) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = ::read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      if (chunks.empty() || chunks.back().channel != channel) {
        chunks.push_back(StreamChunk{.channel = channel, .data = {}});
      }
      chunks.back().data.append(buffer.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN: nothing more for now. Any other error ends the stream.
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

ProcessShellStream::ProcessShellStream(std::unique_ptr<ChildProcess> child)
    : child_(std::move(child)) {}

common::Status ProcessShellStream::write(const std::string &data,
                                         const std::chrono::steady_clock::time_point deadline) {
  if (shut_down_.load()) {
    return common::Status::error(common::ErrorCode::SessionClosed, "shell stream is shut down");
  }
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t written =
        ::write(child_->stdin_fd(), data.data() + offset, data.size() - offset);
    if (written > 0) {
      offset += static_cast<std::size_t>(written);
      continue;
    }
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return common::Status::error(common::ErrorCode::SessionTimeout,
                                     "shell input stayed full until the deadline");
      }
      struct pollfd pfd = {.fd = child_->stdin_fd(), .events = POLLOUT, .revents = 0};
      (void)poll(&pfd, 1, std::min(millis_until(deadline), 50));
      continue;
    }
    return common::Status::error(common::ErrorCode::SessionClosed,
                                 std::string("shell input closed: ") + std::strerror(errno));
  }
  return common::Status::success();
}

common::Result<std::vector<StreamChunk>>
ProcessShellStream::read(const std::chrono::steady_clock::time_point deadline) {
  using ReadResult = common::Result<std::vector<StreamChunk>>;
  std::vector<StreamChunk> chunks;

  while (stdout_open_ || stderr_open_) {
    struct pollfd fds[2];
    nfds_t count = 0;
    if (stdout_open_) {
      fds[count++] = {.fd = child_->stdout_fd(), .events = POLLIN, .revents = 0};
    }
    if (stderr_open_) {
      fds[count++] = {.fd = child_->stderr_fd(), .events = POLLIN, .revents = 0};
    }

    const int ready = poll(fds, count, millis_until(deadline));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready <= 0) {
      return ReadResult::success(std::move(chunks));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const bool is_stdout = fds[i].fd == child_->stdout_fd();
      const bool open =
          drain(fds[i].fd, is_stdout ? StreamChannel::Stdout : StreamChannel::Stderr, chunks);
      if (!open) {
        (is_stdout ? stdout_open_ : stderr_open_) = false;
      }
    }
    if (!chunks.empty()) {
      return ReadResult::success(std::move(chunks));
    }
  }

  return ReadResult::failure(common::ErrorCode::SessionClosed, "shell output closed");
}

void ProcessShellStream::shutdown() {
  shut_down_.store(true);
  child_->kill_now();
}

} // namespace sos::sandbox
