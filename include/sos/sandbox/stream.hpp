#pragma once

#include "sos/common/result.hpp"
#include "sos/sandbox/process.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sos::sandbox {

enum class StreamChannel { Stdout, Stderr };

struct StreamChunk {
  StreamChannel channel = StreamChannel::Stdout;
  std::string data;
};

/// Write side and read side of one attached shell. Writes and reads are made
/// by a single thread at a time (the session's execution lock holder);
/// shutdown() may come from any thread.
class IShellStream {
public:
  virtual ~IShellStream() = default;

  /// Fails with SessionClosed when the shell is gone and SessionTimeout when
  /// the input pipe stays full until `deadline`.
  [[nodiscard]] virtual common::Status write(const std::string &data,
                                             std::chrono::steady_clock::time_point deadline) = 0;

  /// Returns what is available by `deadline`; an empty vector means nothing
  /// arrived. Fails with SessionClosed once both outputs reached end of file.
  [[nodiscard]] virtual common::Result<std::vector<StreamChunk>>
  read(std::chrono::steady_clock::time_point deadline) = 0;

  /// Kills the shell so a blocked read observes end of file.
  virtual void shutdown() = 0;
};

/// IShellStream over a child's pipes (docker attach, or a host shell).
/// Writing to a dead child raises SIGPIPE; the process must ignore it.
class ProcessShellStream final : public IShellStream {
public:
  explicit ProcessShellStream(std::unique_ptr<ChildProcess> child);

  [[nodiscard]] common::Status write(const std::string &data,
                                     std::chrono::steady_clock::time_point deadline) override;
  [[nodiscard]] common::Result<std::vector<StreamChunk>>
  read(std::chrono::steady_clock::time_point deadline) override;
  void shutdown() override;

private:
  std::unique_ptr<ChildProcess> child_;
  bool stdout_open_ = true;
  bool stderr_open_ = true;
  std::atomic<bool> shut_down_{false};
};

} // namespace sos::sandbox
