#include "sos/sandbox/docker.hpp"

namespace sos::sandbox {

common::Result<ProcessResult> DockerCliRunner::run(const std::vector<std::string> &args,
                                                   const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorCode::InvalidArgument,
                                                  "docker command is empty");
  }
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(binary_);
  argv.insert(argv.end(), args.begin(), args.end());
  return run_process(argv, ProcessOptions{.allow_failure = options.allow_failure,
                                          .timeout = options.timeout});
}

} // namespace sos::sandbox
