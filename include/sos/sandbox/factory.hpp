#pragma once

#include "sos/common/result.hpp"
#include "sos/config/schema.hpp"
#include "sos/sandbox/orchestrator.hpp"
#include "sos/sandbox/runtime.hpp"

#include <memory>

namespace sos::sandbox {

/// Runtime for `runtime.kind`, wrapped in the single-retry decorator.
[[nodiscard]] common::Result<std::shared_ptr<IContainerRuntime>>
create_runtime(const config::Config &config);

[[nodiscard]] OrchestratorOptions orchestrator_options(const config::Config &config);

} // namespace sos::sandbox
