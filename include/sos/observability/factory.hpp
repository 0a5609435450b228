#pragma once

#include "sos/config/schema.hpp"
#include "sos/observability/observer.hpp"

#include <memory>

namespace sos::observability {

/// `observability.backend`: "log", "debug" (verbose log), "none"/"noop", or a
/// comma separated list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sos::observability
