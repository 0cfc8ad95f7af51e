#pragma once

#include "mnemobox/common/result.hpp"
#include "mnemobox/observability/observer.hpp"

#include <memory>
#include <string>

namespace mnemobox::observability {

/// Builds the observer named by a backend string: "log", "none"/"noop", or a
/// comma-separated list of those.
[[nodiscard]] common::Result<std::shared_ptr<IObserver>> create_observer(const std::string &backend);

[[nodiscard]] bool is_known_backend(const std::string &backend);

} // namespace mnemobox::observability
