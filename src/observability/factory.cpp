#include "mnemobox/observability/factory.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/observability/log_observer.hpp"
#include "mnemobox/observability/multi_observer.hpp"
#include "mnemobox/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace mnemobox::observability {

namespace {

std::vector<std::string> split_backends(const std::string &backend) {
  std::vector<std::string> parts;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    parts.push_back(common::to_lower(common::trim(part)));
  }
  return parts;
}

bool is_known_part(const std::string &part) {
  return part == "log" || part == "none" || part == "noop";
}

} // namespace

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty()) {
    return true;
  }
  for (const auto &part : split_backends(normalized)) {
    if (!is_known_part(part)) {
      return false;
    }
  }
  return true;
}

common::Result<std::shared_ptr<IObserver>> create_observer(const std::string &backend) {
  using ObserverResult = common::Result<std::shared_ptr<IObserver>>;

  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty() || normalized == "none" || normalized == "noop") {
    return ObserverResult::success(std::make_shared<NoopObserver>());
  }
  if (normalized == "log") {
    return ObserverResult::success(std::make_shared<LogObserver>(LogLevel::Info));
  }

  if (normalized.find(',') != std::string::npos) {
    auto multi = std::make_shared<MultiObserver>();
    for (const auto &part : split_backends(normalized)) {
      if (part == "log") {
        multi->add(std::make_shared<LogObserver>(LogLevel::Info));
      } else if (part == "noop" || part == "none") {
        multi->add(std::make_shared<NoopObserver>());
      } else {
        return ObserverResult::failure("Unknown observability backend: " + part);
      }
    }
    return ObserverResult::success(std::move(multi));
  }

  return ObserverResult::failure("Unknown observability backend: " + normalized);
}

} // namespace mnemobox::observability
