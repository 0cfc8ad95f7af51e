#pragma once

#include "mnemobox/observability/observer.hpp"

#include <iostream>
#include <mutex>
#include <string>

namespace mnemobox::observability {

enum class LogLevel { Debug, Info, Warn, Error };

/// Writes one `[LEVEL] message` line per event. Concurrent executions share
/// the stream, so each line is written under a lock.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Debug, std::ostream *out = nullptr)
      : min_level_(min_level), out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace mnemobox::observability
