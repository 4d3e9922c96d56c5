#pragma once

#include "engram/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace engram::observability {

/// Writes one `[LEVEL] message` line per event. DEBUG lines (metrics, recalls)
/// are only written when `verbose` is set.
class LogObserver final : public IObserver {
public:
  LogObserver();
  LogObserver(std::ostream &out, bool verbose);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
  std::mutex mutex_;
};

} // namespace engram::observability
