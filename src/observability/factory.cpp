#include "engram/observability/factory.hpp"

#include "engram/common/fs.hpp"
#include "engram/observability/log_observer.hpp"
#include "engram/observability/multi_observer.hpp"
#include "engram/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace engram::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend == "log" || backend == "stderr") {
    return std::make_unique<LogObserver>();
  }
  if (backend == "verbose") {
    return std::make_unique<LogObserver>(std::cerr, true);
  }
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      multi->add(create_single(common::trim(part)));
    }
    return multi;
  }

  if (auto observer = create_single(backend); observer != nullptr) {
    return observer;
  }
  return std::make_unique<LogObserver>();
}

} // namespace engram::observability
