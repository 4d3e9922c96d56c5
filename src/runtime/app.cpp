#include "engram/runtime/app.hpp"

#include "engram/config/config.hpp"
#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"

namespace engram::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure_from(loaded);
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure_from(validated);
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::unique_ptr<memory::MemoryEngine>> RuntimeContext::create_memory_engine() {
  observability::set_global_observer(observability::create_observer(config_));

  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<memory::MemoryEngine>>::failure_from(validated);
  }
  for (const auto &warning : validated.value()) {
    observability::record_fallback("config", warning);
  }
  return memory::create_engine(config_);
}

} // namespace engram::runtime
