#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"
#include "engram/memory/engine.hpp"

#include <memory>

namespace engram::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer, then wires the engine.
  [[nodiscard]] common::Result<std::unique_ptr<memory::MemoryEngine>> create_memory_engine();

private:
  config::Config config_;
};

} // namespace engram::runtime
