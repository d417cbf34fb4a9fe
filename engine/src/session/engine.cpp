#include "session/engine.h"

namespace analysis_sandbox {

Engine::Engine(EngineConfig config, Policy policy)
    : config_(std::move(config)),
      policy_(std::move(policy)),
      validator_(policy_, config_.max_code_bytes),
      sandbox_(policy_, config_.sandbox),
      orchestrator_(validator_, sandbox_, config_.ceilings) {}

std::unique_ptr<Engine> Engine::Create(const EngineConfig& config, std::string* error_out) {
  Policy policy = Policy::Default();
  if (!config.policy_file.empty()) {
    std::string error;
    if (!Policy::LoadFromFile(config.policy_file, policy, &error)) {
      if (error_out) *error_out = "Error loading policy: " + error;
      return nullptr;
    }
  }
  return std::unique_ptr<Engine>(new Engine(config, std::move(policy)));
}

}  // namespace analysis_sandbox
