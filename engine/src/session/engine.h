#pragma once

#include <memory>
#include <string>

#include "config/engine_config.h"
#include "policy/policy.h"
#include "sandbox/process_sandbox.h"
#include "session/session.h"
#include "validator/validator.h"

namespace analysis_sandbox {

/**
 * Engine - owns the policy, validator, sandbox and orchestrator built from
 * one configuration. Immutable after creation and safe to share across
 * sessions.
 */
class Engine {
 public:
  /**
   * Build an engine. Loads the policy file when the config names one.
   * Returns nullptr on error.
   */
  static std::unique_ptr<Engine> Create(const EngineConfig& config, std::string* error_out = nullptr);

  const EngineConfig& config() const { return config_; }
  const Policy& policy() const { return policy_; }
  const CodeValidator& validator() const { return validator_; }
  const SessionOrchestrator& orchestrator() const { return orchestrator_; }

  // Limits used when the caller supplies none
  const ExecutionLimits& default_limits() const { return config_.default_limits; }

 private:
  Engine(EngineConfig config, Policy policy);

  EngineConfig config_;
  Policy policy_;
  CodeValidator validator_;
  ProcessSandbox sandbox_;
  SessionOrchestrator orchestrator_;
};

}  // namespace analysis_sandbox
