#pragma once

#include <cstddef>
#include <string>

#include "sandbox/process_sandbox.h"
#include "sandbox/types.h"

namespace analysis_sandbox {

/**
 * Engine configuration.
 *
 * JSON layout (every section and key optional):
 *   {
 *     "limits":    {"timeout_seconds": 30, "max_memory_mb": 512},
 *     "ceilings":  {"max_timeout_seconds": 300, "min_memory_mb": 128, "max_memory_mb": 2048},
 *     "sandbox":   {"interpreter": "/usr/bin/python3", "max_output_bytes": 1048576, ...},
 *     "validator": {"max_code_bytes": 100000},
 *     "policy_file": "policy.json"
 *   }
 */
struct EngineConfig {
  ExecutionLimits default_limits;
  LimitCeilings ceilings;
  SandboxOptions sandbox;
  size_t max_code_bytes = 100000;
  std::string policy_file;  // Empty = built-in policy

  static EngineConfig Default() { return EngineConfig{}; }

  // Parse from JSON string. Missing keys keep their defaults.
  static bool Parse(const std::string& json_str, EngineConfig& out, std::string* error_out = nullptr);

  // Parse from JSON file. A relative policy_file resolves against the file's directory.
  static bool LoadFromFile(const std::string& path, EngineConfig& out, std::string* error_out = nullptr);
};

}  // namespace analysis_sandbox
