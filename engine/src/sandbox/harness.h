#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "policy/policy.h"
#include "sandbox/types.h"

namespace analysis_sandbox {

// Descriptor the harness writes its result envelope to
constexpr int kResultFd = 3;

// Largest serialized variable kept in a result
constexpr size_t kMaxVariableChars = 10000;

/**
 * Python program run by the worker interpreter ("python3 -c <harness>").
 *
 * It reads one request from stdin, builds the restricted namespace, runs the
 * code, and writes one envelope to kResultFd:
 *   {"status": "ok"|"error",
 *    "error": {"kind", "type", "message", "traceback"},
 *    "images": [...], "figures": [...], "variables": {...}}
 */
const std::string& HarnessSource();

/**
 * Build the stdin request for one run.
 */
nlohmann::json BuildHarnessRequest(const std::string& code,
                                   const ExecutionContext& context,
                                   const Policy& policy);

}  // namespace analysis_sandbox
