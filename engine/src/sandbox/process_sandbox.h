#pragma once

#include <cstddef>
#include <string>

#include "policy/policy.h"
#include "sandbox/code_runner.h"

namespace analysis_sandbox {

/**
 * Knobs for the subprocess runner. Defaults suit interactive analysis.
 */
struct SandboxOptions {
  std::string interpreter = "/usr/bin/python3";

  size_t max_output_bytes = 1024 * 1024;
  size_t max_stderr_bytes = 64 * 1024;
  size_t max_result_bytes = 32 * 1024 * 1024;
  int poll_interval_ms = 50;

  // Parent of per-run scratch directories; empty means $TMPDIR or /tmp
  std::string scratch_root;
  int scratch_file_limit_mb = 64;
  int max_open_files = 64;

  // Capability isolation. "require_*" turns an unavailable feature into an
  // InternalError; clearing it downgrades that to a logged warning.
  bool isolate_network = true;
  bool require_network_isolation = true;
  bool restrict_filesystem = true;
  bool require_filesystem_isolation = true;
  // Seccomp filter: signals, tracing and process spawning stay inside the worker
  bool restrict_process = true;
  bool require_process_isolation = true;
  bool block_process_spawn = true;
};

/**
 * ProcessSandbox - runs each request in a dedicated, resource-bounded
 * interpreter subprocess.
 *
 * The worker lives in its own process group and is always killed and reaped
 * before Execute returns. Safe to call concurrently; runs share nothing but
 * the policy.
 */
class ProcessSandbox : public CodeRunner {
 public:
  // The policy must outlive the sandbox
  explicit ProcessSandbox(const Policy& policy, SandboxOptions options = {});

  ExecutionResult Execute(const std::string& sanitized_code,
                          const ExecutionContext& context,
                          const ExecutionLimits& limits,
                          const CancellationToken* cancel,
                          const OutputCallback& on_output) override;

  std::string TypeName() const override { return "process"; }

  const SandboxOptions& options() const { return options_; }

 private:
  const Policy& policy_;
  SandboxOptions options_;
};

}  // namespace analysis_sandbox
