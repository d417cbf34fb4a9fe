#pragma once

#include <functional>
#include <string>

#include "sandbox/cancellation.h"
#include "sandbox/types.h"

namespace analysis_sandbox {

enum class OutputStream { kStdout, kStderr };

/**
 * Receives output chunks while the code runs, in emission order per stream.
 * Only bytes that also end up in the captured output are forwarded.
 */
using OutputCallback = std::function<void(OutputStream stream, const std::string& chunk)>;

/**
 * Base class for code runners.
 *
 * Runners receive code that already passed validation. They never throw for
 * user-caused failures; every outcome is reported through the result.
 */
class CodeRunner {
 public:
  virtual ~CodeRunner() = default;

  /**
   * Run sanitized code against a context.
   * @param cancel Optional; checked while the code runs
   * @param on_output Optional; called on the calling thread as output arrives
   */
  virtual ExecutionResult Execute(const std::string& sanitized_code,
                                  const ExecutionContext& context,
                                  const ExecutionLimits& limits,
                                  const CancellationToken* cancel,
                                  const OutputCallback& on_output) = 0;

  /**
   * Get the runner type name.
   */
  virtual std::string TypeName() const = 0;
};

}  // namespace analysis_sandbox
