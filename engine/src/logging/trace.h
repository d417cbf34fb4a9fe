#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace analysis_sandbox {

/**
 * Identifies one unit of work for tracing purposes.
 */
struct TraceContext {
  std::string session_id;     // Empty for single-shot runs
  std::string unit_id;        // Cell or request id
  std::string analysis_type;  // Informational hint from the code generator
};

/**
 * Tracer - structured JSON-lines logging for validation and execution.
 *
 * Every record carries "event" and "level". Output goes to stdout unless a
 * sink is installed.
 */
class Tracer {
 public:
  using Sink = std::function<void(const nlohmann::json&)>;

  /**
   * Log the start of a run (after validation passed).
   */
  static void LogRunStart(const TraceContext& ctx, size_t code_bytes);

  /**
   * Log the end of a run.
   * @param error_kind Wire name of the error kind (empty on success)
   */
  static void LogRunEnd(const TraceContext& ctx,
                        double duration_ms,
                        bool success,
                        const std::string& error_kind = "",
                        const std::string& error = "");

  /**
   * Log a validation rejection.
   */
  static void LogRejected(const TraceContext& ctx,
                          const std::string& error_kind,
                          const std::string& reason,
                          const std::string& token);

  static void LogWarning(const std::string& event,
                         const std::string& message,
                         nlohmann::json fields = nlohmann::json::object());

  static void LogError(const std::string& event,
                       const std::string& message,
                       nlohmann::json fields = nlohmann::json::object());

  /**
   * Compute span name from unit id and analysis type.
   * Format: unit_id(analysis_type) if a hint is present, otherwise unit_id.
   */
  static std::string SpanName(const std::string& unit_id, const std::string& analysis_type);

  /**
   * Route records to a callback instead of stdout. Pass nullptr to restore stdout.
   */
  static void SetSink(Sink sink);

  /**
   * Enable/disable tracing output.
   */
  static void SetEnabled(bool enabled);

  /**
   * Check if tracing is enabled.
   */
  static bool IsEnabled();

 private:
  static void Emit(nlohmann::json record);
  static void AddContext(nlohmann::json& record, const TraceContext& ctx);

  static std::atomic<bool> enabled_;
};

}  // namespace analysis_sandbox
