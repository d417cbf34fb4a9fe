#include "logging/trace.h"

#include <iostream>
#include <mutex>

#include <fmt/format.h>

namespace analysis_sandbox {

namespace {

std::mutex& SinkMutex() {
  static std::mutex mu;
  return mu;
}

Tracer::Sink& SinkSlot() {
  static Tracer::Sink sink;
  return sink;
}

}  // namespace

std::atomic<bool> Tracer::enabled_{true};

std::string Tracer::SpanName(const std::string& unit_id, const std::string& analysis_type) {
  if (analysis_type.empty()) {
    return unit_id;
  }
  return fmt::format("{}({})", unit_id, analysis_type);
}

void Tracer::AddContext(nlohmann::json& record, const TraceContext& ctx) {
  if (!ctx.session_id.empty()) {
    record["session_id"] = ctx.session_id;
  }
  record["unit_id"] = ctx.unit_id;
  record["span_name"] = SpanName(ctx.unit_id, ctx.analysis_type);
  if (!ctx.analysis_type.empty()) {
    record["analysis_type"] = ctx.analysis_type;
  }
}

void Tracer::LogRunStart(const TraceContext& ctx, size_t code_bytes) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "run_start";
  log["level"] = "info";
  AddContext(log, ctx);
  log["code_bytes"] = code_bytes;
  Emit(std::move(log));
}

void Tracer::LogRunEnd(const TraceContext& ctx,
                       double duration_ms,
                       bool success,
                       const std::string& error_kind,
                       const std::string& error) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "run_end";
  log["level"] = success ? "info" : "warning";
  AddContext(log, ctx);
  log["duration_ms"] = duration_ms;
  log["success"] = success;

  if (!error_kind.empty()) {
    log["error_kind"] = error_kind;
  }
  if (!error.empty()) {
    log["error"] = error;
  }
  Emit(std::move(log));
}

void Tracer::LogRejected(const TraceContext& ctx,
                         const std::string& error_kind,
                         const std::string& reason,
                         const std::string& token) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "validation_rejected";
  log["level"] = "warning";
  AddContext(log, ctx);
  log["error_kind"] = error_kind;
  log["reason"] = reason;
  if (!token.empty()) {
    log["token"] = token;
  }
  Emit(std::move(log));
}

void Tracer::LogWarning(const std::string& event,
                        const std::string& message,
                        nlohmann::json fields) {
  if (!enabled_) return;

  if (!fields.is_object()) {
    fields = nlohmann::json::object();
  }
  fields["event"] = event;
  fields["level"] = "warning";
  fields["message"] = message;
  Emit(std::move(fields));
}

void Tracer::LogError(const std::string& event,
                      const std::string& message,
                      nlohmann::json fields) {
  if (!enabled_) return;

  if (!fields.is_object()) {
    fields = nlohmann::json::object();
  }
  fields["event"] = event;
  fields["level"] = "error";
  fields["message"] = message;
  Emit(std::move(fields));
}

void Tracer::Emit(nlohmann::json record) {
  std::lock_guard<std::mutex> lock(SinkMutex());
  if (SinkSlot()) {
    SinkSlot()(record);
    return;
  }
  // Replace invalid UTF-8 from user output rather than throwing from dump()
  std::cout << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
}

void Tracer::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(SinkMutex());
  SinkSlot() = std::move(sink);
}

void Tracer::SetEnabled(bool enabled) {
  enabled_ = enabled;
}

bool Tracer::IsEnabled() {
  return enabled_;
}

}  // namespace analysis_sandbox
