#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <nlohmann/json.hpp>

#include "logging/trace.h"

using namespace analysis_sandbox;
using json = nlohmann::json;

TEST_CASE("Tracer span naming", "[trace]") {
  SECTION("With analysis type") {
    REQUIRE(Tracer::SpanName("cell-1", "summary") == "cell-1(summary)");
  }

  SECTION("Without analysis type") {
    REQUIRE(Tracer::SpanName("cell-1", "") == "cell-1");
  }
}

TEST_CASE("Tracer records", "[trace]") {
  std::vector<json> records;
  Tracer::SetEnabled(true);
  Tracer::SetSink([&records](const json& record) { records.push_back(record); });

  const TraceContext ctx{"session-7", "cell-2", "trend"};

  SECTION("Run start and end") {
    Tracer::LogRunStart(ctx, 42);
    Tracer::LogRunEnd(ctx, 12.5, false, "Timeout", "Execution exceeded timeout of 1 seconds");
    REQUIRE(records.size() == 2);

    REQUIRE(records[0]["event"] == "run_start");
    REQUIRE(records[0]["level"] == "info");
    REQUIRE(records[0]["session_id"] == "session-7");
    REQUIRE(records[0]["span_name"] == "cell-2(trend)");
    REQUIRE(records[0]["code_bytes"] == 42);

    REQUIRE(records[1]["event"] == "run_end");
    REQUIRE(records[1]["level"] == "warning");
    REQUIRE(records[1]["success"] == false);
    REQUIRE(records[1]["error_kind"] == "Timeout");
    REQUIRE(records[1]["duration_ms"] == 12.5);
  }

  SECTION("Successful run omits error fields") {
    Tracer::LogRunEnd(TraceContext{"", "cell-3", ""}, 1.0, true);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["level"] == "info");
    REQUIRE_FALSE(records[0].contains("error_kind"));
    REQUIRE_FALSE(records[0].contains("session_id"));
    REQUIRE_FALSE(records[0].contains("analysis_type"));
  }

  SECTION("Rejection") {
    Tracer::LogRejected(ctx, "ForbiddenCallable", "Forbidden function: eval()", "eval");
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["event"] == "validation_rejected");
    REQUIRE(records[0]["token"] == "eval");
  }

  SECTION("Warnings and errors keep caller fields") {
    Tracer::LogWarning("sandbox_stderr", "noise", {{"pid", 17}});
    Tracer::LogError("internal_error", "boom");
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["pid"] == 17);
    REQUIRE(records[0]["message"] == "noise");
    REQUIRE(records[1]["level"] == "error");
  }

  SECTION("Disabled tracer emits nothing") {
    Tracer::SetEnabled(false);
    Tracer::LogRunStart(ctx, 1);
    Tracer::LogWarning("unknown_import", "x");
    REQUIRE(records.empty());
    REQUIRE_FALSE(Tracer::IsEnabled());
    Tracer::SetEnabled(true);
  }

  Tracer::SetSink(nullptr);
}
