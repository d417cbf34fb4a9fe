#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging/trace.h"
#include "policy/policy.h"
#include "validator/validator.h"

using namespace analysis_sandbox;
using json = nlohmann::json;

namespace {

// Captures tracer records for the lifetime of the object
struct TraceCapture {
  std::vector<json> records;

  TraceCapture() {
    Tracer::SetEnabled(true);
    Tracer::SetSink([this](const json& record) { records.push_back(record); });
  }
  ~TraceCapture() { Tracer::SetSink(nullptr); }

  std::vector<json> Events(const std::string& event) const {
    std::vector<json> out;
    for (const auto& r : records) {
      if (r.value("event", "") == event) out.push_back(r);
    }
    return out;
  }
};

}  // namespace

TEST_CASE("Validator accepts benign code", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  SECTION("Plain analysis code") {
    auto verdict = validator.Validate("result = df['sales'].sum()\nprint(result)");
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.sanitized_code == "result = df['sales'].sum()\nprint(result)");
    REQUIRE(verdict.warnings.empty());
  }

  SECTION("Safe dunders are allowed") {
    auto verdict = validator.Validate(
        "class Box:\n    def __init__(self, v):\n        self.v = v\n"
        "    def __len__(self):\n        return 1\nb = Box(df)\n");
    REQUIRE(verdict.accepted);
  }

  SECTION("Fenced input is sanitized") {
    auto verdict = validator.Validate("```python\nprint(df)\n```");
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.sanitized_code == "print(df)");
  }

  SECTION("Backslash continuation on its own line") {
    auto verdict = validator.Validate("x = df\n\\\ny = 2\n");
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.sanitized_code == "x = df\n\\\ny = 2");
  }

  SECTION("Allowed imports produce no warnings") {
    auto verdict = validator.Validate("import pandas as pd\nfrom matplotlib import pyplot\nprint(df)");
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.warnings.empty());
  }
}

TEST_CASE("Validator rejects forbidden calls", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  SECTION("Bare eval") {
    auto verdict = validator.Validate("eval('1+1')");
    REQUIRE_FALSE(verdict.accepted);
    REQUIRE(verdict.kind == ErrorKind::kForbiddenCallable);
    REQUIRE(verdict.reason == "Forbidden function: eval()");
    REQUIRE(verdict.token == "eval");
    REQUIRE(verdict.line == 1);
    REQUIRE(verdict.column == 1);
  }

  SECTION("Nested inside other expressions") {
    auto verdict = validator.Validate("x = [1, 2]\ny = len(open('f').read())");
    REQUIRE(verdict.kind == ErrorKind::kForbiddenCallable);
    REQUIRE(verdict.token == "open");
    REQUIRE(verdict.line == 2);
    REQUIRE(verdict.column == 9);
  }

  SECTION("Inside an f-string replacement field") {
    auto verdict = validator.Validate("s = f\"{exec('x = 1')}\"\nprint(df)");
    REQUIRE(verdict.kind == ErrorKind::kForbiddenCallable);
    REQUIRE(verdict.token == "exec");
  }

  SECTION("Attribute access to a forbidden name") {
    auto verdict = validator.Validate("df.eval('a + b')");
    REQUIRE(verdict.kind == ErrorKind::kForbiddenCallable);
    REQUIRE(verdict.reason == "Forbidden attribute access: .eval");
  }

  SECTION("First violation in traversal order wins") {
    auto verdict = validator.Validate("a = compile('x', 'f', 'exec')\nb = eval('1')");
    REQUIRE(verdict.token == "compile");
  }
}

TEST_CASE("Validator rejects forbidden imports", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  SECTION("Textual reference is caught before parsing") {
    auto verdict = validator.Validate("import os\nos.listdir('.')");
    REQUIRE_FALSE(verdict.accepted);
    REQUIRE(verdict.kind == ErrorKind::kForbiddenModule);
    REQUIRE(verdict.token == "os");
  }

  SECTION("All import forms of a forbidden module") {
    for (const char* code : {"import pickle", "import pickle.util", "from pickle import loads",
                             "from concurrent.futures import ThreadPoolExecutor",
                             "import json, socket"}) {
      INFO(code);
      auto verdict = validator.Validate(code);
      REQUIRE_FALSE(verdict.accepted);
      REQUIRE(verdict.kind == ErrorKind::kForbiddenModule);
    }
  }

  SECTION("Tree-level rejection names the module") {
    auto verdict = validator.Validate("import numpy as np\nimport pickle as p\nprint(df)");
    REQUIRE(verdict.reason == "Forbidden module import: pickle");
    REQUIRE(verdict.token == "pickle");
    REQUIRE(verdict.line == 2);
  }

  SECTION("Relative imports are not forbidden modules") {
    auto verdict = validator.Validate("from . import helpers\nprint(df)");
    REQUIRE(verdict.accepted);
  }
}

TEST_CASE("Validator pattern scan", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  SECTION("Unsafe dunder") {
    auto verdict = validator.Validate("x = df.__class__.__bases__");
    REQUIRE(verdict.kind == ErrorKind::kDangerousPattern);
    REQUIRE(verdict.reason == "Forbidden dunder method detected: __class__");
    REQUIRE(verdict.column == 8);
  }

  SECTION("Dunder inside a string literal is still rejected") {
    auto verdict = validator.Validate("name = '__globals__'");
    REQUIRE(verdict.kind == ErrorKind::kDangerousPattern);
  }

  SECTION("Earliest match wins between dunder and module") {
    auto dunder_first = validator.Validate("a = x.__dict__\nimport os");
    REQUIRE(dunder_first.kind == ErrorKind::kDangerousPattern);
    auto module_first = validator.Validate("import os\na = x.__dict__");
    REQUIRE(module_first.kind == ErrorKind::kForbiddenModule);
  }

  SECTION("Module names inside identifiers do not match") {
    auto verdict = validator.Validate("cost.sum()\npositions = 1\nprint(df)");
    REQUIRE(verdict.accepted);
  }

  SECTION("Whitespace before the dot still matches") {
    auto verdict = validator.Validate("sys .path");
    REQUIRE(verdict.kind == ErrorKind::kForbiddenModule);
  }
}

TEST_CASE("Validator gates", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();

  SECTION("Empty and whitespace-only input") {
    CodeValidator validator(policy);
    REQUIRE(validator.Validate("").kind == ErrorKind::kEmptyInput);
    REQUIRE(validator.Validate("   \n\t ").kind == ErrorKind::kEmptyInput);
    REQUIRE(validator.Validate("```python\n```").kind == ErrorKind::kEmptyInput);
    REQUIRE(validator.Validate("").reason == "Code is empty");
  }

  SECTION("Oversized input") {
    CodeValidator validator(policy, 16);
    auto verdict = validator.Validate(std::string(17, 'x'));
    REQUIRE(verdict.kind == ErrorKind::kInputTooLarge);
    REQUIRE(verdict.reason == "Code exceeds maximum size of 16 bytes");
  }

  SECTION("Syntax errors are distinct from security kinds") {
    CodeValidator validator(policy);
    auto verdict = validator.Validate("if x\n    print(df)");
    REQUIRE(verdict.kind == ErrorKind::kSyntaxError);
    REQUIRE(verdict.reason == "Syntax error: expected ':' (line 1, column 5)");
    REQUIRE(verdict.line == 1);
    REQUIRE(verdict.column == 5);
  }

  SECTION("Rejected verdicts convert to errors") {
    CodeValidator validator(policy);
    auto error = validator.Validate("eval('1')").ToError();
    REQUIRE(error.kind == ErrorKind::kForbiddenCallable);
    REQUIRE(error.message == "Forbidden function: eval()");
    REQUIRE(error.token == "eval");
  }
}

TEST_CASE("Validator warnings", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  SECTION("Unknown import is accepted with a warning") {
    auto verdict = validator.Validate("import tomllib\nprint(df)", TraceContext{"s1", "cell-1", ""});
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.warnings == std::vector<std::string>{"Unrecognized module import: tomllib"});
    auto events = capture.Events("unknown_import");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]["module"] == "tomllib");
    REQUIRE(events[0]["unit_id"] == "cell-1");
    REQUIRE(events[0]["level"] == "warning");
  }

  SECTION("Missing context reference") {
    auto verdict = validator.Validate("x = 1");
    REQUIRE(verdict.accepted);
    REQUIRE(verdict.warnings == std::vector<std::string>{"Code doesn't reference 'df' variable"});
    REQUIRE(capture.Events("context_not_referenced").size() == 1);
  }

  SECTION("Attribute named like the context does not count") {
    auto verdict = validator.Validate("x = obj.df");
    REQUIRE(verdict.warnings.size() == 1);
  }
}

TEST_CASE("Validation is idempotent", "[validator]") {
  TraceCapture capture;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  for (const char* code : {"```python\nprint(df.head())\n```", "  total = df['a'].sum()  \n",
                           "eval('1')", "import os", "if x\n  y"}) {
    INFO(code);
    auto first = validator.Validate(code);
    auto second = validator.Validate(code);
    REQUIRE(first.accepted == second.accepted);
    REQUIRE(first.kind == second.kind);
    REQUIRE(first.reason == second.reason);
    if (first.accepted) {
      auto again = validator.Validate(first.sanitized_code);
      REQUIRE(again.accepted);
      REQUIRE(again.sanitized_code == first.sanitized_code);
    }
  }
}

TEST_CASE("Collect imports", "[validator]") {
  Policy policy = Policy::Default();
  CodeValidator validator(policy);

  REQUIRE(validator.CollectImports("import pandas as pd\nfrom matplotlib.pyplot import plot\n"
                                   "import numpy, pandas.api\n") ==
          std::vector<std::string>{"pandas", "matplotlib", "numpy"});
  REQUIRE(validator.CollectImports("if x\n").empty());
}
