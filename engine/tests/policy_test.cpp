#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>

#include "policy/policy.h"

using namespace analysis_sandbox;

TEST_CASE("Default policy", "[policy]") {
  Policy policy = Policy::Default();

  SECTION("Forbidden callables") {
    for (const char* name : {"eval", "exec", "compile", "__import__", "open", "getattr",
                             "globals", "breakpoint", "exit"}) {
      INFO(name);
      REQUIRE(policy.IsForbiddenCallable(name));
    }
    REQUIRE_FALSE(policy.IsForbiddenCallable("print"));
    REQUIRE_FALSE(policy.IsForbiddenCallable("len"));
  }

  SECTION("Forbidden modules") {
    for (const char* name : {"os", "sys", "subprocess", "socket", "pickle", "ctypes",
                             "importlib", "builtins", "threading"}) {
      INFO(name);
      REQUIRE(policy.IsForbiddenModule(name));
    }
    REQUIRE_FALSE(policy.IsForbiddenModule("pandas"));
  }

  SECTION("Allowed modules are informational") {
    REQUIRE(policy.IsAllowedModule("pandas"));
    REQUIRE(policy.IsAllowedModule("math"));
    REQUIRE_FALSE(policy.IsAllowedModule("tomllib"));
    REQUIRE_FALSE(policy.IsForbiddenModule("tomllib"));
  }

  SECTION("Safe dunders") {
    REQUIRE(policy.IsSafeDunder("__init__"));
    REQUIRE(policy.IsSafeDunder("__len__"));
    REQUIRE_FALSE(policy.IsSafeDunder("__class__"));
    REQUIRE_FALSE(policy.IsSafeDunder("__globals__"));
  }

  SECTION("Textual modules are a subset of forbidden modules") {
    for (const auto& name : policy.textual_modules) {
      INFO(name);
      REQUIRE(policy.IsForbiddenModule(name));
    }
  }

  REQUIRE(policy.context_name == "df");
}

TEST_CASE("Policy parsing", "[policy]") {
  SECTION("Present keys replace defaults, absent keys keep them") {
    Policy policy;
    std::string error;
    REQUIRE(Policy::Parse(R"({"forbidden_callables": ["eval"], "context_name": "data"})",
                          policy, &error));
    REQUIRE(policy.forbidden_callables.size() == 1);
    REQUIRE(policy.IsForbiddenCallable("eval"));
    REQUIRE_FALSE(policy.IsForbiddenCallable("exec"));
    REQUIRE(policy.IsForbiddenModule("os"));
    REQUIRE(policy.context_name == "data");
  }

  SECTION("Rejects non-array fields") {
    Policy policy;
    std::string error;
    REQUIRE_FALSE(Policy::Parse(R"({"forbidden_modules": "os"})", policy, &error));
    REQUIRE(error == "Policy field 'forbidden_modules' must be an array");
  }

  SECTION("Rejects invalid names") {
    Policy policy;
    std::string error;
    REQUIRE_FALSE(Policy::Parse(R"({"forbidden_modules": ["os.path"]})", policy, &error));
    REQUIRE(error.find("os.path") != std::string::npos);
  }

  SECTION("Rejects malformed JSON") {
    Policy policy;
    std::string error;
    REQUIRE_FALSE(Policy::Parse("{not json", policy, &error));
    REQUIRE(error.find("Failed to parse policy") == 0);
  }

  SECTION("Load from file") {
    const std::string path = "policy_test_tmp.json";
    {
      std::ofstream out(path);
      out << R"({"allowed_modules": ["pandas"]})";
    }
    Policy policy;
    std::string error;
    REQUIRE(Policy::LoadFromFile(path, policy, &error));
    REQUIRE(policy.allowed_modules.size() == 1);
    std::remove(path.c_str());

    REQUIRE_FALSE(Policy::LoadFromFile("does/not/exist.json", policy, &error));
    REQUIRE(error == "Failed to open policy file: does/not/exist.json");
  }
}

TEST_CASE("Top-level module", "[policy]") {
  REQUIRE(TopLevelModule("matplotlib.pyplot") == "matplotlib");
  REQUIRE(TopLevelModule("os") == "os");
}
