#include "policy/policy.h"

#include <fstream>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

namespace analysis_sandbox {

namespace {

bool ReadNameSet(const nlohmann::json& j, const char* key, std::set<std::string>& out,
                 std::string* error_out) {
  if (!j.contains(key)) {
    return true;
  }
  const auto& arr = j[key];
  if (!arr.is_array()) {
    if (error_out) *error_out = std::string("Policy field '") + key + "' must be an array";
    return false;
  }

  static const std::regex identifier("^[A-Za-z_][A-Za-z0-9_]*$");
  std::set<std::string> names;
  for (const auto& item : arr) {
    if (!item.is_string()) {
      if (error_out) *error_out = std::string("Policy field '") + key + "' must contain strings";
      return false;
    }
    std::string name = item.get<std::string>();
    if (!std::regex_match(name, identifier)) {
      if (error_out) *error_out = "Invalid name in policy field '" + std::string(key) + "': " + name;
      return false;
    }
    names.insert(std::move(name));
  }
  out = std::move(names);
  return true;
}

}  // namespace

std::string TopLevelModule(const std::string& dotted) {
  size_t dot = dotted.find('.');
  return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

Policy Policy::Default() {
  Policy policy;
  policy.forbidden_callables = {
      "eval", "exec", "compile", "__import__",
      "open", "file", "input", "raw_input", "execfile", "reload",
      "globals", "locals", "vars", "dir",
      "getattr", "setattr", "delattr", "hasattr",
      "help", "breakpoint", "quit", "exit",
  };
  policy.forbidden_modules = {
      "os", "sys", "subprocess", "socket", "urllib", "requests", "http",
      "ftplib", "telnetlib",
      "pickle", "shelve", "marshal", "dill",
      "multiprocessing", "threading", "_thread", "asyncio", "concurrent",
      "tempfile", "shutil", "glob", "pathlib", "importlib", "ctypes",
      "signal", "pty", "resource", "builtins",
  };
  policy.allowed_modules = {
      "pandas", "numpy", "matplotlib", "seaborn", "plotly",
      "scipy", "sklearn", "statsmodels",
      "datetime", "math", "statistics", "random", "json", "re",
      "collections", "itertools", "functools", "operator",
      "typing", "dataclasses", "enum", "decimal", "fractions", "string",
      "warnings",
  };
  policy.safe_dunders = {
      "__init__", "__str__", "__repr__", "__len__",
      "__getitem__", "__setitem__", "__contains__", "__iter__", "__next__",
      "__eq__", "__ne__", "__lt__", "__le__", "__gt__", "__ge__", "__hash__", "__bool__",
      "__add__", "__sub__", "__mul__", "__truediv__", "__floordiv__",
      "__mod__", "__pow__", "__and__", "__or__", "__xor__",
      "__radd__", "__rsub__", "__rmul__", "__rtruediv__",
      "__neg__", "__pos__", "__abs__",
  };
  policy.textual_modules = {
      "os", "sys", "subprocess", "socket", "shutil", "ctypes", "importlib", "pty",
  };
  return policy;
}

bool Policy::Parse(const std::string& json_str, Policy& out, std::string* error_out) {
  try {
    auto j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      if (error_out) *error_out = "Policy must be a JSON object";
      return false;
    }

    Policy policy = Default();
    if (!ReadNameSet(j, "forbidden_callables", policy.forbidden_callables, error_out) ||
        !ReadNameSet(j, "forbidden_modules", policy.forbidden_modules, error_out) ||
        !ReadNameSet(j, "allowed_modules", policy.allowed_modules, error_out) ||
        !ReadNameSet(j, "safe_dunders", policy.safe_dunders, error_out) ||
        !ReadNameSet(j, "textual_modules", policy.textual_modules, error_out)) {
      return false;
    }

    if (j.contains("context_name")) {
      policy.context_name = j["context_name"].get<std::string>();
    }

    out = std::move(policy);
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Failed to parse policy: ") + e.what();
    return false;
  }
}

bool Policy::LoadFromFile(const std::string& path, Policy& out, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open policy file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Parse(buffer.str(), out, error_out);
}

}  // namespace analysis_sandbox
