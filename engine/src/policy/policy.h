#pragma once

#include <set>
#include <string>

namespace analysis_sandbox {

/**
 * Policy - the closed vocabularies that parameterize validation and the
 * runtime import guard.
 *
 * All sets are matched by exact name. A Policy is built once (defaults or
 * JSON) and shared read-only afterwards.
 */
struct Policy {
  // Names that must never be called, directly or through attribute access
  std::set<std::string> forbidden_callables;

  // Top-level modules whose import is rejected in any form
  std::set<std::string> forbidden_modules;

  // Informational whitelist: imports outside it only log a warning
  std::set<std::string> allowed_modules;

  // Dunder names permitted in source text
  std::set<std::string> safe_dunders;

  // Modules rejected on any textual reference ("os." / "import os")
  std::set<std::string> textual_modules;

  // Name the code is expected to reference (soft check)
  std::string context_name = "df";

  bool IsForbiddenCallable(const std::string& name) const {
    return forbidden_callables.count(name) > 0;
  }
  bool IsForbiddenModule(const std::string& top_level) const {
    return forbidden_modules.count(top_level) > 0;
  }
  bool IsAllowedModule(const std::string& top_level) const {
    return allowed_modules.count(top_level) > 0;
  }
  bool IsSafeDunder(const std::string& name) const {
    return safe_dunders.count(name) > 0;
  }

  // Built-in policy
  static Policy Default();

  // Parse from JSON string. Keys present replace the default set.
  static bool Parse(const std::string& json_str, Policy& out, std::string* error_out = nullptr);

  // Parse from JSON file
  static bool LoadFromFile(const std::string& path, Policy& out, std::string* error_out = nullptr);
};

/**
 * Top-level package of a dotted module path ("matplotlib.pyplot" -> "matplotlib").
 */
std::string TopLevelModule(const std::string& dotted);

}  // namespace analysis_sandbox
