#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "sandbox/types.h"

namespace analysis_sandbox {

/**
 * Check that a value is plain JSON data the result may carry: null, bool,
 * number, string, or arrays/objects of those, nested at most max_depth deep.
 */
bool IsPlainJson(const nlohmann::json& value, int max_depth = 32);

/**
 * Keep variables whose values are plain JSON and whose serialization is at
 * most max_chars characters. Names starting with '_' are dropped.
 */
nlohmann::json FilterVariables(const nlohmann::json& variables, size_t max_chars);

/**
 * Fold a harness envelope into a result.
 *
 * Sets success, error and (when the error kind allows it) the artifacts.
 * Output, timing and timestamp are left to the caller.
 * @return false if the envelope is malformed
 */
bool ApplyEnvelope(const nlohmann::json& envelope,
                   ExecutionResult& result,
                   std::string* error_out = nullptr);

/**
 * Whether a failure of this kind keeps partially captured artifacts.
 */
bool KeepsArtifacts(ErrorKind kind);

}  // namespace analysis_sandbox
