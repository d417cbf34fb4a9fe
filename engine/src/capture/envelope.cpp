#include "capture/envelope.h"

#include <cctype>
#include <cmath>

#include "sandbox/harness.h"

namespace analysis_sandbox {

namespace {

bool IsBase64(const std::string& s) {
  if (s.empty() || s.size() % 4 != 0) {
    return false;
  }
  for (size_t i = 0; i < s.size(); ++i) {
    const unsigned char c = s[i];
    if (std::isalnum(c) || c == '+' || c == '/') {
      continue;
    }
    // Padding only in the last two positions
    if (c == '=' && i + 2 >= s.size()) {
      continue;
    }
    return false;
  }
  return true;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

}  // namespace

bool IsPlainJson(const nlohmann::json& value, int max_depth) {
  if (max_depth < 0) {
    return false;
  }
  switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::boolean:
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::string:
      return true;
    case nlohmann::json::value_t::number_float:
      return std::isfinite(value.get<double>());
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
      for (const auto& item : value) {
        if (!IsPlainJson(item, max_depth - 1)) return false;
      }
      return true;
    default:
      return false;
  }
}

nlohmann::json FilterVariables(const nlohmann::json& variables, size_t max_chars) {
  nlohmann::json kept = nlohmann::json::object();
  if (!variables.is_object()) {
    return kept;
  }
  for (const auto& [name, value] : variables.items()) {
    if (name.empty() || name[0] == '_' || !IsPlainJson(value)) {
      continue;
    }
    if (value.dump().size() > max_chars) {
      continue;
    }
    kept[name] = value;
  }
  return kept;
}

bool KeepsArtifacts(ErrorKind kind) {
  return kind != ErrorKind::kTimeout && kind != ErrorKind::kResourceExceeded &&
         kind != ErrorKind::kCancelled;
}

bool ApplyEnvelope(const nlohmann::json& envelope, ExecutionResult& result,
                   std::string* error_out) {
  if (!envelope.is_object()) {
    if (error_out) *error_out = "Result envelope is not an object";
    return false;
  }
  const std::string status = StringField(envelope, "status");
  if (status != "ok" && status != "error") {
    if (error_out) *error_out = "Result envelope has no valid status";
    return false;
  }

  result.success = status == "ok";
  result.error.reset();
  if (!result.success) {
    auto it = envelope.find("error");
    if (it == envelope.end() || !it->is_object()) {
      if (error_out) *error_out = "Result envelope reports failure without an error";
      return false;
    }
    ExecutionError error;
    if (!ParseErrorKind(StringField(*it, "kind"), error.kind) ||
        PhaseOf(error.kind) != ErrorPhase::kRuntime) {
      if (error_out) *error_out = "Result envelope has an unknown error kind";
      return false;
    }
    error.message = StringField(*it, "message");
    error.exception_type = StringField(*it, "type");
    error.traceback = StringField(*it, "traceback");
    result.error = std::move(error);
  }

  result.images.clear();
  result.figures.clear();
  result.variables = nlohmann::json::object();
  if (!KeepsArtifacts(result.error_kind())) {
    return true;
  }

  if (auto it = envelope.find("images"); it != envelope.end() && it->is_array()) {
    for (const auto& image : *it) {
      if (image.is_string() && IsBase64(image.get<std::string>())) {
        result.images.push_back(image.get<std::string>());
      }
    }
  }
  if (auto it = envelope.find("figures"); it != envelope.end() && it->is_array()) {
    for (const auto& figure : *it) {
      if (figure.is_object() && figure.contains("type") && figure["type"].is_string() &&
          figure.contains("data") && IsPlainJson(figure["data"], 64)) {
        result.figures.push_back(figure);
      }
    }
  }
  if (auto it = envelope.find("variables"); it != envelope.end()) {
    result.variables = FilterVariables(*it, kMaxVariableChars);
  }
  return true;
}

}  // namespace analysis_sandbox
