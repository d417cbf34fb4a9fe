#include "config/engine_config.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace analysis_sandbox {

namespace {

// Reads an optional key; a present key must have the expected JSON type
template <typename T>
bool ReadField(const nlohmann::json& section, const char* section_name, const char* key, T& out,
               std::string* error_out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return true;
  }
  bool type_ok = false;
  if constexpr (std::is_same_v<T, bool>) {
    type_ok = it->is_boolean();
  } else if constexpr (std::is_same_v<T, std::string>) {
    type_ok = it->is_string();
  } else if constexpr (std::is_unsigned_v<T>) {
    type_ok = it->is_number_unsigned();
  } else if constexpr (std::is_integral_v<T>) {
    type_ok = it->is_number_integer();
  } else {
    static_assert(sizeof(T) == 0, "unsupported config field type");
  }
  if (!type_ok) {
    if (error_out) *error_out = fmt::format("Config field '{}.{}' has the wrong type", section_name, key);
    return false;
  }
  out = it->get<T>();
  return true;
}

bool Section(const nlohmann::json& j, const char* name, nlohmann::json& out, std::string* error_out) {
  auto it = j.find(name);
  if (it == j.end()) {
    out = nlohmann::json::object();
    return true;
  }
  if (!it->is_object()) {
    if (error_out) *error_out = fmt::format("Config section '{}' must be an object", name);
    return false;
  }
  out = *it;
  return true;
}

bool CheckPositive(long long value, const char* name, std::string* error_out) {
  if (value <= 0) {
    if (error_out) *error_out = fmt::format("Config field '{}' must be positive, got {}", name, value);
    return false;
  }
  return true;
}

}  // namespace

bool EngineConfig::Parse(const std::string& json_str, EngineConfig& out, std::string* error_out) {
  try {
    auto j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      if (error_out) *error_out = "Config must be a JSON object";
      return false;
    }

    EngineConfig config = Default();
    nlohmann::json limits, ceilings, sandbox, validator;
    if (!Section(j, "limits", limits, error_out) || !Section(j, "ceilings", ceilings, error_out) ||
        !Section(j, "sandbox", sandbox, error_out) || !Section(j, "validator", validator, error_out)) {
      return false;
    }

    SandboxOptions& sb = config.sandbox;
    bool ok =
        ReadField(limits, "limits", "timeout_seconds", config.default_limits.timeout_seconds, error_out) &&
        ReadField(limits, "limits", "max_memory_mb", config.default_limits.max_memory_mb, error_out) &&
        ReadField(ceilings, "ceilings", "max_timeout_seconds", config.ceilings.max_timeout_seconds, error_out) &&
        ReadField(ceilings, "ceilings", "min_memory_mb", config.ceilings.min_memory_mb, error_out) &&
        ReadField(ceilings, "ceilings", "max_memory_mb", config.ceilings.max_memory_mb, error_out) &&
        ReadField(sandbox, "sandbox", "interpreter", sb.interpreter, error_out) &&
        ReadField(sandbox, "sandbox", "max_output_bytes", sb.max_output_bytes, error_out) &&
        ReadField(sandbox, "sandbox", "max_stderr_bytes", sb.max_stderr_bytes, error_out) &&
        ReadField(sandbox, "sandbox", "max_result_bytes", sb.max_result_bytes, error_out) &&
        ReadField(sandbox, "sandbox", "poll_interval_ms", sb.poll_interval_ms, error_out) &&
        ReadField(sandbox, "sandbox", "scratch_root", sb.scratch_root, error_out) &&
        ReadField(sandbox, "sandbox", "scratch_file_limit_mb", sb.scratch_file_limit_mb, error_out) &&
        ReadField(sandbox, "sandbox", "max_open_files", sb.max_open_files, error_out) &&
        ReadField(sandbox, "sandbox", "isolate_network", sb.isolate_network, error_out) &&
        ReadField(sandbox, "sandbox", "require_network_isolation", sb.require_network_isolation, error_out) &&
        ReadField(sandbox, "sandbox", "restrict_filesystem", sb.restrict_filesystem, error_out) &&
        ReadField(sandbox, "sandbox", "require_filesystem_isolation", sb.require_filesystem_isolation, error_out) &&
        ReadField(sandbox, "sandbox", "restrict_process", sb.restrict_process, error_out) &&
        ReadField(sandbox, "sandbox", "require_process_isolation", sb.require_process_isolation, error_out) &&
        ReadField(sandbox, "sandbox", "block_process_spawn", sb.block_process_spawn, error_out) &&
        ReadField(validator, "validator", "max_code_bytes", config.max_code_bytes, error_out) &&
        ReadField(j, "config", "policy_file", config.policy_file, error_out);
    if (!ok) {
      return false;
    }

    if (!CheckPositive(config.ceilings.max_timeout_seconds, "ceilings.max_timeout_seconds", error_out) ||
        !CheckPositive(config.ceilings.min_memory_mb, "ceilings.min_memory_mb", error_out) ||
        !CheckPositive(sb.poll_interval_ms, "sandbox.poll_interval_ms", error_out) ||
        !CheckPositive(sb.scratch_file_limit_mb, "sandbox.scratch_file_limit_mb", error_out) ||
        !CheckPositive(sb.max_open_files, "sandbox.max_open_files", error_out) ||
        !CheckPositive(static_cast<long long>(sb.max_result_bytes), "sandbox.max_result_bytes", error_out) ||
        !CheckPositive(static_cast<long long>(config.max_code_bytes), "validator.max_code_bytes", error_out)) {
      return false;
    }
    if (config.ceilings.min_memory_mb < kMemoryFloorMb) {
      if (error_out) {
        *error_out = fmt::format("Config field 'ceilings.min_memory_mb' must be at least {}, got {}",
                                 kMemoryFloorMb, config.ceilings.min_memory_mb);
      }
      return false;
    }
    if (config.ceilings.min_memory_mb > config.ceilings.max_memory_mb) {
      if (error_out) *error_out = "Config ceilings.min_memory_mb exceeds ceilings.max_memory_mb";
      return false;
    }
    std::string limits_error;
    if (!config.default_limits.Validate(config.ceilings, &limits_error)) {
      if (error_out) *error_out = "Config default limits: " + limits_error;
      return false;
    }

    out = std::move(config);
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Failed to parse config: ") + e.what();
    return false;
  }
}

bool EngineConfig::LoadFromFile(const std::string& path, EngineConfig& out, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open config file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  EngineConfig config;
  if (!Parse(buffer.str(), config, error_out)) {
    return false;
  }
  if (!config.policy_file.empty()) {
    std::filesystem::path policy(config.policy_file);
    if (policy.is_relative()) {
      config.policy_file = (std::filesystem::path(path).parent_path() / policy).string();
    }
  }
  out = std::move(config);
  return true;
}

}  // namespace analysis_sandbox
