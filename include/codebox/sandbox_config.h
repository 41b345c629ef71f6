// sandbox_config.h - Process-wide configuration for the code execution service
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

struct LoggingSettings {
    std::string level = "info";   // trace, debug, info, warn, error, critical, off
    std::string file;             // empty = console only
    std::string worker_file;      // empty = worker logs discarded
};

// Returns the value of an environment variable or nullptr
using EnvironmentLookup = std::function<const char*(const char*)>;

/**
 * @brief Immutable configuration loaded once at start.
 *
 * Config file search order:
 * 1. Explicit path (--config)
 * 2. ./codebox_config.json
 * 3. ./config/codebox_config.json
 * 4. ~/.codebox/codebox_config.json
 *
 * Environment overrides applied afterwards:
 *   MAX_EXECUTION_TIME  max_timeout_seconds (default timeout follows when larger)
 *   MAX_MEMORY_MB       max_memory_mb
 *   MAX_OUTPUT_SIZE     max_output_chars
 *   CODEBOX_WORKER      worker executable
 *
 * Usage:
 *   std::string error;
 *   auto config = SandboxConfig::Load("", error);
 *   if (!config) { spdlog::error("{}", error); return 3; }
 */
class CODEBOX_API SandboxConfig {
public:
    static constexpr const char* kConfigFileName = "codebox_config.json";

    // File + environment. A missing file means defaults; an unreadable or
    // invalid one is an error.
    static std::optional<SandboxConfig> Load(const std::filesystem::path& explicit_path,
                                             std::string& error);

    // Same as Load with a caller-supplied environment (tests)
    static std::optional<SandboxConfig> Load(const std::filesystem::path& explicit_path,
                                             const EnvironmentLookup& env,
                                             std::string& error);

    // Parses and validates a JSON document without touching the environment
    static std::optional<SandboxConfig> FromJson(const nlohmann::json& config, std::string& error);

    static SandboxConfig Defaults();

    const ExecutionLimits& GetLimits() const { return limits_; }
    const std::string& GetWorkerPath() const { return worker_path_; }
    const std::vector<std::string>& GetDisabledModules() const { return disabled_modules_; }
    const std::vector<std::string>& GetFastRejectPatterns() const { return fast_reject_patterns_; }
    const LoggingSettings& GetLogging() const { return logging_; }

    // Where the values came from; empty when only defaults were used
    const std::filesystem::path& GetConfigPath() const { return config_path_; }

    // Non-fatal adjustments made while loading (e.g. default timeout clamped)
    const std::vector<std::string>& GetWarnings() const { return warnings_; }

    // codebox-worker next to the running executable
    static std::string DefaultWorkerPath();

private:
    SandboxConfig();

    static std::filesystem::path FindConfigFile(const std::filesystem::path& explicit_path,
                                                const EnvironmentLookup& env);
    static std::filesystem::path GetUserConfigDir(const EnvironmentLookup& env);

    bool ApplyEnvironment(const EnvironmentLookup& env, std::string& error);
    bool Validate(std::string& error);

    ExecutionLimits limits_;
    std::string worker_path_;
    std::vector<std::string> disabled_modules_;
    std::vector<std::string> fast_reject_patterns_;
    LoggingSettings logging_;
    std::filesystem::path config_path_;
    std::vector<std::string> warnings_;
};

// Installs the default spdlog logger: colored console sink plus an optional file sink.
// `verbose` forces debug level.
CODEBOX_API void InitializeLogging(const LoggingSettings& settings, bool verbose);

} // namespace codebox
