// sandbox_config.cpp - Configuration loading, validation and logging setup
#include "codebox/sandbox_config.h"
#include "codebox/module_catalog.h"
#include "codebox/request_validator.h"
#include "codebox/wire_format.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <pwd.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace codebox {

using json = nlohmann::json;

namespace {

const char* ProcessEnvironment(const char* name) {
    return std::getenv(name);
}

bool ParsePositive(const char* name, const char* text, long long& value, std::string& error) {
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed < 0) {
        error = std::string("Invalid value for ") + name + ": '" + text + "'";
        return false;
    }
    value = parsed;
    return true;
}

const std::vector<std::string>& KnownLogLevels() {
    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    return levels;
}

} // anonymous namespace

SandboxConfig::SandboxConfig()
    : worker_path_(DefaultWorkerPath())
    , fast_reject_patterns_(RequestValidator::DefaultFastRejectPatterns())
{
}

SandboxConfig SandboxConfig::Defaults() {
    return SandboxConfig();
}

std::string SandboxConfig::DefaultWorkerPath() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) {
        return "codebox-worker";
    }
    return (self.parent_path() / "codebox-worker").string();
}

std::filesystem::path SandboxConfig::GetUserConfigDir(const EnvironmentLookup& env) {
    const char* home = env("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : ".";
    }
    return std::filesystem::path(home) / ".codebox";
}

std::filesystem::path SandboxConfig::FindConfigFile(const std::filesystem::path& explicit_path,
                                                    const EnvironmentLookup& env) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    std::vector<std::filesystem::path> search_paths;
    if (!ec) {
        search_paths.push_back(cwd / kConfigFileName);
        search_paths.push_back(cwd / "config" / kConfigFileName);
    }
    search_paths.push_back(GetUserConfigDir(env) / kConfigFileName);

    for (const auto& path : search_paths) {
        if (std::filesystem::exists(path, ec)) {
            spdlog::debug("Found config file: {}", path.string());
            return path;
        }
    }
    return {};
}

std::optional<SandboxConfig> SandboxConfig::Load(const std::filesystem::path& explicit_path,
                                                 std::string& error) {
    return Load(explicit_path, ProcessEnvironment, error);
}

std::optional<SandboxConfig> SandboxConfig::Load(const std::filesystem::path& explicit_path,
                                                 const EnvironmentLookup& env,
                                                 std::string& error) {
    const auto path = FindConfigFile(explicit_path, env);

    std::optional<SandboxConfig> config;
    if (path.empty()) {
        spdlog::debug("No {} found, using defaults", kConfigFileName);
        config = SandboxConfig();
    } else {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            error = "Config file not found: " + path.string();
            return std::nullopt;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            error = "Failed to open config file: " + path.string();
            return std::nullopt;
        }

        json document;
        try {
            document = json::parse(file);
        } catch (const json::exception& e) {
            error = "Failed to parse " + path.string() + ": " + e.what();
            return std::nullopt;
        }

        config = FromJson(document, error);
        if (!config) {
            error = path.string() + ": " + error;
            return std::nullopt;
        }
        config->config_path_ = path;
    }

    if (!config->ApplyEnvironment(env, error) || !config->Validate(error)) {
        return std::nullopt;
    }
    return config;
}

std::optional<SandboxConfig> SandboxConfig::FromJson(const json& config, std::string& error) {
    SandboxConfig result;
    try {
        if (!config.is_object()) {
            error = "configuration root must be a JSON object";
            return std::nullopt;
        }

        // Execution ceilings
        if (config.contains("limits")) {
            result.limits_ = config["limits"].get<ExecutionLimits>();
        }

        // Worker process
        if (config.contains("worker")) {
            const auto& worker = config["worker"];
            if (worker.contains("path")) {
                result.worker_path_ = worker["path"].get<std::string>();
            }
            if (worker.contains("log_file")) {
                result.logging_.worker_file = worker["log_file"].get<std::string>();
            }
        }

        // Module catalog subset
        if (config.contains("modules")) {
            const auto& modules = config["modules"];
            if (modules.contains("disabled")) {
                result.disabled_modules_ = modules["disabled"].get<std::vector<std::string>>();
            }
        }

        // Fast-reject patterns
        if (config.contains("security")) {
            const auto& security = config["security"];
            if (security.contains("fast_reject_patterns")) {
                result.fast_reject_patterns_ = security["fast_reject_patterns"].get<std::vector<std::string>>();
            }
        }

        // Logging
        if (config.contains("logging")) {
            const auto& logging = config["logging"];
            if (logging.contains("level")) {
                result.logging_.level = logging["level"].get<std::string>();
            }
            if (logging.contains("file")) {
                result.logging_.file = logging["file"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        error = std::string("invalid configuration value: ") + e.what();
        return std::nullopt;
    }

    if (!result.Validate(error)) {
        return std::nullopt;
    }
    return result;
}

bool SandboxConfig::ApplyEnvironment(const EnvironmentLookup& env, std::string& error) {
    long long value = 0;

    if (const char* text = env("MAX_EXECUTION_TIME")) {
        if (!ParsePositive("MAX_EXECUTION_TIME", text, value, error)) return false;
        limits_.max_timeout_seconds = static_cast<int>(std::min<long long>(value, INT_MAX));
        spdlog::debug("MAX_EXECUTION_TIME override: {}s", limits_.max_timeout_seconds);
    }

    if (const char* text = env("MAX_MEMORY_MB")) {
        if (!ParsePositive("MAX_MEMORY_MB", text, value, error)) return false;
        limits_.max_memory_mb = static_cast<size_t>(value);
        spdlog::debug("MAX_MEMORY_MB override: {}", limits_.max_memory_mb);
    }

    if (const char* text = env("MAX_OUTPUT_SIZE")) {
        if (!ParsePositive("MAX_OUTPUT_SIZE", text, value, error)) return false;
        limits_.max_output_chars = static_cast<size_t>(value);
        spdlog::debug("MAX_OUTPUT_SIZE override: {}", limits_.max_output_chars);
    }

    if (const char* text = env("CODEBOX_WORKER")) {
        if (*text) {
            worker_path_ = text;
        }
    }
    return true;
}

bool SandboxConfig::Validate(std::string& error) {
    if (limits_.max_timeout_seconds < 1) {
        error = "max_timeout_seconds must be at least 1";
        return false;
    }
    if (limits_.default_timeout_seconds < 1) {
        error = "default_timeout_seconds must be at least 1";
        return false;
    }
    if (limits_.default_timeout_seconds > limits_.max_timeout_seconds) {
        warnings_.push_back("default_timeout_seconds reduced to max_timeout_seconds (" +
                            std::to_string(limits_.max_timeout_seconds) + ")");
        limits_.default_timeout_seconds = limits_.max_timeout_seconds;
    }
    if (limits_.max_memory_mb != 0 && limits_.max_memory_mb < 64) {
        error = "max_memory_mb must be 0 (no ceiling) or at least 64";
        return false;
    }
    if (limits_.max_output_chars == 0 || limits_.max_source_bytes == 0 ||
        limits_.max_source_lines == 0 || limits_.max_variable_chars == 0) {
        error = "output, source and variable size limits must be positive";
        return false;
    }
    if (limits_.startup_timeout_seconds < 1) {
        error = "startup_timeout_seconds must be at least 1";
        return false;
    }
    if (limits_.kill_grace_ms < 0) {
        error = "kill_grace_ms must not be negative";
        return false;
    }
    if (limits_.max_open_files != 0 && limits_.max_open_files < 16) {
        error = "max_open_files must be 0 (no ceiling) or at least 16";
        return false;
    }

    // Ceilings on every limit; the signed limits are non-negative by now
    struct UpperBound {
        const char* name;
        unsigned long long value;
        unsigned long long max;
    };
    const UpperBound bounds[] = {
        {"max_timeout_seconds", static_cast<unsigned long long>(limits_.max_timeout_seconds), 3600},
        {"max_memory_mb", limits_.max_memory_mb, 1024 * 1024},
        {"max_output_chars", limits_.max_output_chars, 64 * 1024 * 1024},
        {"max_source_bytes", limits_.max_source_bytes, 1024 * 1024},
        {"max_source_lines", limits_.max_source_lines, 100000},
        {"max_variable_chars", limits_.max_variable_chars, 1024 * 1024},
        {"max_variables", limits_.max_variables, 10000},
        {"max_artifacts", limits_.max_artifacts, 100},
        {"max_artifact_bytes", limits_.max_artifact_bytes, 64 * 1024 * 1024},
        {"startup_timeout_seconds", static_cast<unsigned long long>(limits_.startup_timeout_seconds), 600},
        {"kill_grace_ms", static_cast<unsigned long long>(limits_.kill_grace_ms), 60000},
        {"max_open_files", static_cast<unsigned long long>(limits_.max_open_files), 65536},
    };
    for (const auto& bound : bounds) {
        if (bound.value > bound.max) {
            error = std::string(bound.name) + " must be at most " + std::to_string(bound.max);
            return false;
        }
    }

    for (const auto& module : disabled_modules_) {
        if (!IsCatalogModule(module)) {
            error = "Unknown module in modules.disabled: '" + module +
                    "' (only catalog modules can be disabled)";
            return false;
        }
    }

    const auto& levels = KnownLogLevels();
    if (std::find(levels.begin(), levels.end(), logging_.level) == levels.end()) {
        error = "Unknown logging level: '" + logging_.level + "'";
        return false;
    }

    if (worker_path_.empty()) {
        error = "worker path must not be empty";
        return false;
    }
    return true;
}

void InitializeLogging(const LoggingSettings& settings, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    // stderr keeps stdout free for results
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Could not open log file {}: {}", settings.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("codebox", sinks.begin(), sinks.end());
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(settings.level));
    spdlog::set_default_logger(logger);
}

} // namespace codebox
