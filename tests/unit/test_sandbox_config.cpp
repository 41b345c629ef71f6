// test_sandbox_config.cpp - Unit tests for configuration loading and validation

#include <catch2/catch_test_macros.hpp>
#include <codebox/sandbox_config.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>

using namespace codebox;
using json = nlohmann::json;

namespace {

// Fake environment backed by a map
EnvironmentLookup MakeEnv(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

std::filesystem::path WriteTempConfig(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("Sandbox Config - Defaults", "[config]") {
    auto config = SandboxConfig::Defaults();
    const auto& limits = config.GetLimits();

    REQUIRE(limits.max_timeout_seconds == 30);
    REQUIRE(limits.max_memory_mb == 1024);
    REQUIRE(limits.max_output_chars == 10000);
    REQUIRE(limits.max_source_lines == 200);
    REQUIRE(config.GetLogging().level == "info");
    REQUIRE(config.GetDisabledModules().empty());
    REQUIRE_FALSE(config.GetWorkerPath().empty());
    REQUIRE_FALSE(config.GetFastRejectPatterns().empty());
}

TEST_CASE("Sandbox Config - JSON document", "[config]") {
    std::string error;

    SECTION("Sections are applied") {
        json document = {
            {"limits", {{"max_timeout_seconds", 10}, {"default_timeout_seconds", 5}, {"max_output_chars", 500}}},
            {"worker", {{"path", "/opt/codebox/codebox-worker"}, {"log_file", "/tmp/worker.log"}}},
            {"modules", {{"disabled", {"sympy", "matplotlib"}}}},
            {"security", {{"fast_reject_patterns", {"__subclasses__"}}}},
            {"logging", {{"level", "debug"}, {"file", "codebox.log"}}}
        };

        auto config = SandboxConfig::FromJson(document, error);
        REQUIRE(config.has_value());
        REQUIRE(config->GetLimits().max_timeout_seconds == 10);
        REQUIRE(config->GetLimits().default_timeout_seconds == 5);
        REQUIRE(config->GetLimits().max_output_chars == 500);
        REQUIRE(config->GetLimits().max_source_bytes == 10000);
        REQUIRE(config->GetWorkerPath() == "/opt/codebox/codebox-worker");
        REQUIRE(config->GetLogging().worker_file == "/tmp/worker.log");
        REQUIRE(config->GetLogging().level == "debug");
        REQUIRE(config->GetDisabledModules().size() == 2);
        REQUIRE(config->GetFastRejectPatterns().size() == 1);
    }

    SECTION("Default timeout above the maximum is clamped with a warning") {
        json document = {{"limits", {{"max_timeout_seconds", 10}, {"default_timeout_seconds", 60}}}};
        auto config = SandboxConfig::FromJson(document, error);
        REQUIRE(config.has_value());
        REQUIRE(config->GetLimits().default_timeout_seconds == 10);
        REQUIRE(config->GetWarnings().size() == 1);
    }

    SECTION("Invalid values are refused") {
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"max_timeout_seconds", 0}}}}, error).has_value());
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"max_memory_mb", 16}}}}, error).has_value());
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"max_output_chars", 0}}}}, error).has_value());
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"max_open_files", 4}}}}, error).has_value());
        REQUIRE_FALSE(SandboxConfig::FromJson({{"logging", {{"level", "loud"}}}}, error).has_value());
        REQUIRE(error == "Unknown logging level: 'loud'");
    }

    SECTION("Limits have upper bounds") {
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"max_artifacts", 1000000}}}}, error).has_value());
        REQUIRE(error == "max_artifacts must be at most 100");
        REQUIRE_FALSE(SandboxConfig::FromJson(
            {{"limits", {{"max_artifact_bytes", 18446744073709551615ULL}}}}, error).has_value());
        REQUIRE(error == "max_artifact_bytes must be at most 67108864");
        REQUIRE_FALSE(SandboxConfig::FromJson({{"limits", {{"kill_grace_ms", 3600000}}}}, error).has_value());

        auto config = SandboxConfig::FromJson(
            {{"limits", {{"max_artifacts", 100}, {"max_artifact_bytes", 64 * 1024 * 1024}}}}, error);
        REQUIRE(config.has_value());
    }

    SECTION("Only catalog modules can be disabled") {
        auto config = SandboxConfig::FromJson({{"modules", {{"disabled", {"os"}}}}}, error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.find("'os'") != std::string::npos);
    }

    SECTION("Wrong value types are reported") {
        auto config = SandboxConfig::FromJson({{"limits", {{"max_timeout_seconds", "ten"}}}}, error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.rfind("invalid configuration value", 0) == 0);
    }

    SECTION("Memory ceiling of zero disables it") {
        auto config = SandboxConfig::FromJson({{"limits", {{"max_memory_mb", 0}}}}, error);
        REQUIRE(config.has_value());
        REQUIRE(config->GetLimits().max_memory_mb == 0);
    }
}

TEST_CASE("Sandbox Config - Environment overrides", "[config]") {
    std::string error;
    auto path = WriteTempConfig("codebox_config_env_test.json",
                                R"({"limits": {"max_timeout_seconds": 20, "default_timeout_seconds": 20}})");

    SECTION("Overrides win over the file") {
        auto config = SandboxConfig::Load(path, MakeEnv({
            {"MAX_EXECUTION_TIME", "5"},
            {"MAX_MEMORY_MB", "256"},
            {"MAX_OUTPUT_SIZE", "2000"},
            {"CODEBOX_WORKER", "/usr/local/bin/codebox-worker"}
        }), error);

        REQUIRE(config.has_value());
        REQUIRE(config->GetConfigPath() == path);
        REQUIRE(config->GetLimits().max_timeout_seconds == 5);
        REQUIRE(config->GetLimits().default_timeout_seconds == 5);
        REQUIRE(config->GetLimits().max_memory_mb == 256);
        REQUIRE(config->GetLimits().max_output_chars == 2000);
        REQUIRE(config->GetWorkerPath() == "/usr/local/bin/codebox-worker");
    }

    SECTION("Malformed override is an error") {
        auto config = SandboxConfig::Load(path, MakeEnv({{"MAX_MEMORY_MB", "lots"}}), error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error == "Invalid value for MAX_MEMORY_MB: 'lots'");
    }

    std::filesystem::remove(path);
}

TEST_CASE("Sandbox Config - File errors", "[config]") {
    std::string error;

    SECTION("Explicit path that does not exist") {
        auto config = SandboxConfig::Load("/nonexistent/codebox_config.json", MakeEnv({}), error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.find("not found") != std::string::npos);
    }

    SECTION("Unparseable file") {
        auto path = WriteTempConfig("codebox_config_bad.json", "{ not json");
        auto config = SandboxConfig::Load(path, MakeEnv({}), error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error.find("Failed to parse") != std::string::npos);
        std::filesystem::remove(path);
    }
}
