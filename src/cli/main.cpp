// main.cpp - codebox command line: run one Python snippet in the sandbox
#include <codebox/codebox.h>
#include <codebox/code_execution_service.h>
#include <codebox/code_insights.h>
#include <codebox/sandbox_config.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace {

// Exit codes
constexpr int kExitSuccess = 0;
constexpr int kExitExecutionFailed = 1;
constexpr int kExitRejected = 2;
constexpr int kExitConfigError = 3;

struct CommandLine {
    std::optional<std::string> code;
    std::string file;
    std::string config_path;
    std::string worker_path;
    std::optional<int> timeout;
    std::string language = codebox::kSupportedLanguage;
    bool request_json = false;
    bool json_output = false;
    bool analyze = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [-c CODE | --file PATH]\n"
              << "\n"
              << "Runs a Python snippet in an isolated worker and prints a summary.\n"
              << "Without -c or --file the code is read from stdin.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --code CODE       Source to execute\n"
              << "  -f, --file PATH       Read the source from a file\n"
              << "  -t, --timeout SECS    Requested timeout (clamped to the configured maximum)\n"
              << "      --language NAME   Guest language (only 'python' is accepted)\n"
              << "      --request-json    Read a JSON request {\"code\", \"timeout\", \"language\"} from stdin\n"
              << "      --config PATH     Configuration file\n"
              << "      --worker PATH     codebox-worker executable\n"
              << "      --json            Print the structured response instead of the summary\n"
              << "      --analyze         Print complexity analysis and tips without executing\n"
              << "  -v, --verbose         Debug logging\n"
              << "      --version         Print the version\n"
              << "  -h, --help            Show this help\n"
              << "\n"
              << "Exit codes: 0 success, 1 execution failed, 2 request rejected, 3 configuration error\n";
}

// Accepts "--flag value" and "--flag=value"
const char* FlagValue(int argc, char** argv, int& i, const char* name) {
    const size_t length = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) return nullptr;
        return argv[++i];
    }
    if (std::strncmp(argv[i], name, length) == 0 && argv[i][length] == '=') {
        return argv[i] + length + 1;
    }
    return nullptr;
}

bool IsFlag(const char* arg, const char* name) {
    const size_t length = std::strlen(name);
    return std::strcmp(arg, name) == 0 ||
           (std::strncmp(arg, name, length) == 0 && arg[length] == '=');
}

bool ParseTimeout(const char* text, std::optional<int>& timeout, std::string& error) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        error = std::string("Invalid timeout: '") + text + "'";
        return false;
    }
    timeout = static_cast<int>(value);
    return true;
}

bool ParseCommandLine(int argc, char** argv, CommandLine& cmd, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            cmd.help = true;
        } else if (std::strcmp(arg, "--version") == 0) {
            cmd.version = true;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            cmd.verbose = true;
        } else if (std::strcmp(arg, "--json") == 0) {
            cmd.json_output = true;
        } else if (std::strcmp(arg, "--analyze") == 0) {
            cmd.analyze = true;
        } else if (std::strcmp(arg, "--request-json") == 0) {
            cmd.request_json = true;
        } else if (IsFlag(arg, "-c") || IsFlag(arg, "--code")) {
            value = FlagValue(argc, argv, i, arg[1] == 'c' ? "-c" : "--code");
            if (!value) { error = "Missing value for --code"; return false; }
            cmd.code = value;
        } else if (IsFlag(arg, "-f") || IsFlag(arg, "--file")) {
            value = FlagValue(argc, argv, i, arg[1] == 'f' ? "-f" : "--file");
            if (!value) { error = "Missing value for --file"; return false; }
            cmd.file = value;
        } else if (IsFlag(arg, "-t") || IsFlag(arg, "--timeout")) {
            value = FlagValue(argc, argv, i, arg[1] == 't' ? "-t" : "--timeout");
            if (!value) { error = "Missing value for --timeout"; return false; }
            if (!ParseTimeout(value, cmd.timeout, error)) return false;
        } else if (IsFlag(arg, "--language")) {
            value = FlagValue(argc, argv, i, "--language");
            if (!value) { error = "Missing value for --language"; return false; }
            cmd.language = value;
        } else if (IsFlag(arg, "--config")) {
            value = FlagValue(argc, argv, i, "--config");
            if (!value) { error = "Missing value for --config"; return false; }
            cmd.config_path = value;
        } else if (IsFlag(arg, "--worker")) {
            value = FlagValue(argc, argv, i, "--worker");
            if (!value) { error = "Missing value for --worker"; return false; }
            cmd.worker_path = value;
        } else {
            error = std::string("Unknown argument: ") + arg;
            return false;
        }
    }

    if (cmd.code && !cmd.file.empty()) {
        error = "--code and --file are mutually exclusive";
        return false;
    }
    if (cmd.request_json && (cmd.code || !cmd.file.empty())) {
        error = "--request-json reads the request from stdin and cannot be combined with --code or --file";
        return false;
    }
    return true;
}

std::string ReadAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fills request from the command line, a file, stdin or a JSON envelope on stdin
bool BuildRequest(const CommandLine& cmd, codebox::ExecutionRequest& request, std::string& error) {
    request.guest_language = cmd.language;
    request.timeout_seconds = cmd.timeout;

    if (cmd.request_json) {
        try {
            nlohmann::json envelope = nlohmann::json::parse(ReadAll(std::cin));
            request.source_code = envelope.at("code").get<std::string>();
            if (envelope.contains("timeout") && !envelope["timeout"].is_null()) {
                request.timeout_seconds = envelope["timeout"].get<int>();
            }
            if (envelope.contains("language")) {
                request.guest_language = envelope["language"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            error = std::string("Invalid JSON request: ") + e.what();
            return false;
        }
        return true;
    }

    if (cmd.code) {
        request.source_code = *cmd.code;
    } else if (!cmd.file.empty()) {
        std::ifstream file(cmd.file, std::ios::binary);
        if (!file.is_open()) {
            error = "Cannot open source file: " + cmd.file;
            return false;
        }
        request.source_code = ReadAll(file);
    } else {
        request.source_code = ReadAll(std::cin);
    }
    return true;
}

int RunAnalysis(const codebox::ExecutionRequest& request, bool json_output) {
    const codebox::CodeAnalysis analysis = codebox::AnalyzeCode(request.source_code);
    const std::vector<std::string> tips = codebox::GetExecutionTips(request.source_code);

    if (json_output) {
        nlohmann::json out;
        out["lines"] = analysis.lines;
        out["characters"] = analysis.characters;
        out["complexity_score"] = analysis.complexity_score;
        out["suggestions"] = analysis.suggestions;
        out["tips"] = tips;
        std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return kExitSuccess;
    }

    std::cout << "Lines: " << analysis.lines << "\n"
              << "Characters: " << analysis.characters << "\n"
              << "Complexity score: " << analysis.complexity_score << "\n";
    for (const auto& suggestion : analysis.suggestions) {
        std::cout << "Suggestion: " << suggestion << "\n";
    }
    for (const auto& tip : tips) {
        std::cout << "Tip: " << tip << "\n";
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    std::string error;
    if (!ParseCommandLine(argc, argv, cmd, error)) {
        std::cerr << error << "\n\n";
        PrintUsage(argv[0]);
        return kExitConfigError;
    }
    if (cmd.help) {
        PrintUsage(argv[0]);
        return kExitSuccess;
    }
    if (cmd.version) {
        std::cout << "codebox " << codebox::GetVersionString() << std::endl;
        return kExitSuccess;
    }

    // --worker takes precedence over CODEBOX_WORKER and the config file
    const std::string worker_override = cmd.worker_path;
    codebox::EnvironmentLookup env = [&worker_override](const char* name) -> const char* {
        if (!worker_override.empty() && std::strcmp(name, "CODEBOX_WORKER") == 0) {
            return worker_override.c_str();
        }
        return std::getenv(name);
    };

    auto config = codebox::SandboxConfig::Load(cmd.config_path, env, error);
    if (!config) {
        codebox::InitializeLogging(codebox::LoggingSettings{}, cmd.verbose);
        spdlog::error("Configuration error: {}", error);
        return kExitConfigError;
    }

    codebox::InitializeLogging(config->GetLogging(), cmd.verbose);
    spdlog::debug("codebox v{}", codebox::GetVersionString());
    if (!config->GetConfigPath().empty()) {
        spdlog::debug("Loaded configuration from {}", config->GetConfigPath().string());
    }
    for (const auto& warning : config->GetWarnings()) {
        spdlog::warn("{}", warning);
    }

    codebox::ExecutionRequest request;
    if (!BuildRequest(cmd, request, error)) {
        spdlog::error("{}", error);
        return kExitConfigError;
    }

    if (cmd.analyze) {
        return RunAnalysis(request, cmd.json_output);
    }

    auto service = codebox::CodeExecutionService::Create(*config);
    const codebox::ExecutionResponse response = service->Execute(request);

    if (cmd.json_output) {
        std::cout << response.structured.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
    } else {
        std::cout << response.summary << std::endl;
    }

    if (response.IsRejected()) {
        return kExitRejected;
    }
    return response.IsSuccess() ? kExitSuccess : kExitExecutionFailed;
}
