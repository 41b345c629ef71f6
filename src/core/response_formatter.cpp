// response_formatter.cpp - Outcome rendering for agents and the CLI
#include "codebox/response_formatter.h"
#include "codebox/bounded_buffer.h"
#include "codebox/wire_format.h"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace codebox {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string Uppercase(std::string text) {
    for (auto& c : text) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return text;
}

std::string RejectionTip(ErrorKind kind) {
    if (kind == ErrorKind::SecurityViolation) {
        return "Use only the preloaded libraries and plain Python; introspection of interpreter internals is not available";
    }
    return "Shorten the code or adjust the request parameters, then try again";
}

} // anonymous namespace

std::string ResponseFormatter::TruncateUtf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t keep = max_bytes;
    while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0) == 0x80) {
        --keep;
    }
    return text.substr(0, keep);
}

json ResponseFormatter::ToJson(const ExecutionOutcome& outcome) {
    json j{
        {"success", outcome.success},
        {"state", GetExecutionStateName(outcome.state)},
        {"output", ReplaceInvalidUtf8(outcome.output)},
        {"error_output", ReplaceInvalidUtf8(outcome.error_output)},
        {"output_truncated", outcome.output_truncated},
        {"error", nullptr},
        {"execution_time", outcome.elapsed_seconds},
        {"timeout_seconds", outcome.timeout_seconds},
        {"variables", outcome.variables},
        {"variables_omitted", outcome.variables_omitted},
        {"artifacts", outcome.artifacts},
        {"artifacts_dropped", outcome.artifacts_dropped},
        {"referenced_modules", outcome.referenced_modules},
        {"degraded", outcome.degraded},
        {"degraded_guarantees", outcome.degraded_guarantees}
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
    return j;
}

json ResponseFormatter::ToJson(const RejectedRequest& rejection) {
    return json{
        {"success", false},
        {"rejected", true},
        {"error", {
            {"kind", GetErrorKindName(rejection.kind)},
            {"message", rejection.reason},
            {"exception_type", ""}
        }}
    };
}

std::string ResponseFormatter::BuildSummary(const ExecutionOutcome& outcome, const std::string& source) {
    std::string text;
    text += outcome.success ? "✅" : "❌";
    text += " **Python Code Execution Results**\n\n";

    text += "📝 **Code Summary:**\n```python\n";
    text += TruncateUtf8(source, kCodeEchoChars);
    if (source.size() > kCodeEchoChars) text += "...";
    text += "\n```\n\n";

    const double elapsed = outcome.elapsed_seconds < 0.0 ? 0.0 : outcome.elapsed_seconds;
    text += fmt::format("⏱️ **Execution Time:** {:.3f} seconds\n", elapsed);

    // ===== Output =====
    const std::string output = Trim(outcome.output);
    if (!output.empty()) {
        text += "\n📤 **Output:**\n```\n" + output + "\n```";
    } else {
        text += "\n📤 **Output:** No output produced";
    }

    // ===== Error =====
    if (outcome.error) {
        text += "\n🚨 **Error:**\n```\n" + outcome.error->message + "\n```";
        const std::string details = Trim(outcome.error_output);
        if (!details.empty()) {
            text += "\n📋 **Error Output:**\n```\n" + details + "\n```";
        }
    }

    // ===== Variables =====
    const size_t total_variables = outcome.variables.size() + outcome.variables_omitted;
    if (total_variables > 0) {
        text += fmt::format("\n📊 **Variables Created:** {}", total_variables);
        const size_t listed = std::min(outcome.variables.size(), kListedVariables);
        for (size_t i = 0; i < listed; ++i) {
            const auto& var = outcome.variables[i];
            text += "\n  • `" + var.name + "` (" + var.type_tag + "): " +
                    TruncateUtf8(var.value, kVariableValueChars);
            if (var.value.size() > kVariableValueChars) text += "...";
        }
        if (total_variables > listed) {
            text += fmt::format("\n  • ... and {} more variables", total_variables - listed);
        }
    }

    // ===== Artifacts =====
    if (!outcome.artifacts.empty()) {
        text += fmt::format("\n🎨 **Visualizations:** {} generated", outcome.artifacts.size());
        for (size_t i = 0; i < outcome.artifacts.size(); ++i) {
            const auto& artifact = outcome.artifacts[i];
            const std::string label = artifact.label.empty()
                ? fmt::format("Visualization {}", i + 1) : artifact.label;
            text += fmt::format("\n  • {} ({}, {:.1f}KB)", label, Uppercase(artifact.encoding),
                                static_cast<double>(artifact.size_bytes) / 1024.0);
        }
        if (outcome.artifacts_dropped > 0) {
            text += fmt::format("\n  • {} more figure(s) exceeded the artifact limits", outcome.artifacts_dropped);
        }
    }

    // ===== Referenced modules =====
    if (!outcome.referenced_modules.empty()) {
        text += "\n📚 **Libraries Used:**";
        const size_t listed = std::min(outcome.referenced_modules.size(), kListedModules);
        for (size_t i = 0; i < listed; ++i) {
            text += "\n  • `" + outcome.referenced_modules[i].statement + "`";
        }
        if (outcome.referenced_modules.size() > listed) {
            text += fmt::format("\n  • ... and {} more imports", outcome.referenced_modules.size() - listed);
        }
    }

    if (outcome.degraded) {
        text += "\n🛡️ **Sandbox Notice:** some resource limits could not be enforced on this host:";
        for (const auto& note : outcome.degraded_guarantees) {
            text += "\n  • " + note;
        }
    }

    // ===== Performance =====
    if (elapsed > kSlowRunSeconds) {
        text += fmt::format("\n⚠️ **Performance Note:** Execution took {:.1f}s - consider optimizing for faster results", elapsed);
    } else if (elapsed < kFastRunSeconds) {
        text += fmt::format("\n⚡ **Performance:** Very fast execution ({:.1f}ms)", elapsed * 1000.0);
    }

    if (outcome.success) {
        text += "\n\n✨ **Summary:** Code executed successfully";
        if (!outcome.artifacts.empty()) {
            text += fmt::format(" with {} visualization(s)", outcome.artifacts.size());
        }
        if (total_variables > 0) {
            text += fmt::format(" and {} variable(s) created", total_variables);
        }
    } else {
        text += "\n\n💡 **Tip:** Check the error message above and verify your code syntax and logic";
    }

    return text;
}

FormattedResponse ResponseFormatter::Format(const ExecutionOutcome& outcome, const std::string& source) const noexcept {
    FormattedResponse response;
    try {
        response.structured = ToJson(outcome);
        response.summary = BuildSummary(outcome, source);
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", GetErrorKindName(ErrorKind::InternalFormattingError), e.what());
        response.structured = nullptr;
        response.summary = kFallbackSummary;
    }
    return response;
}

FormattedResponse ResponseFormatter::FormatRejection(const RejectedRequest& rejection) const noexcept {
    FormattedResponse response;
    try {
        response.structured = ToJson(rejection);
        response.summary = "❌ **Code Execution Rejected**\n\n";
        response.summary += "🚫 **Reason:** " + rejection.reason + "\n";
        response.summary += std::string("🏷️ **Category:** ") + GetErrorKindName(rejection.kind) + "\n";
        response.summary += "\n💡 **Tip:** " + RejectionTip(rejection.kind);
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", GetErrorKindName(ErrorKind::InternalFormattingError), e.what());
        response.structured = nullptr;
        response.summary = kFallbackSummary;
    }
    return response;
}

} // namespace codebox
