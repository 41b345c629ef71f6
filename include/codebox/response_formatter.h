// response_formatter.h - Structured and human-readable rendering of outcomes
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace codebox {

struct FormattedResponse {
    nlohmann::json structured;  // machine-readable outcome for the caller
    std::string summary;        // markdown-flavoured text for the agent
};

/**
 * ResponseFormatter - renders an ExecutionOutcome or RejectedRequest.
 *
 * Formatting never fails the request: any internal error is logged as an
 * InternalFormattingError and the fixed fallback text is returned instead.
 */
class CODEBOX_API ResponseFormatter {
public:
    static constexpr const char* kFallbackSummary =
        "Code execution completed, but the result could not be formatted.";

    static constexpr size_t kCodeEchoChars = 200;
    static constexpr size_t kVariableValueChars = 100;
    static constexpr size_t kListedVariables = 5;
    static constexpr size_t kListedModules = 5;
    static constexpr double kSlowRunSeconds = 10.0;
    static constexpr double kFastRunSeconds = 0.1;

    FormattedResponse Format(const ExecutionOutcome& outcome, const std::string& source) const noexcept;
    FormattedResponse FormatRejection(const RejectedRequest& rejection) const noexcept;

    // Structured forms, also used by the CLI's --json output
    static nlohmann::json ToJson(const ExecutionOutcome& outcome);
    static nlohmann::json ToJson(const RejectedRequest& rejection);

    // Cuts to at most max_bytes without splitting a UTF-8 sequence
    static std::string TruncateUtf8(const std::string& text, size_t max_bytes);

private:
    static std::string BuildSummary(const ExecutionOutcome& outcome, const std::string& source);
};

} // namespace codebox
