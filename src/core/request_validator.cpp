// request_validator.cpp - Request pre-checks
#include "codebox/request_validator.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace codebox {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

RejectedRequest Reject(ErrorKind kind, std::string reason) {
    return RejectedRequest{kind, std::move(reason)};
}

} // anonymous namespace

RequestValidator::RequestValidator(const ExecutionLimits& limits)
    : RequestValidator(limits, DefaultFastRejectPatterns())
{
}

RequestValidator::RequestValidator(const ExecutionLimits& limits,
                                   std::vector<std::string> fast_reject_patterns)
    : limits_(limits)
    , fast_reject_patterns_(std::move(fast_reject_patterns))
{
}

std::vector<std::string> RequestValidator::DefaultFastRejectPatterns() {
    // Dunder escape hatches into interpreter internals
    return {
        "__subclasses__",
        "__globals__",
        "__builtins__",
        "__code__",
        "__closure__",
        "__mro__",
        "__bases__",
        "__import__",
        "__loader__",
        "__spec__",
        "f_globals",
        "f_back",
        "gi_frame",
    };
}

size_t RequestValidator::CountLines(const std::string& source) {
    if (source.empty()) return 0;
    size_t lines = static_cast<size_t>(std::count(source.begin(), source.end(), '\n'));
    if (source.back() != '\n') {
        ++lines;
    }
    return lines;
}

ValidationResult RequestValidator::Validate(const ExecutionRequest& request) const {
    ValidationResult result;

    auto fail = [&result](const RejectedRequest& rejected) {
        result.ok = false;
        result.kind = rejected.kind;
        result.reason = rejected.reason;
        spdlog::info("Request rejected ({}): {}", GetErrorKindName(rejected.kind), rejected.reason);
        return result;
    };

    const std::string language = ToLower(Trim(request.guest_language));
    if (language != kSupportedLanguage) {
        return fail(Reject(ErrorKind::RejectedRequest,
            "Unsupported language '" + request.guest_language + "'. Only " +
            kSupportedLanguage + " is currently supported."));
    }

    if (Trim(request.source_code).empty()) {
        return fail(Reject(ErrorKind::RejectedRequest, "Code parameter is required for execution"));
    }

    if (request.source_code.size() > limits_.max_source_bytes) {
        return fail(Reject(ErrorKind::RejectedRequest,
            "Code too long (max " + std::to_string(limits_.max_source_bytes) + " characters, got " +
            std::to_string(request.source_code.size()) + ")"));
    }

    const size_t line_count = CountLines(request.source_code);
    if (line_count > limits_.max_source_lines) {
        return fail(Reject(ErrorKind::RejectedRequest,
            "Too many lines (max " + std::to_string(limits_.max_source_lines) + ", got " +
            std::to_string(line_count) + ")"));
    }

    int timeout = limits_.default_timeout_seconds;
    if (request.timeout_seconds) {
        timeout = *request.timeout_seconds;
        if (timeout < 1) {
            return fail(Reject(ErrorKind::RejectedRequest, "Timeout must be at least 1 second"));
        }
    }
    if (timeout > limits_.max_timeout_seconds) {
        if (request.timeout_seconds) {
            result.warnings.push_back("Timeout reduced to maximum allowed: " +
                std::to_string(limits_.max_timeout_seconds) + "s");
        }
        timeout = limits_.max_timeout_seconds;
    }
    timeout = std::max(timeout, 1);

    for (const auto& pattern : fast_reject_patterns_) {
        if (!pattern.empty() && request.source_code.find(pattern) != std::string::npos) {
            return fail(Reject(ErrorKind::SecurityViolation,
                "Security violation: disallowed construct '" + pattern + "'"));
        }
    }

    if (line_count > limits_.max_source_lines / 2) {
        result.warnings.push_back("Code has many lines - consider breaking into smaller chunks");
    }

    result.ok = true;
    result.effective_timeout = timeout;
    result.suggestions = CollectSuggestions(request.source_code);
    return result;
}

std::vector<std::string> RequestValidator::CollectSuggestions(const std::string& source) {
    std::vector<std::string> suggestions;
    const std::string lower = ToLower(source);

    if (Contains(lower, "matplotlib") || Contains(lower, "plt.")) {
        suggestions.push_back("Detected matplotlib usage - figures will be captured automatically");
    }
    if (Contains(lower, "pandas") || Contains(lower, "pd.")) {
        suggestions.push_back("Detected pandas usage - consider using .head() for large datasets");
    }
    if (Contains(lower, "numpy") || Contains(lower, "np.")) {
        suggestions.push_back("Detected NumPy usage - numerical computations are vectorized");
    }
    if (Contains(lower, "for ") && Contains(lower, "range(")) {
        suggestions.push_back("Consider using vectorized operations for better performance");
    }
    return suggestions;
}

} // namespace codebox
