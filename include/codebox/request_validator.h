// request_validator.h - Cheap pre-checks run before any sandbox resource is allocated
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <string>
#include <vector>

namespace codebox {

struct ValidationResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::RejectedRequest;
    std::string reason;
    int effective_timeout = 0;              // clamped into [1, max_timeout_seconds]
    std::vector<std::string> warnings;      // e.g. timeout reduced to the maximum
    std::vector<std::string> suggestions;   // advisory hints based on the source text
};

/**
 * RequestValidator - size, line count, language tag and timeout checks.
 *
 * The fast-reject pattern list is an optimization for obviously hostile
 * snippets. It is not the security boundary: that is the allowlisted guest
 * namespace and the capability audit policy inside the worker.
 */
class CODEBOX_API RequestValidator {
public:
    explicit RequestValidator(const ExecutionLimits& limits);
    RequestValidator(const ExecutionLimits& limits, std::vector<std::string> fast_reject_patterns);

    ValidationResult Validate(const ExecutionRequest& request) const;

    const std::vector<std::string>& GetFastRejectPatterns() const { return fast_reject_patterns_; }

    // Patterns used when none are configured
    static std::vector<std::string> DefaultFastRejectPatterns();

    // Counts lines the way an editor does: a trailing newline does not open a new line
    static size_t CountLines(const std::string& source);

private:
    static std::vector<std::string> CollectSuggestions(const std::string& source);

    const ExecutionLimits limits_;
    std::vector<std::string> fast_reject_patterns_;
};

} // namespace codebox
