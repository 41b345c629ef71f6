// code_insights.h - Advisory complexity analysis and execution tips
#pragma once

#include "api_export.h"
#include <string>
#include <vector>

namespace codebox {

struct CodeAnalysis {
    size_t lines = 0;
    size_t characters = 0;
    int complexity_score = 0;
    std::vector<std::string> suggestions;
};

// Weighted keyword count (loops, branches, definitions, imports).
// Never used to accept or reject a request.
CODEBOX_API CodeAnalysis AnalyzeCode(const std::string& source);

// Library-specific hints for the agent
CODEBOX_API std::vector<std::string> GetExecutionTips(const std::string& source);

} // namespace codebox
