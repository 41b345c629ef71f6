// code_insights.cpp - Complexity score and tips
#include "codebox/code_insights.h"

#include <algorithm>
#include <cctype>

namespace codebox {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int CountOccurrences(const std::string& text, const std::string& needle) {
    int count = 0;
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

bool Contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

struct Indicator {
    const char* token;
    int weight;
};

constexpr Indicator kIndicators[] = {
    {"for ", 2}, {"while ", 2}, {"if ", 1}, {"elif ", 1}, {"else:", 1},
    {"def ", 3}, {"class ", 4}, {"try:", 2}, {"except", 2},
    {"import ", 1}, {"from ", 1},
};

} // anonymous namespace

CodeAnalysis AnalyzeCode(const std::string& source) {
    CodeAnalysis analysis;
    analysis.characters = source.size();
    analysis.lines = static_cast<size_t>(std::count(source.begin(), source.end(), '\n')) + 1;

    const std::string lower = ToLower(source);
    for (const auto& indicator : kIndicators) {
        analysis.complexity_score += CountOccurrences(lower, indicator.token) * indicator.weight;
    }

    if (analysis.complexity_score > 50) {
        analysis.suggestions.push_back("High complexity detected - consider breaking into smaller functions");
    }
    if (analysis.lines > 50) {
        analysis.suggestions.push_back("Long code block - consider splitting for better readability");
    }
    if (Contains(lower, "matplotlib") && Contains(lower, "plt.show()")) {
        analysis.suggestions.push_back("Remove plt.show() - figures are captured automatically");
    }

    return analysis;
}

std::vector<std::string> GetExecutionTips(const std::string& source) {
    std::vector<std::string> tips;
    const std::string lower = ToLower(source);

    if (Contains(lower, "pandas")) {
        tips.push_back("Use df.head() to preview large datasets");
        tips.push_back("Consider df.info() to understand data structure");
    }
    if (Contains(lower, "numpy")) {
        tips.push_back("NumPy operations are vectorized and fast");
        tips.push_back("Use np.array() for better performance than lists");
    }
    if (Contains(lower, "matplotlib")) {
        tips.push_back("Figures are captured automatically - no need for plt.show()");
        tips.push_back("Use plt.figure(figsize=(10,6)) for better sizing");
    }
    if (Contains(lower, "random")) {
        tips.push_back("Set random.seed() for reproducible results");
    }
    if (Contains(lower, "range(") && Contains(lower, "for ")) {
        tips.push_back("Consider using NumPy vectorized operations instead of loops");
    }
    return tips;
}

} // namespace codebox
