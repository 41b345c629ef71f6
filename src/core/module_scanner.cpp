// module_scanner.cpp - Import statement scan
#include "codebox/module_scanner.h"

#include <cctype>
#include <sstream>

namespace codebox {

namespace {

std::string Strip(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const auto last = line.find_last_not_of(" \t\r");
    return line.substr(first, last - first + 1);
}

// First dotted identifier after the keyword: "import numpy as np" -> "numpy",
// "from scipy.stats import norm" -> "scipy.stats"
std::string ModuleName(const std::string& statement, size_t keyword_length) {
    size_t pos = keyword_length;
    while (pos < statement.size() && std::isspace(static_cast<unsigned char>(statement[pos]))) {
        ++pos;
    }
    const size_t start = pos;
    while (pos < statement.size()) {
        const char c = statement[pos];
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
            ++pos;
        } else {
            break;
        }
    }
    return statement.substr(start, pos - start);
}

} // anonymous namespace

std::vector<ReferencedModule> ScanReferencedModules(const std::string& source) {
    std::vector<ReferencedModule> modules;
    std::istringstream stream(source);
    std::string line;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        const std::string statement = Strip(line);

        size_t keyword_length = 0;
        if (statement.rfind("import ", 0) == 0) {
            keyword_length = 6;
        } else if (statement.rfind("from ", 0) == 0) {
            keyword_length = 4;
        } else {
            continue;
        }

        ReferencedModule module;
        module.line = line_number;
        module.statement = statement;
        module.module = ModuleName(statement, keyword_length);
        modules.push_back(std::move(module));
    }

    return modules;
}

} // namespace codebox
