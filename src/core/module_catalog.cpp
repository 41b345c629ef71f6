// module_catalog.cpp - Guest module allowlist
#include "codebox/module_catalog.h"

#include <algorithm>

namespace codebox {

const std::vector<CatalogEntry>& GetModuleCatalog() {
    static const std::vector<CatalogEntry> catalog = {
        // Data analysis
        {"numpy", {"numpy", "np"}, true, true},
        {"pandas", {"pandas", "pd"}, true, true},
        {"matplotlib", {"matplotlib"}, true, true},
        {"matplotlib.pyplot", {"plt"}, true, true},
        {"seaborn", {"seaborn", "sns"}, false, true},

        // Scientific
        {"scipy", {"scipy"}, false, true},
        {"sympy", {"sympy"}, false, true},
        {"networkx", {"networkx", "nx"}, false, true},
        {"sklearn", {"sklearn"}, false, true},

        // Standard library
        {"math", {"math"}, true, false},
        {"random", {"random"}, true, false},
        {"statistics", {"statistics"}, true, false},
        {"datetime", {"datetime"}, true, false},
        {"json", {"json"}, true, false},
        {"re", {"re"}, true, false},
        {"collections", {"collections"}, true, false},
        {"itertools", {"itertools"}, true, false},
        {"functools", {"functools"}, true, false},
        {"operator", {"operator"}, false, false},
        {"decimal", {"decimal"}, false, false},
        {"fractions", {"fractions"}, false, false},
    };
    return catalog;
}

std::string RootModuleName(const std::string& module) {
    return module.substr(0, module.find('.'));
}

bool IsCatalogModule(const std::string& module) {
    const std::string root = RootModuleName(module);
    const auto& catalog = GetModuleCatalog();
    return std::any_of(catalog.begin(), catalog.end(), [&](const CatalogEntry& entry) {
        return RootModuleName(entry.module) == root;
    });
}

std::vector<CatalogEntry> ResolveCatalog(const std::vector<std::string>& disabled_modules) {
    std::vector<CatalogEntry> resolved;
    for (const auto& entry : GetModuleCatalog()) {
        const std::string root = RootModuleName(entry.module);
        const bool disabled = std::any_of(disabled_modules.begin(), disabled_modules.end(),
                                          [&](const std::string& name) { return RootModuleName(name) == root; });
        if (!disabled) {
            resolved.push_back(entry);
        }
    }
    return resolved;
}

} // namespace codebox
