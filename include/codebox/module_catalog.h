// module_catalog.h - The closed set of modules a guest may reach
#pragma once

#include "api_export.h"
#include <string>
#include <vector>

namespace codebox {

struct CatalogEntry {
    std::string module;              // import name, e.g. "matplotlib.pyplot"
    std::vector<std::string> names;  // namespace bindings created when preloaded
    bool preload = false;            // bound before the guest runs
    bool third_party = false;        // may be missing on the host
};

/**
 * The guest module catalog. Configuration may disable entries but never add
 * any: there is no API that accepts a new module name.
 */
CODEBOX_API const std::vector<CatalogEntry>& GetModuleCatalog();

// Root package of a dotted module name ("matplotlib.pyplot" -> "matplotlib")
CODEBOX_API std::string RootModuleName(const std::string& module);

// True when `module` is a catalog entry or a submodule of one
CODEBOX_API bool IsCatalogModule(const std::string& module);

// Catalog minus the disabled root packages. Unknown names are ignored.
CODEBOX_API std::vector<CatalogEntry> ResolveCatalog(const std::vector<std::string>& disabled_modules);

} // namespace codebox
