// guest_runtime_builder.h - Fresh, allowlisted guest namespace
#pragma once

#include "codebox/module_catalog.h"
#include <pybind11/pybind11.h>
#include <map>
#include <string>
#include <vector>

namespace codebox::scripting {

namespace py = pybind11;

/**
 * GuestNamespace - the globals dictionary the guest runs in.
 *
 * Owned by exactly one request in exactly one worker. `seeded` records what
 * the builder bound, so the extractor can tell guest bindings apart from
 * pre-seeded names the guest left untouched.
 */
struct GuestNamespace {
    py::dict globals;
    std::map<std::string, py::object> seeded;
};

struct BuildReport {
    std::vector<std::string> loaded_modules;
    std::vector<std::string> unavailable_modules;   // third-party packages not installed
    bool audit_hook_installed = false;
};

/**
 * GuestRuntimeBuilder - builds a GuestNamespace from closed allowlists.
 *
 * Builtins: arithmetic, type introspection, formatting and container helpers
 * plus exception classes and constants. Everything that opens files, evaluates
 * code or reaches interpreter internals is left out.
 *
 * Imports: `__import__` is replaced by a guarded import that only admits the
 * (possibly reduced) module catalog and its submodules.
 */
class GuestRuntimeBuilder {
public:
    explicit GuestRuntimeBuilder(std::vector<CatalogEntry> catalog);

    // Requires an initialized interpreter. Throws py::error_already_set only
    // when the interpreter itself is unusable; missing packages are reported.
    GuestNamespace Build(BuildReport& report);

    bool IsImportAllowed(const std::string& name, int level) const;

    const std::vector<CatalogEntry>& GetCatalog() const { return catalog_; }

    static const std::vector<std::string>& AllowedBuiltins();
    static const std::vector<std::string>& ExcludedBuiltins();

private:
    py::dict BuildBuiltins();
    py::cpp_function BuildGuardedImport();
    void PreloadModules(GuestNamespace& guest, BuildReport& report);
    void ConfigurePlotting();

    std::vector<CatalogEntry> catalog_;
    std::vector<std::string> allowed_roots_;
};

} // namespace codebox::scripting
