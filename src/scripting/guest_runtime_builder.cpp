#include "guest_runtime_builder.h"
#include "capability_policy.h"
#include <pybind11/eval.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace codebox::scripting {

namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool ImportAllowed(const std::vector<std::string>& roots, const std::string& name, int level) {
    if (level > 0 || name.empty()) {
        return false;
    }
    return Contains(roots, RootModuleName(name));
}

} // anonymous namespace

const std::vector<std::string>& GuestRuntimeBuilder::AllowedBuiltins() {
    static const std::vector<std::string> names = {
        // Arithmetic and numbers
        "abs", "bin", "complex", "divmod", "float", "hex", "int", "oct", "pow", "round", "sum",
        // Type introspection
        "bool", "callable", "classmethod", "dir", "hasattr", "hash", "id", "isinstance",
        "issubclass", "object", "property", "staticmethod", "super", "type",
        // Formatting and text
        "chr", "format", "ord", "print", "repr", "str",
        // Containers and iteration
        "all", "any", "bytearray", "bytes", "dict", "enumerate", "filter", "frozenset", "iter",
        "len", "list", "map", "max", "min", "next", "range", "reversed", "set", "slice",
        "sorted", "tuple", "zip",
        // Constants and class construction
        "True", "False", "None", "Ellipsis", "NotImplemented", "__debug__", "__build_class__"
    };
    return names;
}

const std::vector<std::string>& GuestRuntimeBuilder::ExcludedBuiltins() {
    static const std::vector<std::string> names = {
        "open", "eval", "exec", "compile", "input", "breakpoint", "exit", "quit",
        "globals", "locals", "vars", "getattr", "setattr", "delattr", "help",
        "memoryview", "__loader__", "__spec__", "__import__"
    };
    return names;
}

GuestRuntimeBuilder::GuestRuntimeBuilder(std::vector<CatalogEntry> catalog)
    : catalog_(std::move(catalog))
{
    for (const auto& entry : catalog_) {
        const std::string root = RootModuleName(entry.module);
        if (!Contains(allowed_roots_, root)) {
            allowed_roots_.push_back(root);
        }
    }
}

bool GuestRuntimeBuilder::IsImportAllowed(const std::string& name, int level) const {
    return ImportAllowed(allowed_roots_, name, level);
}

py::dict GuestRuntimeBuilder::BuildBuiltins() {
    py::dict source = py::module_::import("builtins").attr("__dict__");
    py::dict restricted;

    for (const auto& name : AllowedBuiltins()) {
        if (source.contains(name)) {
            restricted[py::str(name)] = source[py::str(name)];
        }
    }

    // Exception and warning classes
    for (auto item : source) {
        const std::string name = py::str(item.first);
        if (Contains(ExcludedBuiltins(), name)) continue;
        if (PyExceptionClass_Check(item.second.ptr())) {
            restricted[item.first] = item.second;
        }
    }

    restricted["__import__"] = BuildGuardedImport();

    spdlog::debug("Guest builtins configured ({} names)", py::len(restricted));
    return restricted;
}

py::cpp_function GuestRuntimeBuilder::BuildGuardedImport() {
    py::object original_import = py::module_::import("builtins").attr("__import__");
    const std::vector<std::string> roots = allowed_roots_;

    return py::cpp_function(
        [original_import, roots](const std::string& name, py::object globals, py::object locals,
                                 py::object fromlist, int level) -> py::object {
            if (level > 0) {
                throw py::import_error("Relative imports are not allowed in the sandbox");
            }
            if (!ImportAllowed(roots, name, level)) {
                throw py::import_error("Import of '" + name + "' is not allowed in the sandbox");
            }
            return original_import(name, globals, locals, fromlist, level);
        },
        py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);
}

void GuestRuntimeBuilder::ConfigurePlotting() {
    // Figures stay registered until the extractor renders them
    py::dict scope;
    py::exec(R"(
import matplotlib.pyplot as _plt

def _codebox_show(*args, **kwargs):
    return None

_plt.show = _codebox_show
)", scope);
}

void GuestRuntimeBuilder::PreloadModules(GuestNamespace& guest, BuildReport& report) {
    py::object find_spec = py::module_::import("importlib.util").attr("find_spec");

    for (const auto& entry : catalog_) {
        if (!entry.preload) {
            // Import-on-demand: only check that the package exists
            if (entry.third_party) {
                try {
                    if (find_spec(entry.module).is_none()) {
                        spdlog::info("Optional module not installed: {}", entry.module);
                        report.unavailable_modules.push_back(entry.module);
                    }
                } catch (const py::error_already_set& e) {
                    spdlog::warn("Could not probe module {}: {}", entry.module, e.what());
                    report.unavailable_modules.push_back(entry.module);
                }
            }
            continue;
        }

        try {
            py::module_ module = py::module_::import(entry.module.c_str());
            if (entry.module == "matplotlib") {
                module.attr("use")("Agg");
            } else if (entry.module == "matplotlib.pyplot") {
                ConfigurePlotting();
            }

            for (const auto& name : entry.names) {
                guest.globals[py::str(name)] = module;
                guest.seeded[name] = module;
            }
            report.loaded_modules.push_back(entry.module);

        } catch (const py::error_already_set& e) {
            if (entry.third_party) {
                spdlog::warn("{} not available: {}", entry.module, e.what());
            } else {
                spdlog::error("Standard module {} failed to load: {}", entry.module, e.what());
            }
            report.unavailable_modules.push_back(entry.module);
        }
    }
}

GuestNamespace GuestRuntimeBuilder::Build(BuildReport& report) {
    GuestNamespace guest;

    report.audit_hook_installed = CapabilityPolicy::Instance().Install();

    guest.globals["__builtins__"] = BuildBuiltins();
    guest.globals["__name__"] = "__main__";
    guest.globals["__doc__"] = py::none();

    PreloadModules(guest, report);

    // Used by the runner and extractor after the policy is armed
    for (const char* helper : {"io", "base64", "traceback", "linecache"}) {
        py::module_::import(helper);
    }

    spdlog::info("Guest namespace built: {} modules loaded, {} unavailable",
                 report.loaded_modules.size(), report.unavailable_modules.size());
    return guest;
}

} // namespace codebox::scripting
