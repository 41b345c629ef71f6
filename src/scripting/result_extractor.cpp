#include "result_extractor.h"
#include <spdlog/spdlog.h>

namespace codebox::scripting {

namespace {

// matplotlib.pyplot if something already imported it, None otherwise
py::object LoadedPyplot() {
    py::dict modules = py::module_::import("sys").attr("modules");
    if (!modules.contains("matplotlib.pyplot")) {
        return py::none();
    }
    return modules["matplotlib.pyplot"];
}

// Figure title, first axes title, or "Figure N"
std::string FigureLabel(py::handle figure, int number) {
    try {
        py::object suptitle = py::getattr(figure, "_suptitle", py::none());
        if (!suptitle.is_none()) {
            std::string title = py::str(suptitle.attr("get_text")());
            if (!title.empty()) return title;
        }
        py::list axes = figure.attr("get_axes")();
        if (py::len(axes) > 0) {
            std::string title = py::str(axes[0].attr("get_title")());
            if (!title.empty()) return title;
        }
    } catch (const py::error_already_set& e) {
        spdlog::debug("Figure {} has no readable title: {}", number, e.what());
    }
    return "Figure " + std::to_string(number);
}

} // anonymous namespace

// ===== FigureRegistryScope =====

FigureRegistryScope::FigureRegistryScope() {
    CloseAll();
}

FigureRegistryScope::~FigureRegistryScope() {
    CloseAll();
}

void FigureRegistryScope::CloseAll() {
    try {
        py::object plt = LoadedPyplot();
        if (!plt.is_none()) {
            plt.attr("close")("all");
        }
    } catch (const py::error_already_set& e) {
        spdlog::warn("Failed to clear figure registry: {}", e.what());
    }
}

// ===== ResultExtractor =====

ResultExtractor::ResultExtractor(const ExecutionLimits& limits)
    : limits_(limits)
{
}

ExtractedVariable ResultExtractor::Snapshot(const std::string& name, py::handle value) const {
    ExtractedVariable variable;
    variable.name = name;

    try {
        variable.type_tag = py::str(py::type::handle_of(value).attr("__name__"));
    } catch (const std::exception& e) {
        spdlog::debug("Type of {} not readable: {}", name, e.what());
        variable.type_tag = "object";
    }

    try {
        py::str text(value);
        const auto max_chars = static_cast<Py_ssize_t>(limits_.max_variable_chars);
        if (PyUnicode_GetLength(text.ptr()) > max_chars) {
            text = py::reinterpret_steal<py::str>(PyUnicode_Substring(text.ptr(), 0, max_chars));
            if (!text) {
                throw py::error_already_set();
            }
            variable.truncated = true;
        }
        variable.value = text.cast<std::string>();
        if (variable.truncated) {
            variable.value += "...";
        }
    } catch (const std::exception& e) {
        spdlog::debug("Value of {} not displayable: {}", name, e.what());
        variable.value = kUnableToDisplay;
        variable.truncated = false;
    }
    return variable;
}

std::vector<ExtractedVariable> ResultExtractor::ExtractVariables(const GuestNamespace& guest, size_t& omitted) {
    std::vector<ExtractedVariable> variables;
    omitted = 0;

    // Copy first: a guest __str__ may rebind globals while we iterate
    py::list items(guest.globals.attr("items")());

    for (auto item : items) {
        py::tuple pair = item.cast<py::tuple>();
        py::handle key = pair[0];
        py::handle value = pair[1];

        if (!py::isinstance<py::str>(key)) continue;
        const std::string name = key.cast<std::string>();

        if (name.empty() || name[0] == '_') continue;
        if (PyModule_Check(value.ptr())) continue;

        auto seeded = guest.seeded.find(name);
        if (seeded != guest.seeded.end() && seeded->second.is(value)) continue;

        if (variables.size() >= limits_.max_variables) {
            ++omitted;
            continue;
        }
        variables.push_back(Snapshot(name, value));
    }
    return variables;
}

std::vector<CapturedArtifact> ResultExtractor::CaptureFigures(size_t& dropped) {
    std::vector<CapturedArtifact> artifacts;
    dropped = 0;

    py::object plt = LoadedPyplot();
    if (plt.is_none()) return artifacts;

    py::module_ io = py::module_::import("io");
    py::module_ base64 = py::module_::import("base64");
    py::list numbers = plt.attr("get_fignums")();

    for (auto entry : numbers) {
        const int number = entry.cast<int>();
        try {
            py::object figure = plt.attr("figure")(number);
            if (py::len(figure.attr("get_axes")()) == 0) continue;

            if (artifacts.size() >= limits_.max_artifacts) {
                ++dropped;
                continue;
            }

            py::object buffer = io.attr("BytesIO")();
            figure.attr("savefig")(buffer, py::arg("format") = "png", py::arg("dpi") = kFigureDpi,
                                   py::arg("bbox_inches") = "tight");
            py::bytes png = buffer.attr("getvalue")();
            std::string encoded = base64.attr("b64encode")(png).attr("decode")("ascii").cast<std::string>();

            if (encoded.size() > limits_.max_artifact_bytes) {
                spdlog::info("Figure {} dropped: {} bytes encoded exceeds {}", number, encoded.size(),
                             limits_.max_artifact_bytes);
                ++dropped;
                continue;
            }

            CapturedArtifact artifact;
            artifact.label = FigureLabel(figure, number);
            artifact.size_bytes = encoded.size();
            artifact.data = std::move(encoded);
            artifacts.push_back(std::move(artifact));

        } catch (const py::error_already_set& e) {
            spdlog::warn("Failed to render figure {}: {}", number, e.what());
            ++dropped;
        }
    }
    return artifacts;
}

ExtractionResult ResultExtractor::Extract(const GuestNamespace& guest) {
    ExtractionResult result;

    try {
        result.variables = ExtractVariables(guest, result.variables_omitted);
    } catch (const py::error_already_set& e) {
        spdlog::warn("Variable snapshot failed: {}", e.what());
    }

    try {
        result.artifacts = CaptureFigures(result.artifacts_dropped);
    } catch (const py::error_already_set& e) {
        spdlog::warn("Figure capture failed: {}", e.what());
    }

    spdlog::debug("Extracted {} variables ({} omitted), {} artifacts ({} dropped)",
                  result.variables.size(), result.variables_omitted,
                  result.artifacts.size(), result.artifacts_dropped);
    return result;
}

} // namespace codebox::scripting
