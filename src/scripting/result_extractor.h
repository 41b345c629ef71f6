// result_extractor.h - Post-run snapshot of guest variables and figures
#pragma once

#include "codebox/execution_types.h"
#include "guest_runtime_builder.h"
#include <vector>

namespace codebox::scripting {

/**
 * FigureRegistryScope - owns matplotlib's global figure registry for one run.
 *
 * Clears it on entry so only the guest's figures are captured, and on every
 * exit path so rendered images never outlive the request.
 */
class FigureRegistryScope {
public:
    FigureRegistryScope();
    ~FigureRegistryScope();

    FigureRegistryScope(const FigureRegistryScope&) = delete;
    FigureRegistryScope& operator=(const FigureRegistryScope&) = delete;

private:
    static void CloseAll();
};

struct ExtractionResult {
    std::vector<ExtractedVariable> variables;
    size_t variables_omitted = 0;
    std::vector<CapturedArtifact> artifacts;
    size_t artifacts_dropped = 0;
};

class ResultExtractor {
public:
    explicit ResultExtractor(const ExecutionLimits& limits);

    ExtractionResult Extract(const GuestNamespace& guest);

    std::vector<ExtractedVariable> ExtractVariables(const GuestNamespace& guest, size_t& omitted);
    std::vector<CapturedArtifact> CaptureFigures(size_t& dropped);

    static constexpr const char* kUnableToDisplay = "<unable to display>";
    static constexpr int kFigureDpi = 100;

private:
    ExtractedVariable Snapshot(const std::string& name, py::handle value) const;

    const ExecutionLimits limits_;
};

} // namespace codebox::scripting
