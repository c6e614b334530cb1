/**
 * @file report.cpp
 * @brief Сборка отчёта о сведении
 */

#include "report.hpp"
#include <algorithm>
#include <utility>

namespace logmerge::core {

MergeReport buildMergeReport(ReportInputs inputs) {
    MergeReport report;
    report.merge_performed = true;

    if (inputs.grid != nullptr) {
        report.master_depth = inputs.grid->describe();
    }

    for (auto& provenance : inputs.curves) {
        if (inputs.merged != nullptr) {
            if (const auto* column = inputs.merged->find(provenance.curve)) {
                provenance.coverage = coverageFraction(column->values);
            }
        }
        report.curves.push_back(std::move(provenance));
    }

    report.files_processed = std::move(inputs.files_processed);
    report.warnings = std::move(inputs.warnings);
    report.rejected_sources = std::move(inputs.rejected_sources);
    if (!inputs.well_name.empty()) {
        report.well_name = std::move(inputs.well_name);
    }
    return report;
}

MergeReport buildSingleSourceReport(
    const std::string& source_id,
    const std::string& well_name,
    Feet step
) {
    MergeReport report;
    report.merge_performed = false;
    report.master_depth = {0.0, 0.0, step.value, 0};
    report.files_processed = {source_id};
    report.warnings = {kSingleSourceWarning};
    if (!well_name.empty()) {
        report.well_name = well_name;
    }
    return report;
}

std::vector<std::string> distinctWellNames(const std::vector<SourceData>& sources) {
    std::vector<std::string> names;
    for (const auto& source : sources) {
        const auto& name = source.metadata.well_name;
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

} // namespace logmerge::core
