/**
 * @file merge.cpp
 * @brief Сведение кривых нескольких прогонов одной скважины
 */

#include "merge.hpp"
#include "arbiter.hpp"
#include "errors.hpp"
#include "normalizer.hpp"
#include "projection.hpp"
#include "report.hpp"
#include <cmath>
#include <utility>

namespace logmerge::core {

namespace {

void validateOptions(const MergeOptions& options) {
    if (!std::isfinite(options.step.value) || options.step.value <= 0.0) {
        throw MergeError(MergeErrorKind::InvalidOptions,
                         "Grid step must be positive, got " + std::to_string(options.step.value));
    }
    if (options.gap_limit.has_value() &&
        (!std::isfinite(options.gap_limit->value) || options.gap_limit->value < 0.0)) {
        throw MergeError(MergeErrorKind::InvalidOptions,
                         "Gap limit must be non-negative, got " + std::to_string(options.gap_limit->value));
    }
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

WellIdentityCheck validateSameWell(const std::vector<SourceData>& sources) {
    WellIdentityCheck check;
    check.well_names.reserve(sources.size());
    for (const auto& source : sources) {
        check.well_names.push_back(source.metadata.well_name);
    }
    check.same_well = distinctWellNames(sources).size() <= 1;
    return check;
}

std::string sourceIdentifier(
    const std::vector<std::string>& source_ids,
    size_t index
) {
    if (index < source_ids.size()) {
        return source_ids[index];
    }
    return "File_" + std::to_string(index + 1);
}

MergeResult mergeSources(
    const std::vector<SourceData>& sources,
    const std::vector<std::string>& source_ids,
    const MergeOptions& options,
    ProgressCallback on_progress
) {
    auto report_progress = [&on_progress](double value, std::string_view message) {
        if (on_progress) {
            on_progress(value, message);
        }
    };

    if (sources.empty()) {
        throw MergeError(MergeErrorKind::NoSources, "No LAS files provided");
    }
    validateOptions(options);

    MergeResult result;

    // Один источник: сетка и проекция не строятся
    if (sources.size() == 1) {
        const auto& only = sources.front();
        std::string id = source_ids.empty() ? only.metadata.well_name : source_ids.front();
        result.table = only.table;
        result.report = buildSingleSourceReport(id, only.metadata.well_name, options.step);
        report_progress(1.0, "Single source, no merge needed");
        return result;
    }

    std::vector<std::string> warnings;
    auto well_names = distinctWellNames(sources);
    if (well_names.size() > 1) {
        warnings.push_back("Multiple wells detected: " + joinNames(well_names));
    }

    // Нормализация
    report_progress(0.1, "Normalizing sources");
    std::vector<CurveTable> normalized;
    std::vector<std::string> processed_ids;
    std::vector<SourceIssue> rejected;

    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        std::string id = sourceIdentifier(source_ids, i);

        NormalizeOptions normalize_options;
        normalize_options.null_values = effectiveNullValues(source.metadata, options.extra_null_values);
        normalize_options.depth_unit = parseDepthUnit(source.metadata.depth_unit);

        try {
            normalized.push_back(normalizeCurveTable(source.table, normalize_options));
            processed_ids.push_back(std::move(id));
        } catch (const NormalizationError& e) {
            warnings.push_back("Error normalizing " + id + ": " + e.what());
            rejected.push_back({id, e.what()});
        }
    }

    if (normalized.empty()) {
        throw MergeError(MergeErrorKind::NoUsableSources, "No files could be normalized");
    }

    // Мастер-сетка и предел разрыва
    report_progress(0.3, "Building master depth grid");
    auto grid = buildMasterGrid(normalized, options.step);
    Feet gap_limit = options.gap_limit.value_or(defaultGapLimit(normalized));
    result.effective_gap_limit = gap_limit;

    // Проекция и оценка качества
    report_progress(0.5, "Projecting curves to master grid");
    std::vector<ProjectedSource> projected;
    projected.reserve(normalized.size());
    for (size_t i = 0; i < normalized.size(); ++i) {
        projected.push_back(makeProjectedSource(
            processed_ids[i],
            projectTable(normalized[i], grid, gap_limit)));
    }

    // Выбор источников и заполнение пропусков
    report_progress(0.8, "Selecting sources and filling gaps");
    auto arbitration = arbitrateCurves(grid, projected);

    ReportInputs inputs;
    inputs.grid = &grid;
    inputs.merged = &arbitration.merged;
    inputs.curves = std::move(arbitration.curves);
    inputs.files_processed = std::move(processed_ids);
    inputs.warnings = std::move(warnings);
    inputs.rejected_sources = std::move(rejected);
    inputs.well_name = well_names.front();

    result.report = buildMergeReport(std::move(inputs));
    result.table = std::move(arbitration.merged);

    report_progress(1.0, "Merge complete");
    return result;
}

} // namespace logmerge::core
