/**
 * @file arbiter.cpp
 * @brief Ранжирование источников и сведение кривых
 */

#include "arbiter.hpp"
#include "projection.hpp"
#include <algorithm>
#include <utility>

namespace logmerge::core {

ProjectedSource makeProjectedSource(
    std::string source_id,
    CurveTable projected
) {
    ProjectedSource source;
    source.source_id = std::move(source_id);
    source.table = std::move(projected);
    source.quality.reserve(source.table.columns.size());

    for (const auto& column : source.table.columns) {
        if (column.name == kDepthColumn) {
            source.quality.emplace_back();
            continue;
        }
        source.quality.push_back(scoreCurveQuality(column.values, std::string_view{column.name}));
    }
    return source;
}

SourceRanking rankSources(
    const std::string& curve,
    const std::vector<ProjectedSource>& sources
) {
    SourceRanking ranking;
    for (size_t i = 0; i < sources.size(); ++i) {
        const auto* column = sources[i].table.find(curve);
        if (column == nullptr) continue;

        SourceRank rank;
        rank.source_id = sources[i].source_id;
        rank.coverage = coverageFraction(column->values);
        rank.qc_score = sources[i].qcScore(curve).value_or(0.0);
        rank.input_index = i;
        ranking.push_back(std::move(rank));
    }

    std::stable_sort(ranking.begin(), ranking.end(), [](const SourceRank& a, const SourceRank& b) {
        if (a.coverage != b.coverage) {
            return a.coverage > b.coverage;
        }
        return a.qc_score > b.qc_score;
    });
    return ranking;
}

size_t fillGaps(ValueList& target, const ValueList& secondary) {
    size_t filled = 0;
    const size_t n = std::min(target.size(), secondary.size());
    for (size_t i = 0; i < n; ++i) {
        if (isMissing(target[i]) && !isMissing(secondary[i])) {
            target[i] = secondary[i];
            ++filled;
        }
    }
    return filled;
}

std::vector<std::string> collectCurveNames(const std::vector<ProjectedSource>& sources) {
    std::vector<std::string> names;
    for (const auto& source : sources) {
        for (const auto& name : source.table.curveNames()) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
    }
    return names;
}

CurveProvenance arbitrateCurve(
    const std::string& curve,
    const std::vector<ProjectedSource>& sources,
    ValueList& merged_values
) {
    CurveProvenance provenance;
    provenance.curve = curve;
    provenance.kind = classifyCurve(curve);
    provenance.ranking = rankSources(curve, sources);

    if (provenance.ranking.empty()) {
        return provenance;
    }

    const auto& primary = provenance.ranking.front();
    merged_values = sources[primary.input_index].table.find(curve)->values;
    provenance.source_file = primary.source_id;
    provenance.qc_score = primary.qc_score;

    for (size_t r = 1; r < provenance.ranking.size(); ++r) {
        if (countPresent(merged_values) == merged_values.size()) {
            break;
        }
        const auto& secondary = provenance.ranking[r];
        const auto* column = sources[secondary.input_index].table.find(curve);
        size_t filled = fillGaps(merged_values, column->values);
        if (filled > 0) {
            if (!provenance.gaps_filled_from.has_value()) {
                provenance.gaps_filled_from = secondary.source_id;
            }
            provenance.gaps_count += filled;
        }
    }

    // Покрытие - после заполнения, качество - основного источника до заполнения
    provenance.coverage = coverageFraction(merged_values);
    return provenance;
}

ArbitrationResult arbitrateCurves(
    const MasterDepthGrid& grid,
    const std::vector<ProjectedSource>& sources
) {
    ArbitrationResult result;
    result.merged.addColumn(kDepthColumn, grid.depths);

    for (const auto& curve : collectCurveNames(sources)) {
        ValueList values;
        auto provenance = arbitrateCurve(curve, sources, values);
        if (provenance.ranking.empty()) {
            continue;
        }
        result.merged.addColumn(curve, std::move(values));
        result.curves.push_back(std::move(provenance));
    }

    return result;
}

} // namespace logmerge::core
