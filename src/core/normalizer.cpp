/**
 * @file normalizer.cpp
 * @brief Нормализация таблицы кривых одного источника
 */

#include "normalizer.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>

namespace logmerge::core {

const std::vector<std::string>& depthColumnAliases() {
    static const std::vector<std::string> kAliases = {
        "DEPT", "DEPTH", "MD", "TVD", "TDEP"
    };
    return kAliases;
}

const std::vector<double>& commonNullValues() {
    static const std::vector<double> kNulls = {
        -999.25, -999.0, -9999.0, -999999.0, 999.25
    };
    return kNulls;
}

std::vector<double> effectiveNullValues(
    const SourceMetadata& metadata,
    const std::vector<double>& extra
) {
    std::vector<double> nulls;
    nulls.push_back(metadata.effectiveNullValue());
    nulls.insert(nulls.end(), commonNullValues().begin(), commonNullValues().end());
    nulls.insert(nulls.end(), extra.begin(), extra.end());
    return nulls;
}

std::optional<size_t> findDepthColumn(const CurveTable& table) noexcept {
    for (const auto& alias : depthColumnAliases()) {
        if (auto idx = table.indexOf(alias)) {
            return idx;
        }
    }
    return std::nullopt;
}

bool isNullSentinel(double value, const std::vector<double>& null_values) noexcept {
    if (isMissing(value)) return false;
    for (double null_value : null_values) {
        if (std::abs(value - null_value) < kNullTolerance) {
            return true;
        }
    }
    return false;
}

CurveTable normalizeCurveTable(
    const CurveTable& raw,
    const NormalizeOptions& options
) {
    auto depth_idx = findDepthColumn(raw);
    if (!depth_idx.has_value()) {
        throw NormalizationError("No depth column found (expected one of DEPT, DEPTH, MD, TVD, TDEP)");
    }

    const size_t rows = raw.columns[*depth_idx].values.size();
    for (const auto& column : raw.columns) {
        if (column.values.size() != rows) {
            throw NormalizationError(
                "Column " + column.name + " has " + std::to_string(column.values.size()) +
                " rows, depth column has " + std::to_string(rows));
        }
    }

    const double depth_factor = options.depth_unit == DepthUnit::Meters ? kFeetPerMeter : 1.0;

    // Строки с определённой глубиной, отсортированные устойчиво
    std::vector<size_t> order;
    order.reserve(rows);
    const auto& raw_depth = raw.columns[*depth_idx].values;
    for (size_t r = 0; r < rows; ++r) {
        if (std::isfinite(raw_depth[r])) {
            order.push_back(r);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&raw_depth](size_t a, size_t b) {
        return raw_depth[a] < raw_depth[b];
    });

    // Колонки кривых после очистки сентинелов
    std::vector<const CurveColumn*> sources;
    for (size_t c = 0; c < raw.columns.size(); ++c) {
        if (c != *depth_idx) {
            sources.push_back(&raw.columns[c]);
        }
    }

    auto cleaned = [&options](double v) {
        return isNullSentinel(v, options.null_values) ? missingValue() : v;
    };

    CurveTable out;
    out.addColumn(kDepthColumn);
    for (const auto* column : sources) {
        out.addColumn(column->name);
    }
    auto& depth_out = out.columns.front().values;

    size_t i = 0;
    while (i < order.size()) {
        size_t j = i + 1;
        while (j < order.size() && raw_depth[order[j]] == raw_depth[order[i]]) {
            ++j;
        }

        depth_out.push_back(raw_depth[order[i]] * depth_factor);

        for (size_t c = 0; c < sources.size(); ++c) {
            const auto& values = sources[c]->values;
            double value = 0.0;
            if (j - i == 1) {
                value = cleaned(values[order[i]]);
            } else {
                ValueList group;
                group.reserve(j - i);
                for (size_t k = i; k < j; ++k) {
                    group.push_back(cleaned(values[order[k]]));
                }
                value = median(group).value_or(missingValue());
            }
            out.columns[c + 1].values.push_back(value);
        }

        i = j;
    }

    return out;
}

} // namespace logmerge::core
