/**
 * @file depth_grid.cpp
 * @brief Построение мастер-сетки глубин
 */

#include "depth_grid.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace logmerge::core {

MasterDepthGrid buildMasterGrid(
    const std::vector<CurveTable>& tables,
    Feet step
) {
    if (!std::isfinite(step.value) || step.value <= 0.0) {
        throw MergeError(MergeErrorKind::InvalidOptions,
                         "Grid step must be positive, got " + std::to_string(step.value));
    }

    double global_min = std::numeric_limits<double>::infinity();
    double global_max = -std::numeric_limits<double>::infinity();

    for (const auto& table : tables) {
        const auto& depths = table.depths();
        if (depths.empty()) continue;
        // Нормализованные глубины отсортированы
        global_min = std::min(global_min, depths.front());
        global_max = std::max(global_max, depths.back());
    }

    if (!std::isfinite(global_min) || !std::isfinite(global_max)) {
        throw MergeError(MergeErrorKind::NoDepthData, "No valid depth data found in files");
    }

    double start = std::floor(global_min / step.value) * step.value;
    double stop = std::ceil(global_max / step.value) * step.value;
    auto intervals = static_cast<size_t>(std::llround((stop - start) / step.value));

    MasterDepthGrid grid;
    grid.step = step;
    grid.depths.reserve(intervals + 1);
    for (size_t i = 0; i <= intervals; ++i) {
        grid.depths.push_back(start + static_cast<double>(i) * step.value);
    }
    return grid;
}

std::optional<double> medianDepthStep(const CurveTable& table) {
    const auto& depths = table.depths();
    if (depths.size() < 2) {
        return std::nullopt;
    }
    return median(consecutiveDifferences(depths));
}

Feet defaultGapLimit(const std::vector<CurveTable>& tables) {
    ValueList steps;
    for (const auto& table : tables) {
        if (auto s = medianDepthStep(table)) {
            steps.push_back(*s);
        }
    }

    auto typical = median(steps);
    if (!typical.has_value()) {
        return kMinimumGapLimit;
    }
    return Feet{std::max(kMinimumGapLimit.value, kGapLimitStepMultiplier * *typical)};
}

} // namespace logmerge::core
