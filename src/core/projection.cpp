/**
 * @file projection.cpp
 * @brief Передискретизация кривых на мастер-сетку
 */

#include "projection.hpp"
#include "model/text_utils.hpp"
#include <algorithm>
#include <cmath>

namespace logmerge::core {

const std::vector<std::string>& discreteCurveTokens() {
    static const std::vector<std::string> kTokens = {
        "LITH", "FACIES", "FLAG", "ZONE", "CODE", "TYPE", "CLASS"
    };
    return kTokens;
}

CurveKind classifyCurve(std::string_view name) {
    auto upper = utf8ToUpper(name);
    for (const auto& token : discreteCurveTokens()) {
        if (upper.find(token) != std::string::npos) {
            return CurveKind::Discrete;
        }
    }
    return CurveKind::Continuous;
}

ValueList projectContinuous(
    const ValueList& grid,
    const ValueList& depths,
    const ValueList& values,
    Feet gap_limit
) {
    ValueList result(grid.size(), missingValue());
    if (depths.empty() || depths.size() != values.size()) {
        return result;
    }

    const double limit = gap_limit.value;
    const size_t n = depths.size();

    for (size_t i = 0; i < grid.size(); ++i) {
        double x = grid[i];
        auto right = static_cast<size_t>(
            std::lower_bound(depths.begin(), depths.end(), x) - depths.begin());

        if (right == 0) {
            // Выше первого отсчёта или точно на нём
            if (depths.front() - x <= limit) {
                result[i] = values.front();
            }
        } else if (right >= n) {
            // Ниже последнего отсчёта
            if (x - depths.back() <= limit) {
                result[i] = values.back();
            }
        } else {
            double x_left = depths[right - 1];
            double x_right = depths[right];
            // Широкий интервал оставляет пропуском все точки внутри,
            // включая совпавшую с его нижним отсчётом
            if (x_right - x_left <= limit) {
                double t = (x - x_left) / (x_right - x_left);
                result[i] = values[right - 1] * (1.0 - t) + values[right] * t;
            }
        }
    }

    return result;
}

ValueList projectDiscrete(
    const ValueList& grid,
    const ValueList& depths,
    const ValueList& values,
    double max_distance
) {
    ValueList result(grid.size(), missingValue());
    if (depths.empty() || depths.size() != values.size()) {
        return result;
    }

    for (size_t i = 0; i < grid.size(); ++i) {
        double x = grid[i];
        auto right = static_cast<size_t>(
            std::lower_bound(depths.begin(), depths.end(), x) - depths.begin());

        size_t nearest = 0;
        if (right == 0) {
            nearest = 0;
        } else if (right >= depths.size()) {
            nearest = depths.size() - 1;
        } else {
            double d_left = x - depths[right - 1];
            double d_right = depths[right] - x;
            nearest = (d_right < d_left) ? right : right - 1;
        }

        if (std::abs(depths[nearest] - x) <= max_distance) {
            result[i] = values[nearest];
        }
    }

    return result;
}

ValueList projectCurve(
    const CurveTable& table,
    const CurveColumn& curve,
    const MasterDepthGrid& grid,
    Feet gap_limit
) {
    const auto& table_depths = table.depths();

    ValueList depths;
    ValueList values;
    const size_t rows = std::min(table_depths.size(), curve.values.size());
    depths.reserve(rows);
    values.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        if (isMissing(table_depths[r]) || isMissing(curve.values[r])) continue;
        depths.push_back(table_depths[r]);
        values.push_back(curve.values[r]);
    }

    if (classifyCurve(curve.name) == CurveKind::Discrete) {
        return projectDiscrete(grid.depths, depths, values, discreteMaxDistance(grid.step));
    }
    return projectContinuous(grid.depths, depths, values, gap_limit);
}

CurveTable projectTable(
    const CurveTable& table,
    const MasterDepthGrid& grid,
    Feet gap_limit
) {
    CurveTable projected;
    projected.addColumn(kDepthColumn, grid.depths);

    for (const auto& column : table.columns) {
        if (column.name == kDepthColumn) continue;
        projected.addColumn(column.name, projectCurve(table, column, grid, gap_limit));
    }

    return projected;
}

} // namespace logmerge::core
