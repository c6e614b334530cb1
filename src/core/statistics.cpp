/**
 * @file statistics.cpp
 * @brief Порядковые статистики по массивам с пропусками
 */

#include "statistics.hpp"
#include <algorithm>
#include <cmath>

namespace logmerge::core {

ValueList presentValues(const ValueList& values) {
    ValueList out;
    out.reserve(values.size());
    for (double v : values) {
        if (!isMissing(v)) {
            out.push_back(v);
        }
    }
    return out;
}

ValueList consecutiveDifferences(const ValueList& values) {
    ValueList diffs;
    if (values.size() < 2) {
        return diffs;
    }
    diffs.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        diffs.push_back(values[i] - values[i - 1]);
    }
    return diffs;
}

std::optional<double> median(const ValueList& values) {
    return percentile(values, 50.0);
}

std::optional<double> percentile(const ValueList& values, double percent) {
    ValueList sorted = presentValues(values);
    if (sorted.empty()) {
        return std::nullopt;
    }
    std::sort(sorted.begin(), sorted.end());

    double p = std::clamp(percent, 0.0, 100.0);
    double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
    auto lower = static_cast<size_t>(std::floor(rank));
    auto upper = static_cast<size_t>(std::ceil(rank));
    if (lower == upper) {
        return sorted[lower];
    }

    double frac = rank - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

} // namespace logmerge::core
