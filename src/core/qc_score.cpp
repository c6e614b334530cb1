/**
 * @file qc_score.cpp
 * @brief Сводная оценка качества кривой
 */

#include "qc_score.hpp"
#include "statistics.hpp"
#include "model/text_utils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace logmerge::core {

namespace {

double flatlineScore(const ValueList& valid) {
    auto diffs = consecutiveDifferences(valid);
    if (diffs.empty()) {
        return kFlatlineWeight;
    }

    auto [lo, hi] = std::minmax_element(valid.begin(), valid.end());
    double tolerance = std::max(kFlatlineMinTolerance, (*hi - *lo) * kFlatlineRelativeTolerance);

    size_t flat = 0;
    for (double d : diffs) {
        if (std::abs(d) <= tolerance) ++flat;
    }
    double ratio = static_cast<double>(flat) / static_cast<double>(diffs.size());
    return (1.0 - ratio) * kFlatlineWeight;
}

double spikeScore(const ValueList& valid) {
    if (valid.size() <= kSpikeMinPoints) {
        return kSpikeWeight;
    }

    auto diffs = consecutiveDifferences(valid);
    for (double& d : diffs) {
        d = std::abs(d);
    }

    auto p99 = percentile(diffs, kSpikePercentile);
    if (!p99.has_value()) {
        return kSpikeWeight;
    }

    double threshold = *p99 * kSpikeFactor;
    size_t spikes = 0;
    for (double d : diffs) {
        if (d > threshold) ++spikes;
    }
    double ratio = static_cast<double>(spikes) / static_cast<double>(diffs.size());
    return (1.0 - ratio) * kSpikeWeight;
}

double rangeScore(const ValueList& valid, std::optional<std::string_view> curve_type) {
    if (!curve_type.has_value()) {
        return kRangeWeight;
    }
    auto range = expectedRange(*curve_type);
    if (!range.has_value()) {
        return kRangeWeight;
    }

    size_t inside = 0;
    for (double v : valid) {
        if (range->contains(v)) ++inside;
    }
    return static_cast<double>(inside) / static_cast<double>(valid.size()) * kRangeWeight;
}

} // namespace

std::optional<CurveRange> expectedRange(std::string_view curve_type) {
    static const std::array<std::pair<std::string_view, CurveRange>, 8> kRanges = {{
        {"GR",   {0.0, 300.0}},
        {"RHOB", {1.0, 3.0}},
        {"NPHI", {-0.15, 0.60}},
        {"DT",   {40.0, 250.0}},
        {"RT",   {0.1, 10000.0}},
        {"CALI", {4.0, 20.0}},
        {"SP",   {-200.0, 200.0}},
        {"PEF",  {0.0, 10.0}},
    }};

    auto key = utf8ToUpper(curve_type);
    for (const auto& [name, range] : kRanges) {
        if (key == name) {
            return range;
        }
    }
    return std::nullopt;
}

double CurveQualityScore::total() const noexcept {
    if (valid_points == 0) {
        return 0.0;
    }
    return std::clamp(coverage + flatline + spike + range, 0.0, 100.0);
}

CurveQualityScore scoreCurveQuality(
    const ValueList& values,
    std::optional<std::string_view> curve_type
) {
    CurveQualityScore score;
    score.total_points = values.size();

    ValueList valid = presentValues(values);
    score.valid_points = valid.size();
    if (valid.empty()) {
        return score;
    }

    score.coverage = static_cast<double>(valid.size()) / static_cast<double>(values.size()) * kCoverageWeight;
    score.flatline = flatlineScore(valid);
    score.spike = spikeScore(valid);
    score.range = rangeScore(valid, curve_type);
    return score;
}

double curveQcScore(
    const ValueList& values,
    std::optional<std::string_view> curve_type
) {
    return scoreCurveQuality(values, curve_type).total();
}

} // namespace logmerge::core
