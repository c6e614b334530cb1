/**
 * @file qc_score.hpp
 * @brief Сводная оценка качества кривой (0-100)
 *
 * Четыре независимые составляющие по непустым точкам:
 * покрытие (0-40), «полка» (0-20), выбросы (0-20), попадание в
 * физический диапазон (0-20).
 */

#pragma once

#include "model/types.hpp"
#include <optional>
#include <string_view>

namespace logmerge::core {

using namespace logmerge::model;

constexpr double kCoverageWeight = 40.0;
constexpr double kFlatlineWeight = 20.0;
constexpr double kSpikeWeight = 20.0;
constexpr double kRangeWeight = 20.0;

/// Минимальное число непустых точек для оценки выбросов (строго больше)
constexpr size_t kSpikeMinPoints = 10;

/// Перцентиль модулей разностей, от которого считается порог выброса
constexpr double kSpikePercentile = 99.0;

/// Множитель перцентиля для порога выброса
constexpr double kSpikeFactor = 3.0;

/// Относительный допуск «нулевой» разности (доля размаха)
constexpr double kFlatlineRelativeTolerance = 0.0001;

/// Абсолютный минимум допуска «нулевой» разности
constexpr double kFlatlineMinTolerance = 1e-6;

/**
 * @brief Ожидаемый физический диапазон типа кривой
 */
struct CurveRange {
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] constexpr bool contains(double v) const noexcept {
        return v >= min && v <= max;
    }
};

/**
 * @brief Диапазон для известного типа кривой (GR, RHOB, NPHI, DT, RT, CALI, SP, PEF)
 *
 * Регистр не учитывается.
 */
[[nodiscard]] std::optional<CurveRange> expectedRange(std::string_view curve_type);

/**
 * @brief Составляющие оценки качества
 */
struct CurveQualityScore {
    double coverage = 0.0;     ///< 0..40
    double flatline = 0.0;     ///< 0..20
    double spike = 0.0;        ///< 0..20
    double range = 0.0;        ///< 0..20
    size_t valid_points = 0;
    size_t total_points = 0;

    /**
     * @brief Итог, ограниченный [0, 100]; 0 при отсутствии непустых точек
     */
    [[nodiscard]] double total() const noexcept;
};

/**
 * @brief Оценка качества спроецированной кривой
 *
 * @param values Значения на сетке (NaN - пропуск)
 * @param curve_type Тип кривой для проверки диапазона (нет - проверка пропускается)
 */
[[nodiscard]] CurveQualityScore scoreCurveQuality(
    const ValueList& values,
    std::optional<std::string_view> curve_type = std::nullopt
);

/**
 * @brief Итоговая оценка качества
 */
[[nodiscard]] double curveQcScore(
    const ValueList& values,
    std::optional<std::string_view> curve_type = std::nullopt
);

} // namespace logmerge::core
