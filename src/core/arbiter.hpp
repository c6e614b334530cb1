/**
 * @file arbiter.hpp
 * @brief Ранжирование источников и сведение кривых с заполнением пропусков
 */

#pragma once

#include "depth_grid.hpp"
#include "qc_score.hpp"
#include "model/curve_table.hpp"
#include "model/merge_report.hpp"
#include <string>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/**
 * @brief Источник, спроецированный на мастер-сетку
 */
struct ProjectedSource {
    std::string source_id;
    CurveTable table;                        ///< DEPTH = сетка, далее кривые
    std::vector<CurveQualityScore> quality;  ///< Параллельно table.columns (для DEPTH - пустая оценка)

    /**
     * @brief Итоговая оценка качества кривой (nullopt, если кривой нет)
     */
    [[nodiscard]] std::optional<double> qcScore(const std::string& curve) const noexcept {
        auto idx = table.indexOf(curve);
        if (!idx.has_value() || *idx >= quality.size()) {
            return std::nullopt;
        }
        return quality[*idx].total();
    }
};

/**
 * @brief Проекция таблицы с расчётом оценок качества всех кривых
 *
 * Тип кривой для проверки диапазона берётся из её имени.
 */
[[nodiscard]] ProjectedSource makeProjectedSource(
    std::string source_id,
    CurveTable projected
);

/**
 * @brief Ранжирование источников по кривой
 *
 * Покрытие по убыванию, затем оценка качества по убыванию; при равенстве
 * сохраняется входной порядок. Источники без кривой не участвуют.
 */
[[nodiscard]] SourceRanking rankSources(
    const std::string& curve,
    const std::vector<ProjectedSource>& sources
);

/**
 * @brief Заполнение пропусков из вторичного источника
 *
 * Существующие значения никогда не перезаписываются.
 *
 * @return Количество заполненных точек
 */
size_t fillGaps(ValueList& target, const ValueList& secondary);

/**
 * @brief Результат сведения всех кривых
 */
struct ArbitrationResult {
    CurveTable merged;                     ///< DEPTH = сетка, кривые в порядке первого появления
    std::vector<CurveProvenance> curves;   ///< Параллельно кривым merged
};

/**
 * @brief Имена кривых всех источников в порядке первого появления
 */
[[nodiscard]] std::vector<std::string> collectCurveNames(
    const std::vector<ProjectedSource>& sources
);

/**
 * @brief Сведение одной кривой
 *
 * Основной источник копируется целиком, затем пропуски заполняются
 * из остальных в порядке ранжирования, пока они есть.
 */
[[nodiscard]] CurveProvenance arbitrateCurve(
    const std::string& curve,
    const std::vector<ProjectedSource>& sources,
    ValueList& merged_values
);

/**
 * @brief Сведение всех кривых всех источников
 */
[[nodiscard]] ArbitrationResult arbitrateCurves(
    const MasterDepthGrid& grid,
    const std::vector<ProjectedSource>& sources
);

} // namespace logmerge::core
