/**
 * @file projection.hpp
 * @brief Передискретизация кривых на мастер-сетку
 *
 * Две политики:
 * - непрерывные кривые: кусочно-линейная интерполяция, если охватывающий
 *   интервал не шире предела разрыва (за краями данных - краевое значение
 *   в пределах того же предела);
 * - дискретные кривые (литология, флаги, коды): ближайший сосед не дальше
 *   max(1.0, 2 × шаг), значения никогда не интерполируются.
 */

#pragma once

#include "depth_grid.hpp"
#include "model/curve_table.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/// Минимальная дистанция поиска ближайшего соседа для дискретных кривых
constexpr double kDiscreteMinDistance = 1.0;

/**
 * @brief Токены имён дискретных кривых: LITH, FACIES, FLAG, ZONE, CODE, TYPE, CLASS
 */
[[nodiscard]] const std::vector<std::string>& discreteCurveTokens();

/**
 * @brief Классификация кривой по имени
 *
 * Дискретная, если имя содержит любой токен без учёта регистра.
 * Значения кривой не учитываются.
 */
[[nodiscard]] CurveKind classifyCurve(std::string_view name);

[[nodiscard]] inline bool isDiscreteCurve(std::string_view name) {
    return classifyCurve(name) == CurveKind::Discrete;
}

/**
 * @brief Максимальная дистанция ближайшего соседа для шага сетки
 */
[[nodiscard]] constexpr double discreteMaxDistance(Feet step) noexcept {
    return step.value * 2.0 > kDiscreteMinDistance ? step.value * 2.0 : kDiscreteMinDistance;
}

/**
 * @brief Линейная интерполяция с ограничением разрыва
 *
 * @param grid Глубины сетки
 * @param depths Глубины отсчётов (строго возрастают, без пропусков)
 * @param values Значения отсчётов (без пропусков)
 * @param gap_limit Предел разрыва
 * @return Массив длины grid.size()
 */
[[nodiscard]] ValueList projectContinuous(
    const ValueList& grid,
    const ValueList& depths,
    const ValueList& values,
    Feet gap_limit
);

/**
 * @brief Ближайший сосед с ограничением дистанции
 *
 * При равной удалённости берётся меньшая глубина.
 */
[[nodiscard]] ValueList projectDiscrete(
    const ValueList& grid,
    const ValueList& depths,
    const ValueList& values,
    double max_distance
);

/**
 * @brief Проекция одной кривой нормализованной таблицы
 *
 * Отсчёты с пропуском значения не участвуют.
 */
[[nodiscard]] ValueList projectCurve(
    const CurveTable& table,
    const CurveColumn& curve,
    const MasterDepthGrid& grid,
    Feet gap_limit
);

/**
 * @brief Проекция всей нормализованной таблицы на сетку
 *
 * @return Таблица: DEPTH = сетка, далее кривые в исходном порядке
 */
[[nodiscard]] CurveTable projectTable(
    const CurveTable& table,
    const MasterDepthGrid& grid,
    Feet gap_limit
);

} // namespace logmerge::core
