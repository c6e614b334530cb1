/**
 * @file depth_grid.hpp
 * @brief Построение мастер-сетки глубин
 */

#pragma once

#include "model/curve_table.hpp"
#include "model/merge_report.hpp"
#include <optional>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/// Шаг сетки по умолчанию
constexpr Feet kDefaultGridStep{0.5};

/// Нижняя граница автоматического предела разрыва
constexpr Feet kMinimumGapLimit{5.0};

/// Множитель медианного шага дискретизации для автоматического предела разрыва
constexpr double kGapLimitStepMultiplier = 10.0;

/**
 * @brief Мастер-сетка глубин
 *
 * Равномерная, строго возрастающая. Неизменяемая после построения.
 */
struct MasterDepthGrid {
    ValueList depths;
    Feet step{0.0};

    [[nodiscard]] size_t size() const noexcept { return depths.size(); }
    [[nodiscard]] bool empty() const noexcept { return depths.empty(); }
    [[nodiscard]] double min() const noexcept { return depths.empty() ? 0.0 : depths.front(); }
    [[nodiscard]] double max() const noexcept { return depths.empty() ? 0.0 : depths.back(); }

    [[nodiscard]] GridDescription describe() const noexcept {
        return {min(), max(), step.value, depths.size()};
    }
};

/**
 * @brief Построение сетки по объединению диапазонов всех таблиц
 *
 * Минимум округляется вниз, максимум - вверх до кратного шагу.
 * Таблицы без строк не участвуют.
 *
 * @param tables Нормализованные таблицы
 * @param step Шаг сетки (> 0)
 * @return Мастер-сетка
 * @throws MergeError InvalidOptions при некорректном шаге, NoDepthData если глубин нет
 */
[[nodiscard]] MasterDepthGrid buildMasterGrid(
    const std::vector<CurveTable>& tables,
    Feet step = kDefaultGridStep
);

/**
 * @brief Медианный шаг глубины одной таблицы
 * @return nullopt для таблиц короче двух строк
 */
[[nodiscard]] std::optional<double> medianDepthStep(const CurveTable& table);

/**
 * @brief Автоматический предел разрыва
 *
 * max(5, 10 × медиана медианных шагов по всем таблицам),
 * 5 - если ни у одной таблицы шаг не определяется.
 */
[[nodiscard]] Feet defaultGapLimit(const std::vector<CurveTable>& tables);

} // namespace logmerge::core
