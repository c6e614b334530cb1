/**
 * @file normalizer.hpp
 * @brief Нормализация таблицы кривых одного источника
 *
 * Поиск колонки глубины, замена NULL-сентинелов на пропуски,
 * перевод глубины в футы, сортировка и схлопывание дублей глубины.
 */

#pragma once

#include "model/curve_table.hpp"
#include "model/source.hpp"
#include <optional>
#include <string>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/// Допуск совпадения значения с NULL-сентинелом
constexpr double kNullTolerance = 0.01;

/**
 * @brief Опции нормализации
 */
struct NormalizeOptions {
    std::vector<double> null_values;          ///< Сентинелы пропуска
    DepthUnit depth_unit = DepthUnit::Feet;   ///< Заявленная единица глубины
};

/**
 * @brief Допустимые имена колонки глубины в порядке приоритета
 *
 * Сравнение точное (с учётом регистра): DEPT, DEPTH, MD, TVD, TDEP.
 */
[[nodiscard]] const std::vector<std::string>& depthColumnAliases();

/**
 * @brief Распространённые NULL-значения, не всегда объявленные в заголовке
 */
[[nodiscard]] const std::vector<double>& commonNullValues();

/**
 * @brief Итоговый набор сентинелов источника
 *
 * Заявленное значение, затем распространённые, затем дополнительные.
 */
[[nodiscard]] std::vector<double> effectiveNullValues(
    const SourceMetadata& metadata,
    const std::vector<double>& extra = {}
);

/**
 * @brief Индекс колонки глубины по списку псевдонимов
 */
[[nodiscard]] std::optional<size_t> findDepthColumn(const CurveTable& table) noexcept;

/**
 * @brief Проверка совпадения значения с одним из сентинелов
 */
[[nodiscard]] bool isNullSentinel(double value, const std::vector<double>& null_values) noexcept;

/**
 * @brief Нормализация сырой таблицы
 *
 * Результат: колонка DEPTH первой, глубины в футах, строго возрастают.
 * Строки с пустой глубиной отбрасываются. Дубли глубины схлопываются
 * медианой по каждой колонке (пропуски в медиане не участвуют).
 *
 * @param raw Сырая таблица
 * @param options Сентинелы и единица глубины
 * @return Нормализованная таблица
 * @throws NormalizationError Нет колонки глубины или колонки разной длины
 */
[[nodiscard]] CurveTable normalizeCurveTable(
    const CurveTable& raw,
    const NormalizeOptions& options
);

} // namespace logmerge::core
