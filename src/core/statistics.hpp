/**
 * @file statistics.hpp
 * @brief Порядковые статистики по массивам с пропусками
 */

#pragma once

#include "model/types.hpp"
#include <optional>

namespace logmerge::core {

using namespace logmerge::model;

/**
 * @brief Медиана непустых значений
 * @return nullopt, если непустых значений нет
 */
[[nodiscard]] std::optional<double> median(const ValueList& values);

/**
 * @brief Перцентиль непустых значений с линейной интерполяцией между рангами
 *
 * @param values Значения (NaN пропускаются)
 * @param percent Перцентиль 0..100
 * @return nullopt, если непустых значений нет
 */
[[nodiscard]] std::optional<double> percentile(const ValueList& values, double percent);

/**
 * @brief Разности соседних значений: out[i] = values[i+1] - values[i]
 */
[[nodiscard]] ValueList consecutiveDifferences(const ValueList& values);

/**
 * @brief Только непустые значения, в исходном порядке
 */
[[nodiscard]] ValueList presentValues(const ValueList& values);

} // namespace logmerge::core
