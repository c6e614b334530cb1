/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 */

#pragma once

#include "units.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace logmerge::model {

/// Каноническое имя колонки глубины после нормализации
constexpr const char* kDepthColumn = "DEPTH";

/// Стандартное NULL-значение LAS
constexpr double kLasNullValue = -999.25;

/**
 * @brief Значение-пропуск
 *
 * ВАЖНО: пропуск кодируется как quiet NaN во всех массивах значений.
 * Сентинелы вида -999.25 живут только в сырых данных до нормализации.
 */
[[nodiscard]] constexpr double missingValue() noexcept {
    return std::numeric_limits<double>::quiet_NaN();
}

[[nodiscard]] inline bool isMissing(double value) noexcept {
    return std::isnan(value);
}

using ValueList = std::vector<double>;

/**
 * @brief Класс кривой для выбора политики передискретизации
 */
enum class CurveKind {
    Continuous,   ///< Линейная интерполяция с ограничением разрыва
    Discrete      ///< Ближайший сосед, без интерполяции
};

[[nodiscard]] inline std::string_view toString(CurveKind kind) noexcept {
    switch (kind) {
        case CurveKind::Continuous: return "continuous";
        case CurveKind::Discrete: return "discrete";
    }
    return "continuous";
}

/**
 * @brief Количество непустых значений
 */
[[nodiscard]] inline size_t countPresent(const ValueList& values) noexcept {
    size_t count = 0;
    for (double v : values) {
        if (!isMissing(v)) ++count;
    }
    return count;
}

/**
 * @brief Доля непустых значений (0 для пустого массива)
 */
[[nodiscard]] inline double coverageFraction(const ValueList& values) noexcept {
    if (values.empty()) return 0.0;
    return static_cast<double>(countPresent(values)) / static_cast<double>(values.size());
}

} // namespace logmerge::model
