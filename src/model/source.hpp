/**
 * @file source.hpp
 * @brief Источник данных для сведения (один прогон каротажа)
 */

#pragma once

#include "curve_table.hpp"
#include <optional>
#include <string>

namespace logmerge::model {

/**
 * @brief Метаданные источника
 *
 * Единственный контракт с внешним парсером: любой загрузчик обязан
 * заполнить эти три поля.
 */
struct SourceMetadata {
    std::string well_name = "Unknown";    ///< Название скважины
    std::string depth_unit = "FT";        ///< Заявленная единица глубины (как в заголовке)
    std::optional<double> null_value;     ///< Заявленное NULL-значение (нет - -999.25)

    [[nodiscard]] double effectiveNullValue() const noexcept {
        return null_value.value_or(kLasNullValue);
    }
};

/**
 * @brief Разобранный источник: таблица кривых + метаданные
 */
struct SourceData {
    CurveTable table;
    SourceMetadata metadata;
};

} // namespace logmerge::model
