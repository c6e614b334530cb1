/**
 * @file las_writer.hpp
 * @brief Экспорт сведённой таблицы в LAS 2.0
 */

#pragma once

#include "model/curve_table.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace logmerge::io {

using namespace logmerge::model;

/// Текстовое представление пропуска в секции данных
constexpr const char* kLasNullText = "-999.2500";

/**
 * @brief Опции экспорта в LAS
 */
struct LasExportOptions {
    std::string well_name = "MERGED";   ///< Название скважины (WELL)
    std::string company = "LOGMERGE";   ///< Компания (COMP)
    std::string date;                   ///< Дата (DATE), пусто - строка не пишется
    std::string depth_unit = "FT";      ///< Единица глубины (сведённая таблица всегда в футах)
    int depth_decimals = 2;             ///< Знаков после запятой для глубины
    int value_decimals = 4;             ///< Знаков после запятой для значений
};

/**
 * @brief Ошибка записи LAS
 */
class LasWriteError : public std::runtime_error {
public:
    explicit LasWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Сформировать текст LAS 2.0 для таблицы
 *
 * Секции ~VERSION, ~WELL, ~CURVE и ~A. Колонка глубины ищется по
 * псевдонимам (DEPTH, DEPT, ...), иначе берётся первая колонка.
 * Единица глубины берётся из опций, одна строка данных на глубину.
 *
 * @throws LasWriteError Таблица пуста
 */
[[nodiscard]] std::string formatMergedLas(
    const CurveTable& table,
    const LasExportOptions& options = {}
);

/**
 * @brief Атомарно записать таблицу в LAS-файл
 *
 * @throws LasWriteError При пустой таблице или ошибке записи
 */
void writeMergedLas(
    const CurveTable& table,
    const std::filesystem::path& path,
    const LasExportOptions& options = {}
);

} // namespace logmerge::io
