/**
 * @file curve_table.hpp
 * @brief Таблица кривых ГИС, индексированная по глубине
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace logmerge::model {

/**
 * @brief Именованная колонка значений
 */
struct CurveColumn {
    std::string name;     ///< Мнемоника кривой
    ValueList values;     ///< Значения (NaN - пропуск)
};

/**
 * @brief Таблица кривых
 *
 * Упорядоченный набор колонок одинаковой длины. В сырой таблице колонка
 * глубины может называться по-разному (DEPT, MD, ...). После нормализации
 * колонка глубины всегда первая и называется DEPTH, глубины строго
 * возрастают и не повторяются.
 */
struct CurveTable {
    std::vector<CurveColumn> columns;

    /**
     * @brief Количество строк (по первой колонке)
     */
    [[nodiscard]] size_t rowCount() const noexcept {
        return columns.empty() ? 0 : columns.front().values.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return rowCount() == 0;
    }

    /**
     * @brief Индекс колонки по точному имени
     */
    [[nodiscard]] std::optional<size_t> indexOf(const std::string& name) const noexcept {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i].name == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool hasColumn(const std::string& name) const noexcept {
        return indexOf(name).has_value();
    }

    [[nodiscard]] const CurveColumn* find(const std::string& name) const noexcept {
        auto idx = indexOf(name);
        return idx.has_value() ? &columns[*idx] : nullptr;
    }

    /**
     * @brief Глубины нормализованной таблицы (пустой массив, если колонки DEPTH нет)
     */
    [[nodiscard]] const ValueList& depths() const noexcept {
        static const ValueList kEmpty;
        const auto* depth = find(kDepthColumn);
        return depth != nullptr ? depth->values : kEmpty;
    }

    /**
     * @brief Имена кривых без колонки глубины
     */
    [[nodiscard]] std::vector<std::string> curveNames() const {
        std::vector<std::string> names;
        for (const auto& column : columns) {
            if (column.name != kDepthColumn) {
                names.push_back(column.name);
            }
        }
        return names;
    }

    /**
     * @brief Добавить колонку (без проверки длины)
     */
    CurveColumn& addColumn(std::string name, ValueList values = {}) {
        columns.push_back({std::move(name), std::move(values)});
        return columns.back();
    }
};

} // namespace logmerge::model
