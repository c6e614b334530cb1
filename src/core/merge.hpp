/**
 * @file merge.hpp
 * @brief Сведение кривых нескольких прогонов одной скважины
 *
 * Координирует нормализацию, построение мастер-сетки, проекцию,
 * оценку качества, выбор источников и сборку отчёта.
 * Чистая функция: не хранит состояния, не выполняет ввода-вывода.
 */

#pragma once

#include "depth_grid.hpp"
#include "model/curve_table.hpp"
#include "model/merge_report.hpp"
#include "model/source.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/**
 * @brief Опции сведения
 */
struct MergeOptions {
    Feet step = kDefaultGridStep;          ///< Шаг мастер-сетки
    std::optional<Feet> gap_limit;         ///< Предел разрыва (нет - автоматически)
    std::vector<double> extra_null_values; ///< Дополнительные NULL-сентинелы
};

/**
 * @brief Callback для индикации прогресса
 *
 * @param progress Прогресс от 0.0 до 1.0
 * @param message Описание текущей операции
 */
using ProgressCallback = std::function<void(double progress, std::string_view message)>;

/**
 * @brief Результат сведения
 */
struct MergeResult {
    CurveTable table;      ///< Сведённая таблица (или исходная для одного источника)
    MergeReport report;
    std::optional<Feet> effective_gap_limit;   ///< Фактически применённый предел разрыва
};

/**
 * @brief Проверка принадлежности источников одной скважине
 */
struct WellIdentityCheck {
    bool same_well = true;
    std::vector<std::string> well_names;   ///< По одному на источник, во входном порядке
};

[[nodiscard]] WellIdentityCheck validateSameWell(const std::vector<SourceData>& sources);

/**
 * @brief Идентификатор источника: переданный или File_<n>
 */
[[nodiscard]] std::string sourceIdentifier(
    const std::vector<std::string>& source_ids,
    size_t index
);

/**
 * @brief Сведение источников
 *
 * Один источник возвращается без изменений (сведение не требуется).
 * Источник, не прошедший нормализацию, отбрасывается с предупреждением.
 * Разные имена скважин дают предупреждение, но не прерывают сведение.
 *
 * @param sources Разобранные источники
 * @param source_ids Идентификаторы (могут быть короче списка источников)
 * @param options Опции сведения
 * @param on_progress Callback прогресса (опционально)
 * @return Сведённая таблица и отчёт
 * @throws MergeError Нет источников, ни один не нормализован, нет глубин,
 *         некорректные опции
 */
[[nodiscard]] MergeResult mergeSources(
    const std::vector<SourceData>& sources,
    const std::vector<std::string>& source_ids = {},
    const MergeOptions& options = {},
    ProgressCallback on_progress = nullptr
);

} // namespace logmerge::core
