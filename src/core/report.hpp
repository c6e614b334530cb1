/**
 * @file report.hpp
 * @brief Сборка отчёта о сведении
 */

#pragma once

#include "depth_grid.hpp"
#include "model/curve_table.hpp"
#include "model/merge_report.hpp"
#include "model/source.hpp"
#include <string>
#include <vector>

namespace logmerge::core {

using namespace logmerge::model;

/// Предупреждение для вырожденного случая одного источника
constexpr const char* kSingleSourceWarning = "Single file provided, no merge needed";

/**
 * @brief Исходные данные для отчёта
 */
struct ReportInputs {
    const MasterDepthGrid* grid = nullptr;        ///< Мастер-сетка
    const CurveTable* merged = nullptr;           ///< Сведённая таблица
    std::vector<CurveProvenance> curves;          ///< Происхождение кривых от арбитра
    std::vector<std::string> files_processed;
    std::vector<std::string> warnings;
    std::vector<SourceIssue> rejected_sources;
    std::string well_name;
};

/**
 * @brief Отчёт о полноценном сведении
 *
 * Покрытие каждой кривой пересчитывается по сведённой таблице
 * (после заполнения пропусков); оценка качества остаётся оценкой
 * основного источника до заполнения.
 *
 * TODO: согласовать с потребителями отчёта, нужна ли оценка качества
 * после заполнения (сейчас покрытие и качество считаются по разным данным).
 */
[[nodiscard]] MergeReport buildMergeReport(ReportInputs inputs);

/**
 * @brief Отчёт для единственного источника (сведение не выполнялось)
 */
[[nodiscard]] MergeReport buildSingleSourceReport(
    const std::string& source_id,
    const std::string& well_name,
    Feet step
);

/**
 * @brief Различные имена скважин в порядке первого появления
 */
[[nodiscard]] std::vector<std::string> distinctWellNames(const std::vector<SourceData>& sources);

} // namespace logmerge::core
