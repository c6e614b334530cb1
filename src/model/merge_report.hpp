/**
 * @file merge_report.hpp
 * @brief Отчёт о сведении: происхождение кривых и параметры сетки
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace logmerge::model {

/**
 * @brief Кандидат-источник для одной кривой
 */
struct SourceRank {
    std::string source_id;     ///< Идентификатор источника
    double coverage = 0.0;     ///< Покрытие сетки (0..1)
    double qc_score = 0.0;     ///< Оценка качества (0..100)
    size_t input_index = 0;    ///< Позиция источника во входном списке
};

/// Ранжированный список кандидатов (покрытие ↓, качество ↓, порядок входа)
using SourceRanking = std::vector<SourceRank>;

/**
 * @brief Происхождение сведённой кривой
 */
struct CurveProvenance {
    std::string curve;                            ///< Мнемоника
    CurveKind kind = CurveKind::Continuous;       ///< Политика передискретизации
    std::string source_file;                      ///< Основной источник
    double coverage = 0.0;                        ///< Покрытие после заполнения пропусков
    double qc_score = 0.0;                        ///< Качество основного источника (до заполнения)
    std::optional<std::string> gaps_filled_from;  ///< Первый вторичный источник, давший заполнение
    size_t gaps_count = 0;                        ///< Сколько точек заполнено из вторичных
    SourceRanking ranking;                        ///< Ранжирование, по которому сделан выбор
};

/**
 * @brief Описание мастер-сетки глубин
 */
struct GridDescription {
    double min = 0.0;
    double max = 0.0;
    double step = 0.0;
    size_t points = 0;
};

/**
 * @brief Источник, отброшенный при нормализации
 */
struct SourceIssue {
    std::string source_id;
    std::string message;
};

/**
 * @brief Полный отчёт о сведении
 */
struct MergeReport {
    std::vector<CurveProvenance> curves;       ///< В порядке колонок сведённой таблицы
    GridDescription master_depth;
    std::vector<std::string> files_processed;  ///< Реально обработанные источники
    std::vector<std::string> warnings;         ///< Нефатальные предупреждения
    std::vector<SourceIssue> rejected_sources; ///< Источники, не прошедшие нормализацию
    std::string well_name = "Unknown";
    bool merge_performed = true;               ///< false для единственного источника

    [[nodiscard]] const CurveProvenance* findCurve(const std::string& name) const noexcept {
        for (const auto& c : curves) {
            if (c.curve == name) return &c;
        }
        return nullptr;
    }
};

} // namespace logmerge::model
