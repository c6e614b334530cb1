/**
 * @file report_writer.hpp
 * @brief Запись отчёта о сведении в JSON и Markdown
 */

#pragma once

#include "model/merge_report.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace logmerge::io {

/// Версия схемы JSON-отчёта
constexpr const char* kReportSchemaVersion = "1.0.0";

/**
 * @brief Ошибка записи отчёта
 */
class ReportWriteError : public std::runtime_error {
public:
    explicit ReportWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

struct ReportWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

/**
 * @brief Отчёт в виде JSON-документа
 */
[[nodiscard]] nlohmann::json mergeReportToJson(const model::MergeReport& report);

/**
 * @brief Человекочитаемая сводка отчёта (Markdown)
 */
[[nodiscard]] std::string mergeReportToMarkdown(const model::MergeReport& report);

/**
 * @brief Записать merge_report.json и merge_report.md в каталог
 *
 * @throws ReportWriteError Каталог или файл не удалось создать
 */
ReportWriteResult writeMergeReport(
    const model::MergeReport& report,
    const std::filesystem::path& output_dir
);

} // namespace logmerge::io
