/**
 * @file report_writer.cpp
 * @brief Запись отчёта о сведении
 */

#include "report_writer.hpp"
#include "file_utils.hpp"
#include <iomanip>
#include <sstream>

namespace logmerge::io {

namespace {

using namespace logmerge::model;
using json = nlohmann::json;

std::string formatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

json rankingToJson(const SourceRanking& ranking) {
    json arr = json::array();
    for (const auto& rank : ranking) {
        arr.push_back({
            {"source", rank.source_id},
            {"coverage", rank.coverage},
            {"qc_score", rank.qc_score}
        });
    }
    return arr;
}

} // namespace

json mergeReportToJson(const MergeReport& report) {
    json j;
    j["schema_version"] = kReportSchemaVersion;
    j["well_name"] = report.well_name;
    j["merge_performed"] = report.merge_performed;

    j["master_depth"] = {
        {"min", report.master_depth.min},
        {"max", report.master_depth.max},
        {"step", report.master_depth.step},
        {"points", report.master_depth.points}
    };

    j["files_processed"] = report.files_processed;
    j["warnings"] = report.warnings;

    j["rejected_sources"] = json::array();
    for (const auto& issue : report.rejected_sources) {
        j["rejected_sources"].push_back({
            {"source", issue.source_id},
            {"message", issue.message}
        });
    }

    // Объект по именам кривых + отдельный порядок, т.к. json::object сортирует ключи
    j["curves"] = json::object();
    j["curve_order"] = json::array();
    for (const auto& c : report.curves) {
        json entry;
        entry["source_file"] = c.source_file;
        entry["kind"] = std::string(toString(c.kind));
        entry["coverage"] = c.coverage;
        entry["qc_score"] = c.qc_score;
        entry["gaps_filled_from"] = c.gaps_filled_from.has_value() ? json(*c.gaps_filled_from) : json(nullptr);
        entry["gaps_count"] = c.gaps_count;
        entry["ranking"] = rankingToJson(c.ranking);
        j["curves"][c.curve] = entry;
        j["curve_order"].push_back(c.curve);
    }

    return j;
}

std::string mergeReportToMarkdown(const MergeReport& report) {
    std::ostringstream out;
    out << "# Отчёт о сведении LAS\n\n";
    out << "- Скважина: " << report.well_name << "\n";
    out << "- Обработано источников: " << report.files_processed.size() << "\n";
    for (const auto& id : report.files_processed) {
        out << "  - " << id << "\n";
    }

    if (!report.merge_performed) {
        out << "\n_Сведение не требовалось: передан один источник._\n";
    } else {
        out << "- Сетка: " << formatFixed(report.master_depth.min, 2) << " - "
            << formatFixed(report.master_depth.max, 2) << " ft, шаг "
            << formatFixed(report.master_depth.step, 2) << " ft, точек "
            << report.master_depth.points << "\n\n";

        out << "## Кривые\n";
        out << "| Кривая | Тип | Источник | Покрытие, % | QC | Заполнено из | Точек заполнено |\n";
        out << "|--------|-----|----------|-------------|----|--------------|-----------------|\n";
        for (const auto& c : report.curves) {
            out << "| " << c.curve
                << " | " << toString(c.kind)
                << " | " << c.source_file
                << " | " << formatFixed(c.coverage * 100.0, 1)
                << " | " << formatFixed(c.qc_score, 1)
                << " | " << c.gaps_filled_from.value_or("-")
                << " | " << c.gaps_count
                << " |\n";
        }
    }

    if (!report.warnings.empty()) {
        out << "\n## Предупреждения\n";
        for (const auto& w : report.warnings) {
            out << "- " << w << "\n";
        }
    }

    return out.str();
}

ReportWriteResult writeMergeReport(
    const MergeReport& report,
    const std::filesystem::path& output_dir
) {
    ReportWriteResult result;
    result.json_path = output_dir / "merge_report.json";
    result.markdown_path = output_dir / "merge_report.md";

    try {
        std::filesystem::create_directories(output_dir);
        atomicWrite(result.json_path, mergeReportToJson(report).dump(2));
        atomicWrite(result.markdown_path, mergeReportToMarkdown(report));
    } catch (const std::exception& e) {
        throw ReportWriteError("Ошибка сохранения отчёта: " + std::string(e.what()));
    }

    return result;
}

} // namespace logmerge::io
