/**
 * @file las_writer.cpp
 * @brief Экспорт сведённой таблицы в LAS 2.0
 */

#include "las_writer.hpp"
#include "file_utils.hpp"
#include "core/normalizer.hpp"
#include "core/statistics.hpp"
#include <iomanip>
#include <sstream>

namespace logmerge::io {

namespace {

std::string formatValue(double value, int precision) {
    if (isMissing(value)) {
        return kLasNullText;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string formatLasLine(
    std::string_view mnemonic,
    std::string_view unit,
    std::string_view value,
    std::string_view description
) {
    std::ostringstream ss;
    ss << ' ' << std::left << std::setw(5) << mnemonic << "."
       << std::setw(5) << unit
       << std::setw(18) << value << ": "
       << description;
    return ss.str();
}

size_t depthColumnIndex(const CurveTable& table) {
    if (auto idx = table.indexOf(kDepthColumn)) {
        return *idx;
    }
    return core::findDepthColumn(table).value_or(0);
}

} // namespace

std::string formatMergedLas(
    const CurveTable& table,
    const LasExportOptions& options
) {
    if (table.columns.empty() || table.empty()) {
        throw LasWriteError("Нет данных для экспорта");
    }

    const size_t depth_idx = depthColumnIndex(table);
    const auto& depths = table.columns[depth_idx].values;
    const double step = core::median(core::consecutiveDifferences(depths)).value_or(0.0);

    std::ostringstream out;

    // === VERSION INFORMATION ===
    out << "~VERSION INFORMATION\n";
    out << formatLasLine("VERS", "", "2.0", "CWLS LAS - VERSION 2.0") << "\n";
    out << formatLasLine("WRAP", "", "NO", "One line per depth step") << "\n";
    out << "\n";

    // === WELL INFORMATION ===
    out << "~WELL INFORMATION\n";
    out << formatLasLine("WELL", "", options.well_name, "WELL NAME") << "\n";
    out << formatLasLine("STRT", options.depth_unit, formatValue(depths.front(), options.depth_decimals), "START DEPTH") << "\n";
    out << formatLasLine("STOP", options.depth_unit, formatValue(depths.back(), options.depth_decimals), "STOP DEPTH") << "\n";
    out << formatLasLine("STEP", options.depth_unit, formatValue(step, 4), "STEP") << "\n";
    out << formatLasLine("NULL", "", kLasNullText, "NULL VALUE") << "\n";
    if (!options.company.empty()) {
        out << formatLasLine("COMP", "", options.company, "COMPANY") << "\n";
    }
    if (!options.date.empty()) {
        out << formatLasLine("DATE", "", options.date, "LOG DATE") << "\n";
    }
    out << "\n";

    // === CURVE INFORMATION ===
    out << "~CURVE INFORMATION\n";
    out << formatLasLine(kDepthColumn, options.depth_unit, "", kDepthColumn) << "\n";
    for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c == depth_idx) continue;
        const auto& name = table.columns[c].name;
        out << formatLasLine(name, "", "", name) << "\n";
    }
    out << "\n";

    // === ASCII LOG DATA ===
    out << "~A " << kDepthColumn;
    for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c == depth_idx) continue;
        out << " " << table.columns[c].name;
    }
    out << "\n";

    for (size_t r = 0; r < depths.size(); ++r) {
        out << formatValue(depths[r], options.depth_decimals);
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c == depth_idx) continue;
            const auto& values = table.columns[c].values;
            double v = r < values.size() ? values[r] : missingValue();
            out << " " << formatValue(v, options.value_decimals);
        }
        out << "\n";
    }

    return out.str();
}

void writeMergedLas(
    const CurveTable& table,
    const std::filesystem::path& path,
    const LasExportOptions& options
) {
    auto content = formatMergedLas(table, options);
    try {
        atomicWrite(path, content);
    } catch (const std::exception& e) {
        throw LasWriteError("Ошибка сохранения файла: " + std::string(e.what()));
    }
}

} // namespace logmerge::io
