/**
 * @file main.cpp
 * @brief Точка входа утилиты сведения LAS
 */

#include "core/errors.hpp"
#include "core/merge.hpp"
#include "io/las_writer.hpp"
#include "io/manifest_io.hpp"
#include "io/report_writer.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

using namespace logmerge::model;

void printUsage(std::ostream& os) {
    os << "Использование:\n"
       << "  logmerge --merge <manifest.json> [--out <каталог>] [--step <ft>]\n"
       << "           [--gap-limit <ft>] [--no-las]\n";
}

std::string currentDate() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

double parseNonNegative(std::string_view flag, const char* text) {
    double value = std::stod(text);
    if (!(value >= 0.0)) {
        throw std::invalid_argument(std::string(flag) + ": ожидается неотрицательное число");
    }
    return value;
}

int runMerge(int argc, char* argv[]) {
    std::filesystem::path manifest_path = argv[2];
    std::filesystem::path out_dir;
    std::optional<double> step_override;
    std::optional<double> gap_override;
    bool write_las = true;

    for (int i = 3; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--out" && i + 1 < argc) {
            out_dir = std::filesystem::path(argv[++i]);
        } else if (arg == "--step" && i + 1 < argc) {
            step_override = parseNonNegative(arg, argv[++i]);
        } else if (arg == "--gap-limit" && i + 1 < argc) {
            gap_override = parseNonNegative(arg, argv[++i]);
        } else if (arg == "--no-las") {
            write_las = false;
        } else {
            std::cerr << "Неизвестный аргумент: " << arg << std::endl;
            printUsage(std::cerr);
            return 1;
        }
    }

    if (out_dir.empty()) {
        out_dir = std::filesystem::temp_directory_path() / "logmerge";
    }

    auto manifest = logmerge::io::loadManifest(manifest_path);
    if (step_override) {
        manifest.options.step = Feet{*step_override};
    }
    if (gap_override) {
        manifest.options.gap_limit = Feet{*gap_override};
    }

    auto result = logmerge::core::mergeSources(
        manifest.sources,
        manifest.source_ids,
        manifest.options,
        [](double progress, std::string_view message) {
            std::cout << "[" << std::setw(3) << static_cast<int>(progress * 100.0) << "%] "
                      << message << std::endl;
        });

    const auto& report = result.report;
    std::cout << "Скважина: " << report.well_name
              << ", источников: " << report.files_processed.size()
              << ", кривых: " << report.curves.size()
              << ", точек сетки: " << report.master_depth.points << std::endl;
    for (const auto& warning : report.warnings) {
        std::cerr << "Предупреждение: " << warning << std::endl;
    }

    auto written = logmerge::io::writeMergeReport(report, out_dir);
    std::cout << "Отчёт сохранён: " << written.json_path.string() << std::endl;

    if (write_las) {
        logmerge::io::LasExportOptions las_options;
        las_options.well_name = report.well_name;
        las_options.date = currentDate();
        if (!report.merge_performed && !manifest.sources.empty()) {
            // Единственный источник выгружается без пересчёта глубин
            las_options.depth_unit = std::string(
                toString(parseDepthUnit(manifest.sources.front().metadata.depth_unit)));
        }
        auto las_path = out_dir / "merged.las";
        logmerge::io::writeMergedLas(result.table, las_path, las_options);
        std::cout << "LAS сохранён: " << las_path.string() << std::endl;
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc >= 2 && (std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h")) {
            printUsage(std::cout);
            return 0;
        }

        if (argc >= 3 && std::string_view(argv[1]) == "--merge") {
            return runMerge(argc, argv);
        }

        printUsage(std::cerr);
        return 1;
    } catch (const logmerge::core::MergeError& e) {
        std::cerr << "Ошибка сведения (" << logmerge::core::toString(e.kind()) << "): "
                  << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
