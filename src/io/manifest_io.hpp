/**
 * @file manifest_io.hpp
 * @brief Чтение манифеста сведения (JSON)
 *
 * Манифест - сериализованные в JSON уже разобранные таблицы кривых
 * и их метаданные плюс опции сведения:
 *
 * {
 *   "format": "logmerge-manifest",
 *   "options": {"step": 0.5, "gap_limit": 5.0, "null_values": [-1.0]},
 *   "sources": [
 *     {"id": "run1.las", "well_name": "W-1", "depth_unit": "FT", "null_value": -999.25,
 *      "columns": [{"name": "DEPT", "values": [1000.0, 1000.5]},
 *                  {"name": "GR", "values": [55.1, null]}]}
 *   ]
 * }
 *
 * "columns" допускается и объектом {"DEPT": [...], ...}, но тогда порядок
 * колонок алфавитный. null в значениях - пропуск.
 */

#pragma once

#include "core/merge.hpp"
#include "model/source.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace logmerge::io {

/// Идентификатор формата манифеста
constexpr const char* kManifestFormatId = "logmerge-manifest";

/**
 * @brief Ошибка чтения манифеста
 */
class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Содержимое манифеста
 */
struct MergeManifest {
    std::vector<model::SourceData> sources;
    std::vector<std::string> source_ids;   ///< Параллельно sources
    core::MergeOptions options;
};

/**
 * @brief Загрузка манифеста из файла
 * @throws ManifestError При ошибке чтения, парсинга или структуры
 */
[[nodiscard]] MergeManifest loadManifest(const std::filesystem::path& path);

/**
 * @brief Разбор манифеста из JSON-строки
 * @throws ManifestError При ошибке парсинга или структуры
 */
[[nodiscard]] MergeManifest manifestFromJson(const std::string& text);

} // namespace logmerge::io
