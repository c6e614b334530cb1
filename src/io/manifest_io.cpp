/**
 * @file manifest_io.cpp
 * @brief Чтение манифеста сведения (JSON)
 */

#include "manifest_io.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>

namespace logmerge::io {

using json = nlohmann::json;
using namespace logmerge::model;

namespace {

ValueList valuesFromJson(const json& j, const std::string& column) {
    if (!j.is_array()) {
        throw ManifestError("Колонка " + column + ": ожидается массив значений");
    }
    ValueList values;
    values.reserve(j.size());
    for (const auto& v : j) {
        if (v.is_null()) {
            values.push_back(missingValue());
        } else if (v.is_number()) {
            values.push_back(v.get<double>());
        } else {
            throw ManifestError("Колонка " + column + ": нечисловое значение " + v.dump());
        }
    }
    return values;
}

CurveTable tableFromJson(const json& j) {
    CurveTable table;
    if (j.is_array()) {
        for (const auto& cj : j) {
            std::string name = cj.value("name", "");
            if (name.empty()) {
                throw ManifestError("Колонка без имени");
            }
            table.addColumn(name, valuesFromJson(cj.value("values", json::array()), name));
        }
    } else if (j.is_object()) {
        for (const auto& [name, values] : j.items()) {
            table.addColumn(name, valuesFromJson(values, name));
        }
    } else {
        throw ManifestError("Поле columns должно быть массивом или объектом");
    }
    return table;
}

SourceData sourceFromJson(const json& j) {
    SourceData source;
    source.metadata.well_name = j.value("well_name", std::string("Unknown"));
    source.metadata.depth_unit = j.value("depth_unit", std::string("FT"));
    if (j.contains("null_value") && j.at("null_value").is_number()) {
        source.metadata.null_value = j.at("null_value").get<double>();
    }
    source.table = tableFromJson(j.value("columns", json::array()));
    return source;
}

core::MergeOptions optionsFromJson(const json& j) {
    core::MergeOptions options;
    if (j.contains("step")) {
        options.step = Feet{j.at("step").get<double>()};
    }
    if (j.contains("gap_limit") && !j.at("gap_limit").is_null()) {
        options.gap_limit = Feet{j.at("gap_limit").get<double>()};
    }
    if (j.contains("null_values")) {
        options.extra_null_values = j.at("null_values").get<std::vector<double>>();
    }
    return options;
}

MergeManifest manifestFromJsonInternal(const json& j) {
    if (j.value("format", "") != kManifestFormatId) {
        throw ManifestError("Неверный формат манифеста");
    }

    MergeManifest manifest;
    try {
        if (j.contains("options")) {
            manifest.options = optionsFromJson(j.at("options"));
        }

        const auto& sources = j.value("sources", json::array());
        for (size_t i = 0; i < sources.size(); ++i) {
            const auto& sj = sources.at(i);
            manifest.sources.push_back(sourceFromJson(sj));
            manifest.source_ids.push_back(sj.value("id", core::sourceIdentifier({}, i)));
        }
    } catch (const json::exception& e) {
        throw ManifestError("Ошибка структуры манифеста: " + std::string(e.what()));
    }

    return manifest;
}

} // namespace

MergeManifest manifestFromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ManifestError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
    return manifestFromJsonInternal(j);
}

MergeManifest loadManifest(const std::filesystem::path& path) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const std::runtime_error& e) {
        throw ManifestError(e.what());
    }
    return manifestFromJson(text);
}

} // namespace logmerge::io
