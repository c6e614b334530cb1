/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace logmerge::io {

/**
 * @brief Атомарная запись текста в файл (временный файл + rename)
 *
 * Каталог назначения создаётся при необходимости.
 * @throws std::runtime_error При ошибке записи или переименования
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Чтение файла целиком
 * @throws std::runtime_error Если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

} // namespace logmerge::io
