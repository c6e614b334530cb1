/**
 * @file text_utils.hpp
 * @brief Утилиты для сравнения мнемоник и единиц (ASCII + кириллица)
 */

#pragma once

#include <string>
#include <string_view>

namespace logmerge::model {

/**
 * @brief Перевод строки в верхний регистр (ASCII + базовая кириллица)
 */
[[nodiscard]] std::string utf8ToUpper(std::string_view input);

/**
 * @brief Обрезка пробельных символов по краям
 */
[[nodiscard]] std::string trim(std::string_view input);

/**
 * @brief Поиск подстроки без учёта регистра
 */
[[nodiscard]] bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace logmerge::model
