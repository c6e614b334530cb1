/**
 * @file errors.hpp
 * @brief Ошибки сведения и нормализации
 *
 * Две категории:
 * - NormalizationError - проблема одного источника, восстанавливается
 *   на уровне сведения (источник отбрасывается, пишется предупреждение);
 * - MergeError - фатальная ошибка входных данных, результата нет.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace logmerge::core {

/**
 * @brief Вид фатальной ошибки сведения
 */
enum class MergeErrorKind {
    NoSources,        ///< Не передано ни одного источника
    NoUsableSources,  ///< Ни один источник не прошёл нормализацию
    NoDepthData,      ///< Нет ни одной таблицы с глубинами
    InvalidOptions    ///< Некорректный шаг или предел разрыва
};

[[nodiscard]] std::string_view toString(MergeErrorKind kind) noexcept;

/**
 * @brief Фатальная ошибка сведения
 */
class MergeError : public std::runtime_error {
public:
    MergeError(MergeErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] MergeErrorKind kind() const noexcept { return kind_; }

private:
    MergeErrorKind kind_;
};

/**
 * @brief Ошибка нормализации одного источника
 */
class NormalizationError : public std::runtime_error {
public:
    explicit NormalizationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace logmerge::core
