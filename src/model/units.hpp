/**
 * @file units.hpp
 * @brief Строго типизированные единицы глубины
 *
 * Типы-обёртки для предотвращения смешивания футов и метров.
 * Каноническая единица глубины при сведении - фут.
 * Включает литералы для удобства: 0.5_ft, 100.0_m
 */

#pragma once

#include <cmath>
#include <compare>
#include <string_view>

namespace logmerge::model {

/// Количество футов в одном метре
constexpr double kFeetPerMeter = 3.28084;

struct Feet;

/**
 * @brief Расстояние в метрах
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Feet toFeet() const noexcept;

    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator*(double scalar) const noexcept {
        return Meters{value * scalar};
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

/**
 * @brief Расстояние в футах
 */
struct Feet {
    double value;

    constexpr explicit Feet(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Meters toMeters() const noexcept {
        return Meters{value / kFeetPerMeter};
    }

    constexpr Feet operator+(Feet other) const noexcept {
        return Feet{value + other.value};
    }

    constexpr Feet operator-(Feet other) const noexcept {
        return Feet{value - other.value};
    }

    constexpr Feet operator*(double scalar) const noexcept {
        return Feet{value * scalar};
    }

    constexpr Feet operator/(double scalar) const noexcept {
        return Feet{value / scalar};
    }

    constexpr double operator/(Feet other) const noexcept {
        return value / other.value;
    }

    constexpr auto operator<=>(const Feet& other) const noexcept = default;
};

constexpr Feet Meters::toFeet() const noexcept {
    return Feet{value * kFeetPerMeter};
}

/**
 * @brief Заявленная единица глубины источника
 */
enum class DepthUnit {
    Feet,
    Meters
};

/**
 * @brief Разбор заявленной единицы глубины
 *
 * Регистр не учитывается. Метры: M, METER, METERS, METRE, METRES, М, МЕТР.
 * Всё остальное (включая пустую строку) трактуется как футы.
 */
[[nodiscard]] DepthUnit parseDepthUnit(std::string_view text);

[[nodiscard]] inline std::string_view toString(DepthUnit unit) noexcept {
    switch (unit) {
        case DepthUnit::Feet: return "FT";
        case DepthUnit::Meters: return "M";
    }
    return "FT";
}

namespace literals {

constexpr Feet operator""_ft(long double v) noexcept {
    return Feet{static_cast<double>(v)};
}

constexpr Feet operator""_ft(unsigned long long v) noexcept {
    return Feet{static_cast<double>(v)};
}

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Meters operator""_m(unsigned long long v) noexcept {
    return Meters{static_cast<double>(v)};
}

} // namespace literals

[[nodiscard]] inline Feet abs(Feet f) noexcept { return Feet{std::abs(f.value)}; }

} // namespace logmerge::model
