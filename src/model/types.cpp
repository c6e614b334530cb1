/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include "text_utils.hpp"
#include <array>

namespace logmerge::model {

DepthUnit parseDepthUnit(std::string_view text) {
    static const std::array<std::string_view, 7> kMeterSpellings = {
        "M", "METER", "METERS", "METRE", "METRES",
        "\xD0\x9C",                          // "М"
        "\xD0\x9C\xD0\x95\xD0\xA2\xD0\xA0"   // "МЕТР"
    };

    auto upper = utf8ToUpper(trim(text));
    for (auto spelling : kMeterSpellings) {
        if (upper == spelling) {
            return DepthUnit::Meters;
        }
    }
    return DepthUnit::Feet;
}

} // namespace logmerge::model
