/**
 * @file text_utils.cpp
 * @brief Утилиты для сравнения мнемоник и единиц (ASCII + кириллица)
 */

#include "text_utils.hpp"
#include <cctype>

namespace logmerge::model {

namespace {

/// Длина UTF-8 последовательности по ведущему байту (1 для некорректного)
size_t sequenceLength(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

std::string utf8ToUpper(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        auto lead = static_cast<unsigned char>(input[i]);
        size_t len = sequenceLength(lead);
        if (i + len > input.size()) {
            len = 1;
        }

        if (len == 1) {
            out.push_back(static_cast<char>(std::toupper(lead)));
            ++i;
            continue;
        }

        if (len == 2) {
            auto trail = static_cast<unsigned char>(input[i + 1]);
            char32_t cp = static_cast<char32_t>(((lead & 0x1F) << 6) | (trail & 0x3F));

            // а-я -> А-Я, ё -> Ё; остальные двухбайтовые символы без изменений
            if (cp >= 0x430 && cp <= 0x44F) {
                cp -= 0x20;
            } else if (cp == 0x451) {
                cp = 0x401;
            }
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            i += 2;
            continue;
        }

        out.append(input.substr(i, len));
        i += len;
    }

    return out;
}

std::string trim(std::string_view input) {
    size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return utf8ToUpper(haystack).find(utf8ToUpper(needle)) != std::string::npos;
}

} // namespace logmerge::model
