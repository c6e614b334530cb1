/**
 * @file errors.cpp
 * @brief Ошибки сведения и нормализации
 */

#include "errors.hpp"

namespace logmerge::core {

std::string_view toString(MergeErrorKind kind) noexcept {
    switch (kind) {
        case MergeErrorKind::NoSources: return "no_sources";
        case MergeErrorKind::NoUsableSources: return "no_usable_sources";
        case MergeErrorKind::NoDepthData: return "no_depth_data";
        case MergeErrorKind::InvalidOptions: return "invalid_options";
    }
    return "unknown";
}

} // namespace logmerge::core
