#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>

/**
 * @brief Kind of activity a class session offers.
 *
 * Stored in shared memory, so new values must be appended.
 */
enum class ClassCategory : uint8_t {
    YOGA,
    ZUMBA,
    HIIT
};

/** @brief Number of ClassCategory values. */
constexpr uint32_t CLASS_CATEGORY_COUNT{3};

/**
 * @brief Convert ClassCategory enum to string representation.
 * @param category ClassCategory to convert
 * @return "YOGA", "ZUMBA", or "HIIT"
 */
constexpr const char *toString(const ClassCategory category) {
    switch (category) {
        case ClassCategory::YOGA: return "YOGA";
        case ClassCategory::ZUMBA: return "ZUMBA";
        case ClassCategory::HIIT: return "HIIT";
        default: throw std::invalid_argument("Invalid ClassCategory value");
    }
}

/**
 * @brief Parse a category name as produced by toString().
 * @param text Category name (case-sensitive)
 * @return Parsed category, or nullopt for unknown names
 */
inline std::optional<ClassCategory> parseClassCategory(const char *text) {
    for (uint32_t i = 0; i < CLASS_CATEGORY_COUNT; ++i) {
        const auto category = static_cast<ClassCategory>(i);
        if (std::strcmp(text, toString(category)) == 0) {
            return category;
        }
    }
    return std::nullopt;
}
