/**
 * @file json_numbers.hpp
 * @brief Range-checked integer reads from JSON values
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * nlohmann's get<T>() converts with a plain cast, so 70000 read as a
 * uint16_t becomes 4464 and 1.9 read as an int becomes 1. Wire fields
 * go through json_integer() instead.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace lanconnect {

/**
 * @brief Read an integral JSON value into T
 * @param value JSON value
 * @param field Field name used in the error message
 * @return The value, exactly representable in T
 * @throws std::invalid_argument if the value is not an integer or does not fit T
 */
template <typename T>
T json_integer(const nlohmann::json& value, const std::string& field) {
    static_assert(std::is_integral<T>::value, "json_integer needs an integral type");

    if (!value.is_number_integer()) {
        throw std::invalid_argument(field + " is not an integer");
    }

    if (value.is_number_unsigned()) {
        uint64_t number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::invalid_argument(field + " is out of range");
        }
        return static_cast<T>(number);
    }

    int64_t number = value.get<int64_t>();
    if (number < 0) {
        if (std::is_unsigned<T>::value ||
            number < static_cast<int64_t>(std::numeric_limits<T>::min())) {
            throw std::invalid_argument(field + " is out of range");
        }
    } else if (static_cast<uint64_t>(number) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument(field + " is out of range");
    }
    return static_cast<T>(number);
}

/**
 * @brief Read an optional integral field, using fallback when the key is absent
 */
template <typename T>
T json_integer_or(const nlohmann::json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    return json_integer<T>(*it, key);
}

} // namespace lanconnect
