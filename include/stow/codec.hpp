#pragma once

#include "stow/errors.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace stow {

/*
 * JSON text form of stored values, as written to the mirror's data column.
 * T must be convertible with nlohmann::json (to_json / from_json).
 */
template <typename T>
std::string encode_value(const T& value) {
    return nlohmann::json(value).dump();
}

// Throws PersistenceError when the text is not valid JSON for T
template <typename T>
T decode_value(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError{"cannot decode stored value: " + std::string{e.what()}};
    }
}

} // namespace stow
