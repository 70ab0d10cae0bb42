#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

namespace stow {

/*
 * How set_value reaches into a stored value.
 * Scalar types are replaced whole; keyed types (string-keyed maps, JSON objects)
 * change a single existing field.
 */
template <typename T>
struct ValueTraits {
    using field_type = T;

    static bool is_keyed(const T&) { return false; }
    static bool has_field(const T&, const std::string&) { return false; }
    static void set_field(T&, const std::string&, field_type) {}
    static void assign(T& data, field_type value) { data = std::move(value); }
};

template <typename V, typename Compare, typename Alloc>
struct ValueTraits<std::map<std::string, V, Compare, Alloc>> {
    using map_type = std::map<std::string, V, Compare, Alloc>;
    using field_type = V;

    static bool is_keyed(const map_type&) { return true; }
    static bool has_field(const map_type& data, const std::string& key) { return data.count(key) > 0; }
    static void set_field(map_type& data, const std::string& key, field_type value) {
        data.at(key) = std::move(value);
    }
    static void assign(map_type&, field_type) {}
};

template <typename V, typename Hash, typename Eq, typename Alloc>
struct ValueTraits<std::unordered_map<std::string, V, Hash, Eq, Alloc>> {
    using map_type = std::unordered_map<std::string, V, Hash, Eq, Alloc>;
    using field_type = V;

    static bool is_keyed(const map_type&) { return true; }
    static bool has_field(const map_type& data, const std::string& key) { return data.count(key) > 0; }
    static void set_field(map_type& data, const std::string& key, field_type value) {
        data.at(key) = std::move(value);
    }
    static void assign(map_type&, field_type) {}
};

// Only JSON objects are keyed; arrays and primitives are replaced whole.
template <>
struct ValueTraits<nlohmann::json> {
    using field_type = nlohmann::json;

    static bool is_keyed(const nlohmann::json& data) { return data.is_object(); }
    static bool has_field(const nlohmann::json& data, const std::string& key) {
        return data.contains(key);
    }
    static void set_field(nlohmann::json& data, const std::string& key, field_type value) {
        data[key] = std::move(value);
    }
    static void assign(nlohmann::json& data, field_type value) { data = std::move(value); }
};

} // namespace stow
