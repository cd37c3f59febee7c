#pragma once

#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sqlsandbox {

/**
 * @brief Read-only DOM view over glz::json_t
 *
 * Used to walk libpg_query parse trees and problem definition files.
 * Const operator[] returns copies, so missing keys and wrong types yield a
 * null value instead of throwing; callers test with is_*() first.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access (returns copy, null when absent) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // node.value("key", default): default on missing key or mismatched type
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue v = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return v.is_string() ? v.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v.is_boolean() ? v.get<bool>() : default_value;
        } else {
            return v.is_number() ? v.get<T>() : default_value;
        }
    }

    [[nodiscard]] std::string value(std::string_view key, const char* default_value) const {
        return value<std::string>(key, std::string(default_value));
    }

    /**
     * @brief Convert a scalar JSON value to a result cell
     *
     * Integral numbers become int64_t so that expected rows authored as JSON
     * compare the same way engine output does.
     */
    [[nodiscard]] Cell to_cell() const {
        if (data_.is_null()) return std::monostate{};
        if (data_.is_boolean()) return data_.get<bool>();
        if (data_.is_number()) {
            if (is_number_integer() && std::fabs(data_.get<double>()) < 9.0e15) {
                return static_cast<int64_t>(data_.get<double>());
            }
            return data_.get<double>();
        }
        if (data_.is_string()) return data_.get<std::string>();
        return glz::write_json(data_).value_or(std::string{});
    }

    // ===== Iteration =====

    // Calls fn(JsonValue) for each array element
    template <typename Fn>
    void for_each_element(Fn&& fn) const {
        if (!data_.is_array()) return;
        for (const auto& elem : data_.get_array()) {
            fn(JsonValue(elem));
        }
    }

    // Calls fn(key, JsonValue) for each object member
    template <typename Fn>
    void for_each_member(Fn&& fn) const {
        if (!data_.is_object()) return;
        for (const auto& [key, val] : data_.get_object()) {
            fn(std::string_view(key), JsonValue(val));
        }
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error(std::string("JSON parse error: ") +
                              glz::format_error(ec, json_str));
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace sqlsandbox
