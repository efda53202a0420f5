#pragma once

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sqlguard {

/**
 * @brief Read-only navigation over glz::json_t
 *
 * Used to walk libpg_query parse trees and LLM API responses. Lookups on
 * a missing key or a mismatched type yield a null value instead of
 * throwing, so chained access such as v["content"][0]["text"] is safe.
 * Output documents are built directly with glz::json_t.
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

    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }

    [[nodiscard]] size_t size() const { return data_.size(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

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

    // String value or fallback when absent / not a string
    [[nodiscard]] std::string string_or(std::string_view key, std::string fallback = {}) const {
        const JsonValue v = (*this)[key];
        return v.is_string() ? v.get<std::string>() : std::move(fallback);
    }

    // Visit every direct child of an object or array
    template <typename F>
    void for_each_child(F&& fn) const {
        if (data_.is_object()) {
            for (const auto& [key, value] : data_.get_object()) {
                fn(key, JsonValue(value));
            }
        } else if (data_.is_array()) {
            for (const auto& value : data_.get_array()) {
                fn(std::string_view{}, JsonValue(value));
            }
        }
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    // Serialize a document; throws parse_error if glaze rejects it
    [[nodiscard]] static std::string dump(const glz::json_t& doc) {
        std::string buffer;
        const auto ec = glz::write_json(doc, buffer);
        if (ec) {
            throw parse_error("JSON write error");
        }
        return buffer;
    }

private:
    glz::json_t data_{};
};

} // namespace sqlguard
