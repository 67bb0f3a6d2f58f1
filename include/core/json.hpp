#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace autoheal {

/**
 * @brief Read-only view over a glz::json_t document
 *
 * Used to pick fields out of health payloads and Docker Engine responses.
 * Missing keys and type mismatches yield null values instead of throwing,
 * so callers can fall back to defaults with value().
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
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

    /// node.value("key", default); default also covers a type mismatch
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue child = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return child.is_string() ? child.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return child.is_boolean() ? child.get<bool>() : default_value;
        } else {
            return child.is_number() ? child.get<T>() : default_value;
        }
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

// ============================================================================
// Evidence <-> JSON object
// ============================================================================

[[nodiscard]] inline std::string evidence_to_json(const Evidence& evidence) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : evidence) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":\"{}\"", utils::escape_json(key), utils::escape_json(value));
    }
    out += '}';
    return out;
}

/// Non-string members are skipped; a malformed document yields empty evidence
[[nodiscard]] inline Evidence evidence_from_json(std::string_view json_str) {
    Evidence evidence;
    try {
        const auto doc = JsonValue::parse(json_str);
        if (!doc.is_object()) return evidence;
        for (const auto& [key, value] : doc.raw().get_object()) {
            if (value.is_string()) {
                evidence[key] = value.get<std::string>();
            }
        }
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("Discarding malformed evidence document: {}", e.what()));
    }
    return evidence;
}

} // namespace autoheal
