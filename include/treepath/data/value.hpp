#pragma once

/// @file value.hpp
/// @brief Leaf payload type

#include "fwd.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace treepath_data {

// =============================================================================
// ValueType
// =============================================================================

/// Alternative held by a Value, in variant order
enum class ValueType : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Uint,
    Float,
    String,
    Bytes,
    Enum,
    Array,
    Object,
};

[[nodiscard]] constexpr const char* value_type_name(ValueType type) noexcept {
    constexpr const char* names[] = {
        "Null", "Bool", "Int", "Uint", "Float", "String", "Bytes", "Enum", "Array", "Object",
    };
    const auto index = static_cast<std::size_t>(type);
    return index < std::size(names) ? names[index] : "Unknown";
}

// =============================================================================
// Value
// =============================================================================

using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value>;    ///< Keyed by schema name
using ValueBytes = std::vector<std::uint8_t>;

/// Enumerated value. Zero is the unset sentinel.
struct EnumValue {
    std::int64_t value = 0;
    std::string name;

    bool operator==(const EnumValue& other) const noexcept {
        return value == other.value && name == other.name;
    }
};

/// Leaf payload, or a whole subtree when used as an unmarshal source.
/// Signed integers are held as Int and unsigned ones as Uint.
class Value {
public:
    using Variant = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double,
                                 std::string, ValueBytes, EnumValue, ValueArray, ValueObject>;

    Value() = default;
    Value(bool b) : m_data(b) {}

    template<typename I>
        requires(std::is_integral_v<I> && !std::is_same_v<I, bool>)
    Value(I n) {
        if constexpr (std::is_signed_v<I>) {
            m_data = static_cast<std::int64_t>(n);
        } else {
            m_data = static_cast<std::uint64_t>(n);
        }
    }

    Value(double d) : m_data(d) {}
    Value(const char* s) : m_data(std::in_place_type<std::string>, s) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(std::string_view s) : m_data(std::in_place_type<std::string>, s) {}
    Value(ValueBytes bytes) : m_data(std::move(bytes)) {}
    Value(EnumValue e) : m_data(std::move(e)) {}
    Value(ValueArray items) : m_data(std::move(items)) {}
    Value(ValueObject members) : m_data(std::move(members)) {}

    [[nodiscard]] static Value null() { return {}; }

    [[nodiscard]] static Value array(std::initializer_list<Value> items) {
        return ValueArray(items);
    }

    [[nodiscard]] static Value object(std::initializer_list<ValueObject::value_type> members) {
        return ValueObject(members);
    }

    [[nodiscard]] static Value enumeration(std::int64_t value, std::string name) {
        return EnumValue{value, std::move(name)};
    }

    /// Non-negative JSON integers become Uint, negative ones Int
    [[nodiscard]] static Value from_json(const nlohmann::json& j);

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    [[nodiscard]] ValueType type() const noexcept { return static_cast<ValueType>(m_data.index()); }
    [[nodiscard]] const char* type_name() const noexcept { return value_type_name(type()); }

    template<typename T>
    [[nodiscard]] bool holds() const noexcept { return std::holds_alternative<T>(m_data); }

    /// Pointer to the held T, or nullptr
    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&m_data); }

    [[nodiscard]] bool is_null() const noexcept { return holds<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return holds<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return holds<std::int64_t>(); }
    [[nodiscard]] bool is_uint() const noexcept { return holds<std::uint64_t>(); }
    [[nodiscard]] bool is_float() const noexcept { return holds<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return holds<std::string>(); }
    [[nodiscard]] bool is_bytes() const noexcept { return holds<ValueBytes>(); }
    [[nodiscard]] bool is_enum() const noexcept { return holds<EnumValue>(); }
    [[nodiscard]] bool is_array() const noexcept { return holds<ValueArray>(); }
    [[nodiscard]] bool is_object() const noexcept { return holds<ValueObject>(); }

    /// False for null, the enum sentinel and empty arrays
    [[nodiscard]] bool is_set() const noexcept;

    // Throw std::bad_variant_access on mismatch
    [[nodiscard]] bool as_bool() const { return std::get<bool>(m_data); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] std::uint64_t as_uint() const { return std::get<std::uint64_t>(m_data); }
    [[nodiscard]] double as_float() const { return std::get<double>(m_data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_data); }
    [[nodiscard]] const ValueBytes& as_bytes() const { return std::get<ValueBytes>(m_data); }
    [[nodiscard]] const EnumValue& as_enum() const { return std::get<EnumValue>(m_data); }
    [[nodiscard]] const ValueArray& as_array() const { return std::get<ValueArray>(m_data); }
    [[nodiscard]] const ValueObject& as_object() const { return std::get<ValueObject>(m_data); }

    /// Object member, or nullptr when absent or not an object
    [[nodiscard]] const Value* get(const std::string& key) const;

    // -------------------------------------------------------------------------
    // Text and JSON
    // -------------------------------------------------------------------------

    /// Key-predicate form: decimal integers, true/false, enum names,
    /// shortest round-trip floats, base64 bytes
    [[nodiscard]] std::string to_key_string() const;

    [[nodiscard]] std::string to_string() const;

    /// Enums by name, bytes as base64
    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return m_data != other.m_data; }

    /// Strict weak order: by type, then by content (numeric for numbers)
    [[nodiscard]] static int compare(const Value& a, const Value& b);

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

// =============================================================================
// Base64
// =============================================================================

/// Standard base64 with padding
[[nodiscard]] std::string base64_encode(const ValueBytes& bytes);

/// Decode standard base64; nullopt on malformed input
[[nodiscard]] std::optional<ValueBytes> base64_decode(std::string_view text);

} // namespace treepath_data
