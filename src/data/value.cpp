/// @file value.cpp
/// @brief Value formatting, ordering and JSON bridge

#include <treepath/data/value.hpp>

#include <b64/decode.h>
#include <b64/encode.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <sstream>

namespace treepath_data {

// =============================================================================
// Base64
// =============================================================================

namespace {

constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// libb64 skips characters outside the alphabet, so the shape is checked first:
// whole quanta, alphabet characters, and at most two '=' at the very end.
bool well_formed_base64(std::string_view text) noexcept {
    if (text.size() % 4 != 0) {
        return false;
    }
    const auto body = text.substr(0, text.find_last_not_of('=') + 1);
    if (text.size() - body.size() > 2) {
        return false;
    }
    return body.find_first_not_of(kBase64Alphabet) == std::string_view::npos;
}

std::string format_double(double d) {
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss << d;
        return oss.str();
    }
    return std::string(buf.data(), end);
}

template<typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // anonymous namespace

std::string base64_encode(const ValueBytes& bytes) {
    // 3 bytes -> 4 chars, plus the line breaks libb64 inserts
    std::string out(bytes.size() / 3 * 4 + bytes.size() / 54 + 8, '\0');
    ::base64::encoder enc;
    std::size_t written = static_cast<std::size_t>(
        enc.encode(reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size()), out.data()));
    written += static_cast<std::size_t>(enc.encode_end(out.data() + written));
    out.resize(written);
    out.erase(std::remove(out.begin(), out.end(), '\n'), out.end());
    return out;
}

std::optional<ValueBytes> base64_decode(std::string_view text) {
    if (!well_formed_base64(text)) {
        return std::nullopt;
    }
    // 4 chars -> 3 bytes
    ValueBytes out(text.size() / 4 * 3);
    ::base64::decoder dec;
    const auto len = dec.decode(text.data(), static_cast<int>(text.size()),
                                reinterpret_cast<char*>(out.data()));
    out.resize(static_cast<std::size_t>(len));
    return out;
}

// =============================================================================
// Value
// =============================================================================

bool Value::is_set() const noexcept {
    if (is_null()) {
        return false;
    }
    if (auto* e = std::get_if<EnumValue>(&m_data)) {
        return e->value != 0;
    }
    if (auto* a = std::get_if<ValueArray>(&m_data)) {
        return !a->empty();
    }
    return true;
}

const Value* Value::get(const std::string& key) const {
    const auto* members = get_if<ValueObject>();
    if (members == nullptr) {
        return nullptr;
    }
    auto it = members->find(key);
    return it != members->end() ? &it->second : nullptr;
}

std::string Value::to_key_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, ValueBytes>) {
            return base64_encode(v);
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return v.name;
        } else {
            return Value(v).to_string();
        }
    }, m_data);
}

std::string Value::to_string() const {
    if (is_null()) {
        return "null";
    }
    if (auto* arr = get_if<ValueArray>()) {
        std::string out = "[";
        for (std::size_t i = 0; i < arr->size(); ++i) {
            if (i > 0) out += ", ";
            out += (*arr)[i].to_string();
        }
        return out + "]";
    }
    if (auto* obj = get_if<ValueObject>()) {
        std::string out = "{";
        bool first = true;
        for (const auto& [key, value] : *obj) {
            if (!first) out += ", ";
            out += key + ": " + value.to_string();
            first = false;
        }
        return out + "}";
    }
    if (is_string()) {
        return "\"" + as_string() + "\"";
    }
    return to_key_string();
}

int Value::compare(const Value& a, const Value& b) {
    if (a.m_data.index() != b.m_data.index()) {
        return three_way(a.m_data.index(), b.m_data.index());
    }
    return std::visit([&b](const auto& lhs) -> int {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.m_data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            int c = three_way(lhs.value, rhs.value);
            return c != 0 ? c : three_way(lhs.name, rhs.name);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            for (std::size_t i = 0; i < lhs.size() && i < rhs.size(); ++i) {
                int c = Value::compare(lhs[i], rhs[i]);
                if (c != 0) return c;
            }
            return three_way(lhs.size(), rhs.size());
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            auto it = lhs.begin();
            auto jt = rhs.begin();
            for (; it != lhs.end() && jt != rhs.end(); ++it, ++jt) {
                int c = three_way(it->first, jt->first);
                if (c != 0) return c;
                c = Value::compare(it->second, jt->second);
                if (c != 0) return c;
            }
            return three_way(lhs.size(), rhs.size());
        } else {
            return three_way(lhs, rhs);
        }
    }, a.m_data);
}

// =============================================================================
// JSON Bridge
// =============================================================================

Value Value::from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value{};
        case nlohmann::json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return Value(j.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::json::value_t::string:
            return Value(j.get<std::string>());
        case nlohmann::json::value_t::binary:
            return Value(ValueBytes(j.get_binary().begin(), j.get_binary().end()));
        case nlohmann::json::value_t::array: {
            ValueArray arr;
            arr.reserve(j.size());
            for (const auto& item : j) {
                arr.push_back(Value::from_json(item));
            }
            return Value(std::move(arr));
        }
        case nlohmann::json::value_t::object: {
            ValueObject obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.emplace(it.key(), Value::from_json(it.value()));
            }
            return Value(std::move(obj));
        }
        default:
            return Value{};
    }
}

nlohmann::json Value::to_json() const {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, ValueBytes>) {
            return base64_encode(v);
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return v.name;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : v) {
                arr.push_back(item.to_json());
            }
            return arr;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, item] : v) {
                obj[key] = item.to_json();
            }
            return obj;
        } else {
            return v;
        }
    }, m_data);
}

} // namespace treepath_data
