/// @file node.cpp
/// @brief Field contract, list keys and value checking

#include <treepath/data/node.hpp>
#include <treepath/data/list.hpp>
#include <treepath/schema/entry.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <sstream>

namespace treepath_data {

using treepath_core::Err;
using treepath_core::MutationError;
using treepath_core::Ok;
using treepath_core::PathError;
using treepath_core::Result;

// =============================================================================
// Kind Names
// =============================================================================

const char* field_kind_name(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::Leaf: return "leaf";
        case FieldKind::LeafList: return "leaf-list";
        case FieldKind::Container: return "container";
        case FieldKind::List: return "list";
        default: return "unknown";
    }
}

const char* value_kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Any: return "any";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Uint: return "uint";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
        case ValueKind::Bytes: return "bytes";
        case ValueKind::Enum: return "enum";
        default: return "unknown";
    }
}

// =============================================================================
// Schema Paths
// =============================================================================

std::vector<SchemaPath> parse_schema_paths(const std::string& spec) {
    std::vector<SchemaPath> out;
    std::istringstream alternatives(spec);
    std::string alt;
    while (std::getline(alternatives, alt, '|')) {
        SchemaPath path;
        std::istringstream segments(alt);
        std::string seg;
        while (std::getline(segments, seg, '/')) {
            if (!seg.empty()) {
                path.push_back(seg);
            }
        }
        if (!path.empty()) {
            out.push_back(std::move(path));
        }
    }
    return out;
}

std::string schema_path_string(const SchemaPath& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += "/";
        out += path[i];
    }
    return out;
}

// =============================================================================
// ListAttributes
// =============================================================================

ListAttributes ListAttributes::from_schema(const treepath_schema::SchemaEntry& entry) {
    ListAttributes attrs;
    attrs.ordered_by_user = entry.ordered_by_user();
    attrs.min_elements = entry.min_elements();
    attrs.max_elements = entry.max_elements();
    return attrs;
}

// =============================================================================
// FieldDescriptor
// =============================================================================

FieldDescriptor FieldDescriptor::leaf(std::string name, const std::string& paths, ValueKind type) {
    FieldDescriptor f;
    f.name = std::move(name);
    f.kind = FieldKind::Leaf;
    f.paths = parse_schema_paths(paths);
    f.value_type = type;
    return f;
}

FieldDescriptor FieldDescriptor::leaf_list(std::string name, const std::string& paths, ValueKind type) {
    FieldDescriptor f = leaf(std::move(name), paths, type);
    f.kind = FieldKind::LeafList;
    return f;
}

FieldDescriptor FieldDescriptor::enumeration(std::string name, const std::string& paths,
                                             std::vector<std::string> names) {
    FieldDescriptor f = leaf(std::move(name), paths, ValueKind::Enum);
    f.enum_values = std::move(names);
    return f;
}

FieldDescriptor FieldDescriptor::container(std::string name, const std::string& paths, const NodeType& type) {
    FieldDescriptor f;
    f.name = std::move(name);
    f.kind = FieldKind::Container;
    f.paths = parse_schema_paths(paths);
    f.child_type = &type;
    return f;
}

FieldDescriptor FieldDescriptor::list_of(std::string name, const std::string& paths,
                                         const NodeType& type, ListAttributes attrs) {
    FieldDescriptor f = container(std::move(name), paths, type);
    f.kind = FieldKind::List;
    f.list = std::move(attrs);
    return f;
}

FieldDescriptor FieldDescriptor::annotation_field(std::string name) {
    FieldDescriptor f;
    f.name = std::move(name);
    f.kind = FieldKind::Leaf;
    f.annotation = true;
    return f;
}

FieldDescriptor& FieldDescriptor::with_shadow(const std::string& shadow) {
    shadow_paths = parse_schema_paths(shadow);
    return *this;
}

const std::string& FieldDescriptor::schema_name() const noexcept {
    if (!paths.empty() && !paths.front().empty()) {
        return paths.front().back();
    }
    return name;
}

std::optional<std::string> FieldDescriptor::enum_name(std::int64_t value) const {
    if (value < 1 || static_cast<std::uint64_t>(value) > enum_values.size()) {
        return std::nullopt;
    }
    return enum_values[static_cast<std::size_t>(value - 1)];
}

std::optional<std::int64_t> FieldDescriptor::enum_value(const std::string& enum_name) const {
    for (std::size_t i = 0; i < enum_values.size(); ++i) {
        if (enum_values[i] == enum_name) {
            return static_cast<std::int64_t>(i + 1);
        }
    }
    return std::nullopt;
}

// =============================================================================
// NodeType
// =============================================================================

const FieldDescriptor* NodeType::find_field(const std::string& field_name) const {
    for (const auto& f : fields) {
        if (f.name == field_name) {
            return &f;
        }
    }
    return nullptr;
}

bool NodeType::is_key_field(const std::string& field_name) const {
    for (const auto& k : keys) {
        if (k == field_name) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// ListKey
// =============================================================================

const Value* ListKey::get(const std::string& name) const {
    for (const auto& [n, v] : m_components) {
        if (n == name) {
            return &v;
        }
    }
    return nullptr;
}

Result<std::map<std::string, std::string>> ListKey::to_strings() const {
    using KeyMap = std::map<std::string, std::string>;

    if (m_components.empty()) {
        return Err<KeyMap>(PathError::invalid_key("<list entry>", "empty key"));
    }
    KeyMap out;
    for (const auto& [name, value] : m_components) {
        if (!value.is_set()) {
            return Err<KeyMap>(PathError::invalid_key(name, "key component is unset"));
        }
        if (value.is_array() || value.is_object()) {
            return Err<KeyMap>(PathError::invalid_key(name, "key component is not a scalar"));
        }
        out[name] = value.to_key_string();
    }
    return Ok(std::move(out));
}

std::string ListKey::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < m_components.size(); ++i) {
        if (i > 0) out += ",";
        out += m_components[i].first + "=" + m_components[i].second.to_key_string();
    }
    return out;
}

bool ListKey::operator==(const ListKey& other) const {
    if (m_components.size() != other.m_components.size()) {
        return false;
    }
    for (const auto& [name, value] : m_components) {
        const Value* theirs = other.get(name);
        if (theirs == nullptr || *theirs != value) {
            return false;
        }
    }
    return true;
}

bool ListKey::operator<(const ListKey& other) const {
    std::size_t n = std::min(m_components.size(), other.m_components.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = m_components[i];
        const auto& b = other.m_components[i];
        if (a.first != b.first) {
            return a.first < b.first;
        }
        int c = Value::compare(a.second, b.second);
        if (c != 0) {
            return c < 0;
        }
    }
    return m_components.size() < other.m_components.size();
}

// =============================================================================
// DataNode
// =============================================================================

Result<ListKey> DataNode::list_key() const {
    const NodeType& t = type();
    if (t.keys.empty()) {
        return Err<ListKey>(PathError::invalid_key(t.name, "type declares no key fields"));
    }

    std::vector<ListKey::Component> components;
    components.reserve(t.keys.size());
    for (const auto& key_field : t.keys) {
        const FieldDescriptor* f = t.find_field(key_field);
        if (f == nullptr) {
            return Err<ListKey>(PathError::invalid_key(t.name, "unknown key field " + key_field));
        }
        components.emplace_back(f->schema_name(), leaf(key_field));
    }
    return Ok(ListKey(std::move(components)));
}

// =============================================================================
// Field Enumeration
// =============================================================================

std::vector<FieldRef> enumerate_fields(const DataNode& node) {
    std::vector<FieldRef> out;
    out.reserve(node.type().fields.size());

    for (const auto& f : node.type().fields) {
        FieldRef ref;
        ref.field = &f;
        switch (f.kind) {
            case FieldKind::Leaf:
            case FieldKind::LeafList:
                ref.value = &node.leaf(f.name);
                break;
            case FieldKind::Container:
                ref.container = node.container(f.name);
                break;
            case FieldKind::List:
                ref.list = node.list(f.name);
                break;
        }
        out.push_back(ref);
    }
    return out;
}

namespace {

bool lists_equal(const ListNode* a, const ListNode* b) {
    std::size_t na = a ? a->size() : 0;
    std::size_t nb = b ? b->size() : 0;
    if (na != nb) {
        return false;
    }
    if (na == 0) {
        return true;
    }

    auto ea = a->entries();
    auto eb = b->entries();
    for (std::size_t i = 0; i < ea.size(); ++i) {
        if (ea[i].first != eb[i].first || !deep_equal(*ea[i].second, *eb[i].second)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool deep_equal(const DataNode& a, const DataNode& b) {
    if (&a.type() != &b.type() && a.type().name != b.type().name) {
        return false;
    }

    auto fa = enumerate_fields(a);
    auto fb = enumerate_fields(b);
    if (fa.size() != fb.size()) {
        return false;
    }

    for (std::size_t i = 0; i < fa.size(); ++i) {
        switch (fa[i].field->kind) {
            case FieldKind::Leaf:
            case FieldKind::LeafList:
                if (*fa[i].value != *fb[i].value) {
                    return false;
                }
                break;
            case FieldKind::Container:
                if ((fa[i].container == nullptr) != (fb[i].container == nullptr)) {
                    return false;
                }
                if (fa[i].container != nullptr && !deep_equal(*fa[i].container, *fb[i].container)) {
                    return false;
                }
                break;
            case FieldKind::List:
                if (!lists_equal(fa[i].list, fb[i].list)) {
                    return false;
                }
                break;
        }
    }
    return true;
}

// =============================================================================
// Value Contract
// =============================================================================

namespace {

Result<Value> mismatch(const FieldDescriptor& field, const Value& value) {
    return Err<Value>(MutationError::invalid_value(field.name,
        std::string("expected ") + value_kind_name(field.value_type) + ", got " + value.type_name()));
}

Result<Value> coerce_enum(const FieldDescriptor& field, std::int64_t n) {
    if (n == 0) {
        return Ok(Value{});
    }
    auto name = field.enum_name(n);
    if (!name) {
        return Err<Value>(MutationError::invalid_value(field.name,
            "enum value " + std::to_string(n) + " out of range"));
    }
    return Ok(Value(EnumValue{n, *name}));
}

Result<Value> coerce_scalar(const FieldDescriptor& field, const Value& value) {
    if (value.is_array() || value.is_object()) {
        return mismatch(field, value);
    }

    switch (field.value_type) {
        case ValueKind::Any:
            return Ok(value);

        case ValueKind::Bool:
            if (value.is_bool()) return Ok(value);
            return mismatch(field, value);

        case ValueKind::Int:
            if (value.is_int()) return Ok(value);
            if (value.is_uint()) {
                if (value.as_uint() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return Err<Value>(MutationError::invalid_value(field.name, "integer out of range"));
                }
                return Ok(Value(static_cast<std::int64_t>(value.as_uint())));
            }
            return mismatch(field, value);

        case ValueKind::Uint:
            if (value.is_uint()) return Ok(value);
            if (value.is_int()) {
                if (value.as_int() < 0) {
                    return Err<Value>(MutationError::invalid_value(field.name, "negative value for unsigned field"));
                }
                return Ok(Value(static_cast<std::uint64_t>(value.as_int())));
            }
            return mismatch(field, value);

        case ValueKind::Float:
            if (value.is_float()) return Ok(value);
            if (value.is_int()) return Ok(Value(static_cast<double>(value.as_int())));
            if (value.is_uint()) return Ok(Value(static_cast<double>(value.as_uint())));
            return mismatch(field, value);

        case ValueKind::String:
            if (value.is_string()) return Ok(value);
            return mismatch(field, value);

        case ValueKind::Bytes:
            if (value.is_bytes()) return Ok(value);
            if (value.is_string()) {
                auto bytes = base64_decode(value.as_string());
                if (!bytes) {
                    return Err<Value>(MutationError::invalid_value(field.name, "malformed base64"));
                }
                return Ok(Value(std::move(*bytes)));
            }
            return mismatch(field, value);

        case ValueKind::Enum:
            if (value.is_enum()) return coerce_enum(field, value.as_enum().value);
            if (value.is_int()) return coerce_enum(field, value.as_int());
            if (value.is_uint()) return coerce_enum(field, static_cast<std::int64_t>(value.as_uint()));
            if (value.is_string()) {
                auto n = field.enum_value(value.as_string());
                if (!n) {
                    return Err<Value>(MutationError::invalid_value(field.name,
                        "unknown enum name " + value.as_string()));
                }
                return Ok(Value(EnumValue{*n, value.as_string()}));
            }
            return mismatch(field, value);
    }
    return mismatch(field, value);
}

template<typename T>
std::optional<T> parse_number(const std::string& text) {
    T out{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

} // anonymous namespace

Result<Value> coerce_value(const FieldDescriptor& field, const Value& value) {
    if (value.is_null()) {
        return Ok(Value{});
    }

    switch (field.kind) {
        case FieldKind::Leaf:
            return coerce_scalar(field, value);

        case FieldKind::LeafList: {
            const ValueArray* items = value.get_if<ValueArray>();
            if (items == nullptr) {
                return Err<Value>(MutationError::invalid_value(field.name,
                    std::string("leaf-list requires an array, got ") + value.type_name()));
            }
            if (items->empty()) {
                return Ok(Value{});
            }
            ValueArray out;
            out.reserve(items->size());
            for (const auto& item : *items) {
                if (item.is_null()) {
                    return Err<Value>(MutationError::invalid_value(field.name, "null leaf-list element"));
                }
                auto converted = coerce_scalar(field, item);
                if (!converted) {
                    return converted;
                }
                out.push_back(std::move(converted).value());
            }
            return Ok(Value(std::move(out)));
        }

        case FieldKind::Container:
        case FieldKind::List:
            break;
    }
    return Err<Value>(MutationError::invalid_value(field.name,
        std::string(field_kind_name(field.kind)) + " field does not hold a value"));
}

Result<Value> parse_scalar(const FieldDescriptor& field, const std::string& text) {
    auto bad = [&](const char* what) {
        return Err<Value>(MutationError::invalid_value(field.name,
            "cannot parse '" + text + "' as " + what));
    };

    switch (field.value_type) {
        case ValueKind::Any:
        case ValueKind::String:
            return Ok(Value(text));

        case ValueKind::Bool:
            if (text == "true") return Ok(Value(true));
            if (text == "false") return Ok(Value(false));
            return bad("bool");

        case ValueKind::Int:
            if (auto n = parse_number<std::int64_t>(text)) return Ok(Value(*n));
            return bad("int");

        case ValueKind::Uint:
            if (auto n = parse_number<std::uint64_t>(text)) return Ok(Value(*n));
            return bad("uint");

        case ValueKind::Float:
            if (auto d = parse_number<double>(text)) return Ok(Value(*d));
            return bad("float");

        case ValueKind::Bytes:
            if (auto bytes = base64_decode(text)) return Ok(Value(std::move(*bytes)));
            return bad("base64 bytes");

        case ValueKind::Enum:
            if (auto n = field.enum_value(text)) return Ok(Value(EnumValue{*n, text}));
            return bad("enum name");
    }
    return bad("value");
}

} // namespace treepath_data
