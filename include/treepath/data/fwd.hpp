#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for treepath_data module

#include <cstdint>

namespace treepath_data {

class Value;
struct EnumValue;

enum class FieldKind : std::uint8_t;
enum class ValueKind : std::uint8_t;
struct ListAttributes;
struct FieldDescriptor;
struct NodeType;
struct FieldRef;

class ListKey;
class DataNode;
class ListNode;
class KeyedList;
class OrderedList;
class Struct;

struct ValidationIssue;
struct ValidationResult;

} // namespace treepath_data
