#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "uiwire/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the request parser and the json::Traits layer to
extract primitive values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (string, string list)
  • Provide explicit optional-field presence signaling

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
================================================================================
*/


namespace uiwire::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// FIELD LOOKUP (present / absent)
// ------------------------------------------------------------
[[nodiscard]]
inline bool find_field(const simdjson::dom::element& obj, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return false;
    }
    // Absent key → NO_SUCH_FIELD
    return obj[key].get(out) == simdjson::SUCCESS;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!find_field(parent, key, out)) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

// ------------------------------------------------------------
// REQUIRED ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(parent, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(obj, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED STRING LIST FIELD (every element must be a string)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_list_required(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out) {
    simdjson::dom::array arr;
    auto r = parse_array_required(obj, key, arr);
    if (r != Result::Parsed) {
        return r;
    }
    std::vector<std::string> items;
    items.reserve(arr.size());
    for (auto item : arr) {
        std::string_view sv;
        if (item.get(sv)) {
            return Result::InvalidSchema;
        }
        items.emplace_back(sv);
    }
    out = std::move(items);
    return Result::Parsed;
}

// ------------------------------------------------------------
// JSON type name (diagnostics only)
// ------------------------------------------------------------
[[nodiscard]]
inline std::string_view type_name(const simdjson::dom::element& el) noexcept {
    switch (el.type()) {
        case simdjson::dom::element_type::ARRAY:      return "array";
        case simdjson::dom::element_type::OBJECT:     return "object";
        case simdjson::dom::element_type::INT64:      return "integer";
        case simdjson::dom::element_type::UINT64:     return "integer";
        case simdjson::dom::element_type::DOUBLE:     return "floating point";
        case simdjson::dom::element_type::STRING:     return "string";
        case simdjson::dom::element_type::BOOL:       return "boolean";
        case simdjson::dom::element_type::NULL_VALUE: return "null";
        default:                                      return "unknown";
    }
}

} // namespace uiwire::parser::helper
