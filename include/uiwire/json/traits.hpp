#pragma once

#include <cstdint>
#include <concepts>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "uiwire/parser/helpers.hpp"
#include "lcr/json.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Traits (typed payloads ⇄ JSON)
================================================================================

Event payloads and action data travel as JSON. Traits<T> is the one place a
type declares how it is read from a simdjson DOM element and written to JSON
text:

    template<> struct uiwire::json::Traits<Point> {
        [[nodiscard]] static bool parse(const simdjson::dom::element& el, Point& out, std::string& why) {
            return json::read_field(el, "x", out.x, why) && json::read_field(el, "y", out.y, why);
        }
        static void write(std::string& out, const Point& p) {
            out += "{\"x\":"; Traits<double>::write(out, p.x);
            out += ",\"y\":"; Traits<double>::write(out, p.y);
            out += '}';
        }
    };

parse() returns false and leaves a human readable reason in `why`. It never
throws. Unknown object fields are ignored by convention.
================================================================================
*/

namespace uiwire::json {

template<typename T, typename = void>
struct Traits; // intentionally undefined: unsupported types fail to compile


template<typename T>
concept Readable = requires(const simdjson::dom::element& el, T& out, std::string& why) {
    { Traits<T>::parse(el, out, why) } -> std::same_as<bool>;
};

template<typename T>
concept Writable = requires(std::string& out, const T& v) {
    { Traits<T>::write(out, v) };
};


// -----------------------------------------------------------------------------
// Opaque JSON value (kept as minified text)
// -----------------------------------------------------------------------------
struct Raw {
    std::string text; // empty means null

    [[nodiscard]] inline bool is_null() const noexcept { return text.empty() || text == "null"; }

    bool operator==(const Raw&) const = default;
};


namespace detail {

template<typename T>
inline constexpr bool is_optional_v = false;

template<typename T>
inline constexpr bool is_optional_v<std::optional<T>> = true;

inline bool type_error(std::string& why, std::string_view expected, const simdjson::dom::element& el) {
    why = "invalid type: ";
    why += parser::helper::type_name(el);
    why += ", expected ";
    why += expected;
    return false;
}

} // namespace detail


// ============================================================================
// BUILT-IN TRAITS
// ============================================================================

template<>
struct Traits<bool> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, bool& out, std::string& why) {
        if (el.get(out)) return detail::type_error(why, "a boolean", el);
        return true;
    }
    static void write(std::string& out, bool v) { lcr::json::append_bool(out, v); }
};

// null (e.g. EventKey<std::monostate> for events that carry no data)
template<>
struct Traits<std::monostate> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, std::monostate&, std::string& why) {
        if (!el.is_null()) return detail::type_error(why, "null", el);
        return true;
    }
    static void write(std::string& out, std::monostate) { lcr::json::append_null(out); }
};

template<typename T>
struct Traits<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, T& out, std::string& why) {
        std::int64_t v;
        if (el.get(v)) return detail::type_error(why, "a signed integer", el);
        if (v < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            v > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            why = "integer " + std::to_string(v) + " out of range";
            return false;
        }
        out = static_cast<T>(v);
        return true;
    }
    static void write(std::string& out, T v) { lcr::json::append(out, static_cast<std::int64_t>(v)); }
};

template<typename T>
struct Traits<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>>> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, T& out, std::string& why) {
        std::uint64_t v;
        if (el.get(v)) return detail::type_error(why, "an unsigned integer", el);
        if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            why = "integer " + std::to_string(v) + " out of range";
            return false;
        }
        out = static_cast<T>(v);
        return true;
    }
    static void write(std::string& out, T v) { lcr::json::append(out, static_cast<std::uint64_t>(v)); }
};

template<typename T>
struct Traits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, T& out, std::string& why) {
        double v;
        if (el.get(v)) return detail::type_error(why, "a number", el);
        out = static_cast<T>(v);
        return true;
    }
    static void write(std::string& out, T v) { lcr::json::append(out, static_cast<double>(v)); }
};

template<>
struct Traits<std::string> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, std::string& out, std::string& why) {
        std::string_view sv;
        if (el.get(sv)) return detail::type_error(why, "a string", el);
        out.assign(sv);
        return true;
    }
    static void write(std::string& out, const std::string& v) { lcr::json::append_string(out, v); }
};

template<typename T>
struct Traits<std::optional<T>> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, std::optional<T>& out, std::string& why) {
        if (el.is_null()) {
            out.reset();
            return true;
        }
        T value{};
        if (!Traits<T>::parse(el, value, why)) return false;
        out = std::move(value);
        return true;
    }
    static void write(std::string& out, const std::optional<T>& v) {
        if (!v) {
            lcr::json::append_null(out);
            return;
        }
        Traits<T>::write(out, *v);
    }
};

template<typename T>
struct Traits<std::vector<T>> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, std::vector<T>& out, std::string& why) {
        simdjson::dom::array arr;
        if (el.get(arr)) return detail::type_error(why, "a sequence", el);
        std::vector<T> items;
        items.reserve(arr.size());
        std::size_t index = 0;
        for (auto item : arr) {
            T value{};
            if (!Traits<T>::parse(item, value, why)) {
                why = "at index " + std::to_string(index) + ": " + why;
                return false;
            }
            items.push_back(std::move(value));
            ++index;
        }
        out = std::move(items);
        return true;
    }
    static void write(std::string& out, const std::vector<T>& v) {
        out += '[';
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i) out += ',';
            Traits<T>::write(out, v[i]);
        }
        out += ']';
    }
};

template<>
struct Traits<Raw> {
    [[nodiscard]] static bool parse(const simdjson::dom::element& el, Raw& out, std::string&) {
        out.text = simdjson::minify(el);
        return true;
    }
    static void write(std::string& out, const Raw& v) {
        if (v.text.empty()) {
            lcr::json::append_null(out);
            return;
        }
        out += v.text;
    }
};


// ============================================================================
// OBJECT FIELD HELPERS (for user Traits)
// ============================================================================

// Required field. A missing field is an error, except for std::optional<T>
// fields, which read as empty.
template<Readable T>
[[nodiscard]]
inline bool read_field(const simdjson::dom::element& obj, const char* key, T& out, std::string& why) {
    if (parser::helper::require_object(obj) != parser::Result::Parsed) {
        return detail::type_error(why, "an object", obj);
    }
    simdjson::dom::element field;
    if (!parser::helper::find_field(obj, key, field)) {
        if constexpr (detail::is_optional_v<T>) {
            out.reset();
            return true;
        } else {
            why = std::string("missing field `") + key + "`";
            return false;
        }
    }
    if (!Traits<T>::parse(field, out, why)) {
        why = std::string("field `") + key + "`: " + why;
        return false;
    }
    return true;
}

// Writes `"key":<value>` (no separator)
template<Writable T>
inline void write_field(std::string& out, std::string_view key, const T& value) {
    lcr::json::append_string(out, key);
    out += ':';
    Traits<T>::write(out, value);
}


// ============================================================================
// TEXT ENTRY POINTS
// ============================================================================

// Parse JSON text as T. A fresh DOM parser is used per call so that elements
// handed out by other parsers stay valid.
template<Readable T>
[[nodiscard]]
inline bool from_text(std::string_view text, T& out, std::string& why) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(text.data(), text.size()).get(root);
    if (error) {
        why = simdjson::error_message(error);
        return false;
    }
    return Traits<T>::parse(root, out, why);
}

template<Writable T>
[[nodiscard]]
inline std::string to_text(const T& value) {
    std::string out;
    Traits<T>::write(out, value);
    return out;
}

} // namespace uiwire::json
