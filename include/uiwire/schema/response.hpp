#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "uiwire/symbol.hpp"
#include "uiwire/json/traits.hpp"


namespace uiwire::schema {

// -----------------------------------------------------------------------------
// Action record writer
// -----------------------------------------------------------------------------
// {"key":{"actionPath":[...],"debugSymbol":<string|null>},"data":<data>}
void write_action_key(std::string& out, const EventPath& path, const std::optional<std::string>& debug_symbol);

template<json::Writable T>
[[nodiscard]]
inline std::string make_action(const EventPath& path, const std::optional<std::string>& debug_symbol, const T& data) {
    std::string out;
    out += "{\"key\":";
    write_action_key(out, path, debug_symbol);
    out += ",\"data\":";
    json::Traits<T>::write(out, data);
    out += '}';
    return out;
}

// Single-segment reserved action carrying a string payload (root_error)
[[nodiscard]]
std::string make_reserved_action(std::string_view symbol, const std::string& text);


// -----------------------------------------------------------------------------
// Response: flat, ordered list of serialized actions
// -----------------------------------------------------------------------------
struct Response {
    std::vector<std::string> actions; // each entry is one JSON action object

    [[nodiscard]] inline bool empty() const noexcept { return actions.empty(); }
    [[nodiscard]] inline std::size_t size() const noexcept { return actions.size(); }

    // Append every action of `other`, preserving order
    inline void append(Response&& other) {
        actions.reserve(actions.size() + other.actions.size());
        for (auto& a : other.actions) {
            actions.push_back(std::move(a));
        }
        other.actions.clear();
    }

    // JSON array of all actions
    [[nodiscard]] std::string to_json() const;
};

} // namespace uiwire::schema
