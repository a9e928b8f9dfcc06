#include "uiwire/schema/response.hpp"
#include "uiwire/schema/request.hpp"

#include <ostream>

#include "lcr/json.hpp"


namespace uiwire::schema {

void write_action_key(std::string& out, const EventPath& path, const std::optional<std::string>& debug_symbol) {
    out += "{\"actionPath\":[";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i) out += ',';
        lcr::json::append_string(out, path[i]);
    }
    out += "],\"debugSymbol\":";
    if (debug_symbol) {
        lcr::json::append_string(out, *debug_symbol);
    } else {
        lcr::json::append_null(out);
    }
    out += '}';
}

std::string make_reserved_action(std::string_view symbol, const std::string& text) {
    return make_action(EventPath{Symbol(symbol)}, std::nullopt, text);
}

std::string Response::to_json() const {
    std::size_t total = 2;
    for (const auto& a : actions) {
        total += a.size() + 1;
    }
    std::string out;
    out.reserve(total);
    out += '[';
    for (std::size_t i = 0; i < actions.size(); ++i) {
        if (i) out += ',';
        out += actions[i];
    }
    out += ']';
    return out;
}

std::ostream& operator<<(std::ostream& os, const RawEvent& e) {
    os << "[RawEvent] {path=" << to_string(e.path)
       << ", data=" << (e.data.text.empty() ? std::string("null") : e.data.text)
       << "}";
    return os;
}

} // namespace uiwire::schema
