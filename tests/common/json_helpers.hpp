#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "simdjson.h"

#include "common/test_check.hpp"

// ----------------------------------------------------------------------------
// Request builders and response inspection
// ----------------------------------------------------------------------------

namespace helpers {

// {"key":{"eventPath":<path_json>},"data":<data_json>}
inline std::string event(std::string_view path_json, std::string_view data_json = "null") {
    std::string out = R"({"key":{"eventPath":)";
    out += path_json;
    out += R"(},"data":)";
    out += data_json;
    out += '}';
    return out;
}

inline std::string request(std::string_view session_id, const std::vector<std::string>& events) {
    std::string out = R"({"sessionId":")";
    out += session_id;
    out += R"(","events":[)";
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (i) out += ',';
        out += events[i];
    }
    out += "]}";
    return out;
}


// One decoded outgoing action
struct Action {
    std::vector<std::string> path;
    std::optional<std::string> debug_symbol;
    std::string data;                  // minified JSON
    std::optional<std::string> text;   // set when data is a JSON string
};

inline Action parse_action(const simdjson::dom::element& item) {
    Action a;

    simdjson::dom::element key;
    TEST_CHECK(!item["key"].get(key));

    simdjson::dom::array path;
    TEST_CHECK(!key["actionPath"].get(path));
    for (auto seg : path) {
        std::string_view sv;
        TEST_CHECK(!seg.get(sv));
        a.path.emplace_back(sv);
    }

    simdjson::dom::element dbg;
    TEST_CHECK(!key["debugSymbol"].get(dbg));
    if (!dbg.is_null()) {
        std::string_view sv;
        TEST_CHECK(!dbg.get(sv));
        a.debug_symbol = std::string(sv);
    }

    simdjson::dom::element data;
    TEST_CHECK(!item["data"].get(data));
    a.data = simdjson::minify(data);
    if (data.is_string()) {
        std::string_view sv;
        TEST_CHECK(!data.get(sv));
        a.text = std::string(sv);
    }
    return a;
}

inline Action parse_action(std::string_view json) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(json.data(), json.size()).get(root));
    return parse_action(root);
}

// Parse a response body (JSON array of actions)
inline std::vector<Action> parse_actions(std::string_view json) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(json.data(), json.size()).get(root));

    simdjson::dom::array arr;
    TEST_CHECK(!root.get(arr));

    std::vector<Action> out;
    for (auto item : arr) {
        out.push_back(parse_action(item));
    }
    return out;
}

inline bool is_root_error(const Action& a, std::string_view text) {
    return a.path == std::vector<std::string>{"root_error"} &&
           !a.debug_symbol.has_value() &&
           a.text.has_value() && *a.text == text;
}

} // namespace helpers
