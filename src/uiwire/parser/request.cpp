#include "uiwire/parser/request.hpp"
#include "uiwire/parser/helpers.hpp"
#include "uiwire/config/protocol.hpp"
#include "lcr/log/logger.hpp"


namespace uiwire::parser {

std::ostream& operator<<(std::ostream& os, const RequestError& e) {
    return os << config::protocol::INVALID_REQUEST_PREFIX << e.detail;
}

namespace {

[[nodiscard]]
Result parse_event(const simdjson::dom::element& el, schema::RawEvent& out, std::string& why) {
    if (helper::require_object(el) != Result::Parsed) {
        why = "invalid type: ";
        why += helper::type_name(el);
        why += ", expected struct RawEvent";
        return Result::InvalidSchema;
    }

    // key (required object)
    simdjson::dom::element key;
    auto r = helper::parse_object_required(el, "key", key);
    if (r != Result::Parsed) {
        why = "missing or invalid field `key`";
        return r;
    }

    // key.eventPath (required list of strings)
    r = helper::parse_string_list_required(key, "eventPath", out.path);
    if (r != Result::Parsed) {
        why = "missing or invalid field `eventPath`, expected a sequence of strings";
        return r;
    }

    // data (required, any JSON value including null)
    simdjson::dom::element data;
    if (!helper::find_field(el, "data", data)) {
        why = "missing field `data`";
        return Result::InvalidSchema;
    }
    out.data.text = simdjson::minify(data);
    return Result::Parsed;
}

} // namespace


Result request::parse(const simdjson::dom::element& root, schema::Request& out, std::string& why) {
    // Root must be an object
    if (helper::require_object(root) != Result::Parsed) {
        why = "invalid type: ";
        why += helper::type_name(root);
        why += ", expected struct RawRequest";
        UW_DEBUG("[PARSER] Request root not an object -> reject request.");
        return Result::InvalidSchema;
    }

    // sessionId (required string)
    std::string_view session_id;
    auto r = helper::parse_string_required(root, "sessionId", session_id);
    if (r != Result::Parsed) {
        why = "missing or invalid field `sessionId`, expected a string";
        UW_DEBUG("[PARSER] Field 'sessionId' missing or invalid -> reject request.");
        return r;
    }

    // events (required array)
    simdjson::dom::array events;
    r = helper::parse_array_required(root, "events", events);
    if (r != Result::Parsed) {
        why = "missing or invalid field `events`, expected a sequence";
        UW_DEBUG("[PARSER] Field 'events' missing or invalid -> reject request.");
        return r;
    }

    schema::Request parsed;
    parsed.session_id = std::string(session_id);
    parsed.events.reserve(events.size());
    std::size_t index = 0;
    for (auto item : events) {
        schema::RawEvent event;
        r = parse_event(item, event, why);
        if (r != Result::Parsed) {
            why = "events[" + std::to_string(index) + "]: " + why;
            UW_DEBUG("[PARSER] Event #" << index << " invalid -> reject request.");
            return r;
        }
        parsed.events.push_back(std::move(event));
        ++index;
    }

    out = std::move(parsed);
    return Result::Parsed;
}


lcr::result<schema::Request, RequestError> parse_request(std::string_view body) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(body.data(), body.size()).get(root);
    if (error) {
        UW_WARN("[PARSER] JSON parse error: " << error);
        return lcr::err{RequestError{Result::InvalidJson, simdjson::error_message(error)}};
    }

    schema::Request out;
    std::string why;
    auto r = request::parse(root, out, why);
    if (r != Result::Parsed) {
        UW_WARN("[PARSER] Request rejected (" << to_string(r) << "): " << why);
        return lcr::err{RequestError{r, std::move(why)}};
    }
    return out;
}

} // namespace uiwire::parser
