#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "uiwire/schema/request.hpp"
#include "uiwire/parser/result.hpp"
#include "lcr/result.hpp"

#include "simdjson.h"


namespace uiwire::parser {

/*
===============================================================================
 Request parsing
===============================================================================

Validates the transport shape of a request body:

  { "sessionId": "<string>",
    "events": [ { "key": { "eventPath": ["<string>", ...] }, "data": <any> }, ... ] }

A missing "data" reads as null. Unknown fields are ignored. Any deviation
rejects the whole request: no event of a malformed batch is ever dispatched.
===============================================================================
*/

struct RequestError {
    Result kind;          // InvalidJson or InvalidSchema
    std::string detail;   // what was wrong, e.g. "missing field `events`"
};

// "Invalid request body. <detail>"
std::ostream& operator<<(std::ostream& os, const RequestError& e);


struct request {
    // Parse an already-parsed DOM root into `out`. On failure `why` names the problem.
    [[nodiscard]]
    static Result parse(const simdjson::dom::element& root, schema::Request& out, std::string& why);
};


// Text entry point (owns its DOM parser)
[[nodiscard]]
lcr::result<schema::Request, RequestError> parse_request(std::string_view body);

} // namespace uiwire::parser
