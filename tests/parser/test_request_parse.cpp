#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "uiwire/parser/request.hpp"
#include "common/test_check.hpp"
#include "common/json_helpers.hpp"

using namespace uiwire;

/*
================================================================================
Request Parser - Unit Tests
================================================================================

These tests validate the transport-shape validation of request bodies.

Design goals enforced by this test suite:
  • Required fields (sessionId, events, key.eventPath, data) are enforced
  • An explicit null "data" is a payload; payloads are kept as minified JSON
  • Unknown fields are ignored
  • Any malformed event rejects the whole request
  • No exceptions on malformed input
================================================================================
*/

static std::string describe(const parser::RequestError& e) {
    std::ostringstream os;
    os << e;
    return os.str();
}

// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_request_valid() {
    std::cout << "[TEST] Request (valid, two events)..." << std::endl;

    const std::string body = helpers::request("s-1", {
        helpers::event(R"(["main","counter","increment"])", R"({ "by" : 2 })"),
        helpers::event(R"(["root_app_ready"])")
    });

    auto r = parser::parse_request(body);
    TEST_CHECK(r.has_value());

    const auto& req = r.value();
    TEST_CHECK(req.session_id == "s-1");
    TEST_CHECK(req.events.size() == 2);
    TEST_CHECK((req.events[0].path == EventPath{"main", "counter", "increment"}));
    TEST_CHECK(req.events[0].data.text == R"({"by":2})");
    TEST_CHECK((req.events[1].path == EventPath{"root_app_ready"}));
    TEST_CHECK(req.events[1].data.text == "null");
    TEST_CHECK(req.events[1].data.is_null());

    std::cout << "[TEST] OK\n";
}

void test_request_unknown_fields_ignored() {
    std::cout << "[TEST] Request (unknown fields ignored)..." << std::endl;

    constexpr std::string_view body = R"json(
    {
        "sessionId": "abc",
        "protocol": 3,
        "events": [
            { "key": { "eventPath": ["main"], "debugSymbol": "x" }, "data": [1, 2], "ts": 17 }
        ]
    }
    )json";

    auto r = parser::parse_request(body);
    TEST_CHECK(r.has_value());
    TEST_CHECK(r.value().events.size() == 1);
    TEST_CHECK(r.value().events[0].data.text == "[1,2]");

    std::cout << "[TEST] OK\n";
}

void test_request_empty_events() {
    std::cout << "[TEST] Request (empty events, empty path)..." << std::endl;

    auto r = parser::parse_request(R"({"sessionId":"","events":[]})");
    TEST_CHECK(r.has_value());
    TEST_CHECK(r.value().events.empty());

    // An empty path is structurally valid; mount detection reports it later
    auto e = parser::parse_request(R"({"sessionId":"s","events":[{"key":{"eventPath":[]},"data":null}]})");
    TEST_CHECK(e.has_value());
    TEST_CHECK(e.value().events[0].path.empty());

    std::cout << "[TEST] OK\n";
}

void test_request_parse_from_dom() {
    std::cout << "[TEST] Request (DOM entry point)..." << std::endl;

    constexpr std::string_view json = R"({"sessionId":"dom","events":[{"key":{"eventPath":["a","b"]},"data":"x"}]})";

    simdjson::dom::parser p;
    simdjson::dom::element root;
    TEST_CHECK(!p.parse(json.data(), json.size()).get(root));

    schema::Request req;
    std::string why;
    TEST_CHECK(parser::request::parse(root, req, why) == parser::Result::Parsed);
    TEST_CHECK(req.session_id == "dom");
    TEST_CHECK(req.events[0].data.text == "\"x\"");

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// NEGATIVE CASES
// ------------------------------------------------------------

void test_request_invalid_json() {
    std::cout << "[TEST] Request (invalid JSON)..." << std::endl;

    auto r = parser::parse_request(R"({"sessionId": "s", "events": [)");
    TEST_CHECK(r.has_error());
    TEST_CHECK(r.error().kind == parser::Result::InvalidJson);
    TEST_CHECK(describe(r.error()).rfind("Invalid request body. ", 0) == 0);

    auto empty = parser::parse_request("");
    TEST_CHECK(empty.has_error());
    TEST_CHECK(empty.error().kind == parser::Result::InvalidJson);

    std::cout << "[TEST] OK\n";
}

void test_request_missing_events() {
    std::cout << "[TEST] Request (missing events)..." << std::endl;

    auto r = parser::parse_request(R"({"sessionId":"s"})");
    TEST_CHECK(r.has_error());
    TEST_CHECK(r.error().kind == parser::Result::InvalidSchema);
    TEST_CHECK_EQ(describe(r.error()),
                  std::string("Invalid request body. missing or invalid field `events`, expected a sequence"));

    auto wrong = parser::parse_request(R"({"sessionId":"s","events":{}})");
    TEST_CHECK(wrong.has_error());
    TEST_CHECK(wrong.error().kind == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

void test_request_invalid_session_id() {
    std::cout << "[TEST] Request (invalid sessionId)..." << std::endl;

    auto missing = parser::parse_request(R"({"events":[]})");
    TEST_CHECK(missing.has_error());
    TEST_CHECK(missing.error().detail.find("sessionId") != std::string::npos);

    auto number = parser::parse_request(R"({"sessionId":7,"events":[]})");
    TEST_CHECK(number.has_error());
    TEST_CHECK(number.error().detail.find("sessionId") != std::string::npos);

    auto array = parser::parse_request(R"([1,2,3])");
    TEST_CHECK(array.has_error());
    TEST_CHECK(array.error().kind == parser::Result::InvalidSchema);
    TEST_CHECK(array.error().detail.find("expected struct") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_request_invalid_event() {
    std::cout << "[TEST] Request (one bad event rejects the batch)..." << std::endl;

    {
        const std::string body = helpers::request("s", {
            helpers::event(R"(["main","ok"])", "1"),
            R"({"data":1})"
        });
        auto r = parser::parse_request(body);
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().detail.rfind("events[1]: ", 0) == 0);
        TEST_CHECK(r.error().detail.find("`key`") != std::string::npos);
    }
    {
        const std::string body = helpers::request("s", {helpers::event(R"(["main",3])", "1")});
        auto r = parser::parse_request(body);
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().detail.find("`eventPath`") != std::string::npos);
    }
    {
        const std::string body = helpers::request("s", {helpers::event(R"("main")", "1")});
        auto r = parser::parse_request(body);
        TEST_CHECK(r.has_error());
    }
    {
        const std::string body = helpers::request("s", {"42"});
        auto r = parser::parse_request(body);
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().detail.find("events[0]") != std::string::npos);
    }

    std::cout << "[TEST] OK\n";
}

void test_request_missing_data() {
    std::cout << "[TEST] Request (event without data rejects the batch)..." << std::endl;

    const std::string body = helpers::request("s", {
        helpers::event(R"(["main","ok"])", "1"),
        R"({"key":{"eventPath":["main"]}})"
    });
    auto r = parser::parse_request(body);
    TEST_CHECK(r.has_error());
    TEST_CHECK(r.error().kind == parser::Result::InvalidSchema);
    TEST_CHECK_EQ(r.error().detail, std::string("events[1]: missing field `data`"));

    // Explicit null is a payload
    auto null_data = parser::parse_request(R"({"sessionId":"s","events":[{"key":{"eventPath":["main"]},"data":null}]})");
    TEST_CHECK(null_data.has_value());
    TEST_CHECK(null_data.value().events[0].data.is_null());

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_request_valid();
    test_request_unknown_fields_ignored();
    test_request_empty_events();
    test_request_parse_from_dom();
    test_request_invalid_json();
    test_request_missing_events();
    test_request_invalid_session_id();
    test_request_invalid_event();
    test_request_missing_data();

    std::cout << "\n[ALL REQUEST PARSER TESTS PASSED]\n";
    return 0;
}
