/*
===============================================================================
 PathCursor - Unit Tests
===============================================================================

Covered:
- Literal and typed segments read in order
- Exhausted path → NoSymbolsLeft
- Undecodable segment → InvalidSymbol, cursor not advanced
- Symbols produced through Ui::scope(codec::encode(...)) read back
===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

#include "uiwire/key/path_cursor.hpp"
#include "uiwire/key/event_key.hpp"
#include "uiwire/session/ui.hpp"
#include "common/test_check.hpp"

using namespace uiwire;


template<typename E>
static std::string describe(const E& e) {
    std::ostringstream os;
    os << e;
    return os.str();
}


void test_walk_mixed_path() {
    std::cout << "[TEST] Walk literal and typed segments\n";

    const EventPath path{"main", codec::encode<std::uint32_t>(7), "delete"};
    PathCursor cur(path);

    TEST_CHECK(cur.remaining() == 3);
    TEST_CHECK(cur.next_literal() == "main");

    auto row = cur.next<std::uint32_t>();
    TEST_CHECK(row.has_value());
    TEST_CHECK(row.value() == 7);

    TEST_CHECK(cur.next_literal() == "delete");
    TEST_CHECK(cur.at_end());
    TEST_CHECK(cur.next_literal().empty());

    std::cout << "[TEST] OK\n";
}

void test_no_symbols_left() {
    std::cout << "[TEST] Exhausted path\n";

    const EventPath path{"main"};
    PathCursor cur(path);
    TEST_CHECK(cur.next_literal() == "main");

    auto r = cur.next<std::uint32_t>();
    TEST_CHECK(r.has_error());
    TEST_CHECK(r.error().code == ParseError::Code::NoSymbolsLeft);
    TEST_CHECK(r.error().position == 1);
    TEST_CHECK(describe(r.error()).find("Ui::scope") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_invalid_symbol_does_not_advance() {
    std::cout << "[TEST] Invalid symbol leaves the cursor in place\n";

    const EventPath path{"main", "settings"};
    PathCursor cur(path);
    (void)cur.next_literal();

    auto r = cur.next<std::uint32_t>();
    TEST_CHECK(r.has_error());
    TEST_CHECK(r.error().code == ParseError::Code::InvalidSymbol);
    TEST_CHECK(r.error().position == 1);
    TEST_CHECK(r.error().cause.code == codec::Error::Code::MalformedHex);
    TEST_CHECK(describe(r.error()).find("failed to decode hex") != std::string::npos);

    TEST_CHECK(cur.position() == 1);
    TEST_CHECK(cur.next_literal() == "settings");

    std::cout << "[TEST] OK\n";
}

void test_reads_back_ui_symbols() {
    std::cout << "[TEST] Reads back symbols built through Ui::scope\n";

    const Ui ui(ScopeChain("main"));
    const std::string name = "row/with spaces";
    auto key = ui.scope("rows").scope(codec::encode(name)).scope("open").event_key<bool>();

    PathCursor cur(key.path());
    TEST_CHECK(cur.next_literal() == "main");
    TEST_CHECK(cur.next_literal() == "rows");
    auto decoded = cur.next<std::string>();
    TEST_CHECK(decoded.has_value());
    TEST_CHECK(decoded.value() == name);
    TEST_CHECK(cur.next_literal() == "open");
    TEST_CHECK(cur.at_end());

    std::cout << "[TEST] OK\n";
}


int main() {
    test_walk_mixed_path();
    test_no_symbols_left();
    test_invalid_symbol_does_not_advance();
    test_reads_back_ui_symbols();

    std::cout << "\n[PATH CURSOR TESTS PASSED]\n";
    return 0;
}
