/*
===============================================================================
 codec::encode / codec::decode - Unit Tests
===============================================================================

Scope:
------
Typed values ⇄ path-safe hex symbols.

Covered:
- Round trips for built-in and user types
- Exact byte layout (fixed-int little endian)
- Malformed hex
- Invalid byte sequences (short input, empty symbol)
- Bytes left over after the value are ignored
- Oversized length prefixes reported, never allocated
- Decoding with the wrong type (no type tag on the wire)
===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "uiwire/codec/symbol.hpp"
#include "common/test_check.hpp"

using namespace uiwire;


enum class Tab : std::uint8_t { Overview = 0, Settings = 2 };

struct RowId {
    std::uint32_t value = 0;
};

struct Cell {
    std::uint16_t row = 0;
    std::string column;
};

template<typename T>
static std::string describe(const lcr::result<T, codec::Error>& r) {
    std::ostringstream os;
    os << r.error();
    return os.str();
}

static bool is_path_safe(const Symbol& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return !s.empty();
}


// -----------------------------------------------------------------------------
// Round trips
// -----------------------------------------------------------------------------
void test_round_trip_builtin_types() {
    std::cout << "[TEST] Round trip (built-in types)\n";

    {
        auto r = codec::decode<std::uint32_t>(codec::encode<std::uint32_t>(42));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == 42);
    }
    {
        auto r = codec::decode<std::int64_t>(codec::encode<std::int64_t>(-7));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == -7);
    }
    {
        const std::string s = "héllo / world";
        auto sym = codec::encode(s);
        TEST_CHECK(is_path_safe(sym));
        auto r = codec::decode<std::string>(sym);
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == s);
    }
    {
        const std::vector<std::uint16_t> v{1, 2, 65535};
        auto r = codec::decode<std::vector<std::uint16_t>>(codec::encode(v));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == v);
    }
    {
        const std::optional<std::string> some{"x"};
        const std::optional<std::string> none{};
        auto a = codec::decode<std::optional<std::string>>(codec::encode(some));
        auto b = codec::decode<std::optional<std::string>>(codec::encode(none));
        TEST_CHECK(a.has_value() && a.value() == some);
        TEST_CHECK(b.has_value() && !b.value().has_value());
    }
    {
        const std::pair<std::uint8_t, std::string> p{3, "row"};
        auto r = codec::decode<std::pair<std::uint8_t, std::string>>(codec::encode(p));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == p);
    }
    {
        auto r = codec::decode<double>(codec::encode(2.5));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == 2.5);
    }
    {
        auto r = codec::decode<Tab>(codec::encode(Tab::Settings));
        TEST_CHECK(r.has_value());
        TEST_CHECK(r.value() == Tab::Settings);
    }

    std::cout << "[TEST] OK\n";
}

void test_round_trip_user_type() {
    std::cout << "[TEST] Round trip (user aggregates)\n";

    auto sym = codec::encode(RowId{1234});
    TEST_CHECK(sym == codec::encode<std::uint32_t>(1234));

    auto r = codec::decode<RowId>(sym);
    TEST_CHECK(r.has_value());
    TEST_CHECK(r.value().value == 1234);

    // Fields in declaration order, no framing
    const Cell cell{7, "name"};
    TEST_CHECK_EQ(codec::encode(cell), codec::encode<std::uint16_t>(7) + codec::encode(std::string("name")));

    auto c = codec::decode<Cell>(codec::encode(cell));
    TEST_CHECK(c.has_value());
    TEST_CHECK(c.value().row == 7);
    TEST_CHECK(c.value().column == "name");

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Wire layout
// -----------------------------------------------------------------------------
void test_exact_layout() {
    std::cout << "[TEST] Exact byte layout\n";

    TEST_CHECK_EQ(codec::encode<std::uint32_t>(1), std::string("01000000"));
    TEST_CHECK_EQ(codec::encode<std::int16_t>(-1), std::string("ffff"));
    TEST_CHECK_EQ(codec::encode(true), std::string("01"));
    TEST_CHECK_EQ(codec::encode(std::string("ab")), std::string("02000000000000006162"));
    TEST_CHECK_EQ(codec::encode(std::optional<std::uint8_t>{}), std::string("00"));
    TEST_CHECK_EQ(codec::encode(std::optional<std::uint8_t>{9}), std::string("0109"));

    // Upper case digits are accepted on input
    auto r = codec::decode<std::uint32_t>("FF000000");
    TEST_CHECK(r.has_value());
    TEST_CHECK(r.value() == 255);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------
void test_malformed_hex() {
    std::cout << "[TEST] Malformed hex\n";

    {
        auto r = codec::decode<std::uint32_t>("zz000000");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::MalformedHex);
        TEST_CHECK(r.error().input == "zz000000");
        const auto text = describe(r);
        TEST_CHECK(text.find("failed to decode hex") != std::string::npos);
        TEST_CHECK(text.find("zz000000") != std::string::npos);
    }
    {
        auto r = codec::decode<std::uint8_t>("abc");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::MalformedHex);
    }
    {
        // A literal segment such as "main" is not a symbol
        auto r = codec::decode<std::uint32_t>("main");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::MalformedHex);
    }

    std::cout << "[TEST] OK\n";
}

void test_invalid_bytes() {
    std::cout << "[TEST] Invalid bytes\n";

    {
        // Too short for a u32
        auto r = codec::decode<std::uint32_t>("0100");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::InvalidBytes);
        TEST_CHECK((r.error().bytes == std::vector<std::uint8_t>{1, 0}));
        TEST_CHECK(describe(r).find("failed to deserialize from raw bytes") != std::string::npos);
        TEST_CHECK(describe(r).find("[1, 0]") != std::string::npos);
    }
    {
        // Empty symbol decodes nothing
        auto r = codec::decode<std::uint8_t>("");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::InvalidBytes);
    }

    std::cout << "[TEST] OK\n";
}

void test_trailing_bytes_ignored() {
    std::cout << "[TEST] Bytes after the value are ignored\n";

    auto r = codec::decode<std::uint8_t>("0100");
    TEST_CHECK(r.has_value());
    TEST_CHECK(r.value() == 1);

    std::cout << "[TEST] OK\n";
}

void test_huge_length_prefix() {
    std::cout << "[TEST] Huge length prefix\n";

    {
        auto r = codec::decode<std::string>("ffffffffffffffff61");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::InvalidBytes);
    }
    {
        auto r = codec::decode<std::vector<std::uint64_t>>("ffffffffffffff7f");
        TEST_CHECK(r.has_error());
        TEST_CHECK(r.error().code == codec::Error::Code::InvalidBytes);
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Wrong type: the symbol carries no type tag
// -----------------------------------------------------------------------------
void test_wrong_type_is_not_detected() {
    std::cout << "[TEST] Decoding with the wrong type\n";

    const auto sym = codec::encode<std::uint32_t>(0x01020304u);

    // Same width: "succeeds" with a reinterpretation
    auto as_i32 = codec::decode<std::int32_t>(sym);
    TEST_CHECK(as_i32.has_value());
    TEST_CHECK(as_i32.value() == 0x01020304);

    auto as_pair = codec::decode<std::pair<std::uint16_t, std::uint16_t>>(sym);
    TEST_CHECK(as_pair.has_value());
    TEST_CHECK(as_pair.value().first == 0x0304);
    TEST_CHECK(as_pair.value().second == 0x0102);

    // Narrower: reads the low bytes, the rest is left over
    auto as_u16 = codec::decode<std::uint16_t>(sym);
    TEST_CHECK(as_u16.has_value());
    TEST_CHECK(as_u16.value() == 0x0304);

    // Wider: reported, never a crash
    TEST_CHECK(codec::decode<std::uint64_t>(sym).has_error());
    TEST_CHECK(codec::decode<std::string>(sym).has_error());

    std::cout << "[TEST] OK\n";
}


int main() {
    test_round_trip_builtin_types();
    test_round_trip_user_type();
    test_exact_layout();
    test_malformed_hex();
    test_invalid_bytes();
    test_trailing_bytes_ignored();
    test_huge_length_prefix();
    test_wrong_type_is_not_detected();

    std::cout << "\n[SYMBOL CODEC TESTS PASSED]\n";
    return 0;
}
