#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "uiwire/symbol.hpp"
#include "uiwire/codec/binary.hpp"
#include "uiwire/codec/error.hpp"
#include "lcr/result.hpp"


namespace uiwire::codec {

// -----------------------------------------------------------------------------
// Hex rendering (lowercase on output, either case accepted on input)
// -----------------------------------------------------------------------------
[[nodiscard]]
std::string to_hex(const std::vector<std::uint8_t>& bytes);

// Returns false (and describes the problem in `why`) on odd length or a non-hex digit
[[nodiscard]]
bool from_hex(std::string_view text, std::vector<std::uint8_t>& out, std::string& why);


// -----------------------------------------------------------------------------
// encode: value → path-safe symbol
// -----------------------------------------------------------------------------
template<Encodable S>
[[nodiscard]]
inline Symbol encode(const S& value) {
    return to_hex(to_bytes(value));
}

// -----------------------------------------------------------------------------
// decode: symbol → value
//
// S must be the type the symbol was encoded with. The symbol carries no type
// tag, so a foreign type may decode "successfully" into garbage; invalid
// input of any kind yields an Error, never a crash.
// -----------------------------------------------------------------------------
template<Encodable S>
[[nodiscard]]
inline lcr::result<S, Error> decode(std::string_view symbol) {
    std::vector<std::uint8_t> bytes;
    std::string why;
    if (!from_hex(symbol, bytes, why)) {
        return lcr::err{Error{Error::Code::MalformedHex, std::string(symbol), {}, std::move(why)}};
    }

    S value{};
    std::string message;
    if (!from_bytes(bytes, value, message)) {
        return lcr::err{Error{Error::Code::InvalidBytes, {}, std::move(bytes), std::move(message)}};
    }
    return value;
}

} // namespace uiwire::codec
