#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>


namespace uiwire::codec {

/*
===============================================================================
 codec::Error
===============================================================================

Failure to turn a path symbol back into a value. Both kinds carry the input
that could not be recovered:

- MalformedHex  → the symbol text is not a valid hex rendering (text in `input`)
- InvalidBytes  → the bytes are not a valid encoding of the requested type
                  (bytes in `bytes`)

Symbols are renderer-controlled. Callers treat any codec error as
"route not found", never as a fatal condition.
===============================================================================
*/
struct Error {
    enum class Code : std::uint8_t {
        MalformedHex,
        InvalidBytes
    };

    Code code;
    std::string input;               // offending symbol text (MalformedHex)
    std::vector<std::uint8_t> bytes; // offending bytes (InvalidBytes)
    std::string message;             // low-level detail
};

inline constexpr std::string_view to_string(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::MalformedHex: return "MalformedHex";
        case Error::Code::InvalidBytes: return "InvalidBytes";
        default:                        return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const Error& e);

} // namespace uiwire::codec
