#include "uiwire/codec/symbol.hpp"

#include <ostream>


namespace uiwire::codec {

namespace {

inline int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace


std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

bool from_hex(std::string_view text, std::vector<std::uint8_t>& out, std::string& why) {
    if (text.size() % 2 != 0) {
        why = "odd number of digits";
        return false;
    }
    out.clear();
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = hex_value(text[i]);
        const int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            const std::size_t bad = (hi < 0) ? i : i + 1;
            why = std::string("invalid character '") + text[bad] + "' at position " + std::to_string(bad);
            return false;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}


std::ostream& operator<<(std::ostream& os, const Error& e) {
    switch (e.code) {
        case Error::Code::MalformedHex:
            os << "failed to decode hex; " << e.message
               << "; the following text is what we tried to parse: " << e.input;
            break;
        case Error::Code::InvalidBytes:
            os << "failed to deserialize from raw bytes; " << e.message
               << "; the following bytes are what we tried to deserialize: [";
            for (std::size_t i = 0; i < e.bytes.size(); ++i) {
                if (i) os << ", ";
                os << static_cast<unsigned>(e.bytes[i]);
            }
            os << ']';
            break;
    }
    return os;
}

} // namespace uiwire::codec
