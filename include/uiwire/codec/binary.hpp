#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <alpaca/alpaca.h>


/*
================================================================================
Compact Binary Form (Symbol payloads)
================================================================================

Typed values are turned into bytes by alpaca with fixed-length encoding, which
lines up with bincode's fixed-int little-endian layout for the common cases:

  • integers      → little-endian, declared width
  • bool          → one byte
  • float/double  → IEEE-754 bit pattern, little-endian
  • enums         → underlying type, little-endian
  • string        → u64 byte length + bytes
  • vector<T>     → u64 element count + elements
  • optional<T>   → one byte presence flag + value
  • aggregates    → fields in declaration order, no framing

No type tag is written. Decoding bytes with a type other than the one used to
encode them may succeed with garbage; it never crashes. Bytes left over after
the value has been read are ignored.

Any aggregate alpaca can see through works as a symbol payload, no
registration needed:

    struct RowId { std::uint32_t value; };
    auto sym = codec::encode(RowId{7});     // "07000000"
================================================================================
*/

namespace uiwire::codec {

inline constexpr auto BINARY_OPTIONS = alpaca::options::fixed_length_encoding;

// Top-level values go through a one-field wrapper so scalars and aggregates
// take the same path through alpaca
template<typename T>
struct Wrapper {
    T obj;
};

template<typename T>
concept Encodable =
    std::is_default_constructible_v<T> &&
    !std::is_pointer_v<T> &&
    !std::is_reference_v<T>;


template<Encodable T>
[[nodiscard]]
inline std::vector<std::uint8_t> to_bytes(const T& value) {
    Wrapper<T> wrapper{value};
    std::vector<std::uint8_t> bytes;
    (void)alpaca::serialize<BINARY_OPTIONS, Wrapper<T>, 1>(wrapper, bytes);
    return bytes;
}

// Returns false (and describes the problem in `why`) when the bytes do not
// hold a T
template<Encodable T>
[[nodiscard]]
inline bool from_bytes(std::vector<std::uint8_t>& bytes, T& out, std::string& why) {
    if (bytes.empty()) {
        why = "no bytes to read";
        return false;
    }
    try {
        std::error_code ec;
        auto wrapper = alpaca::deserialize<BINARY_OPTIONS, Wrapper<T>, 1>(bytes, ec);
        if (ec) {
            why = ec.message();
            return false;
        }
        out = std::move(wrapper.obj);
        return true;
    } catch (const std::exception& e) {
        // Absurd length prefixes surface as allocation failures
        why = e.what();
        return false;
    }
}

} // namespace uiwire::codec
