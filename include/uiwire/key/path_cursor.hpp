#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

#include "uiwire/symbol.hpp"
#include "uiwire/codec/symbol.hpp"
#include "lcr/result.hpp"


namespace uiwire {

// -----------------------------------------------------------------------------
// ParseError: failure to read the next symbol of an incoming path
// -----------------------------------------------------------------------------
struct ParseError {
    enum class Code : std::uint8_t {
        NoSymbolsLeft,    // path exhausted (often a missing Ui::scope() on the building side)
        InvalidSymbol     // segment is not a valid encoding of the requested type
    };

    Code code;
    std::size_t position = 0;   // index of the offending segment
    codec::Error cause{};       // InvalidSymbol only
};

std::ostream& operator<<(std::ostream& os, const ParseError& e);


/*
===============================================================================
 PathCursor
===============================================================================

Walks an incoming event path one symbol at a time, for handlers that route on
dynamic segments (e.g. the index of a list row) instead of pre-built keys:

    PathCursor cur(client.incoming_path());
    if (cur.next_literal() != "main") return not_found();
    auto row = cur.next<std::uint32_t>();
    if (!row) return not_found();        // renderer-controlled: never fatal

Segments are renderer-controlled input; every failure is a typed result.
===============================================================================
*/
class PathCursor {
public:
    explicit PathCursor(const EventPath& path) noexcept
        : path_(&path)
    {}

    [[nodiscard]] inline std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] inline std::size_t remaining() const noexcept { return path_->size() - pos_; }
    [[nodiscard]] inline bool at_end() const noexcept { return pos_ >= path_->size(); }

    // Raw next segment (empty view when exhausted)
    [[nodiscard]]
    inline std::string_view next_literal() noexcept {
        if (at_end()) {
            return {};
        }
        return (*path_)[pos_++];
    }

    // Next segment decoded as S. The cursor advances only on success.
    template<codec::Encodable S>
    [[nodiscard]]
    lcr::result<S, ParseError> next() {
        if (at_end()) {
            return lcr::err{ParseError{ParseError::Code::NoSymbolsLeft, pos_}};
        }
        auto decoded = codec::decode<S>((*path_)[pos_]);
        if (!decoded) {
            return lcr::err{ParseError{ParseError::Code::InvalidSymbol, pos_, std::move(decoded).error()}};
        }
        ++pos_;
        return std::move(decoded).value();
    }

private:
    const EventPath* path_;
    std::size_t pos_ = 0;
};

} // namespace uiwire
