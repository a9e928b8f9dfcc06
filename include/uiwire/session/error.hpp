#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "uiwire/symbol.hpp"


namespace uiwire {

/*
===============================================================================
 Session-level errors
===============================================================================

TakeDataError → EventKey<T>::take_data() contract results. Handlers routinely
                test several keys against one event, so DifferingEventPaths is
                an expected outcome, not a fault.

MountError    → SessionRoot::take_mount_event() results, surfaced to the
                bootstrap code. Typically fatal for session start.
===============================================================================
*/

struct TakeDataError {
    enum class Code : std::uint8_t {
        DifferingEventPaths,   // key path != incoming path; payload untouched
        DataAlreadyTaken,      // payload consumed earlier during this event
        FailedToDeserialize    // payload is not a valid T
    };

    Code code;
    EventPath existing{};      // key path (DifferingEventPaths)
    EventPath incoming{};      // event path (DifferingEventPaths)
    std::string message{};     // deserializer detail (FailedToDeserialize)
};

inline constexpr std::string_view to_string(TakeDataError::Code code) noexcept {
    switch (code) {
        case TakeDataError::Code::DifferingEventPaths: return "DifferingEventPaths";
        case TakeDataError::Code::DataAlreadyTaken:    return "DataAlreadyTaken";
        case TakeDataError::Code::FailedToDeserialize: return "FailedToDeserialize";
        default:                                       return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const TakeDataError& e);


struct MountError {
    enum class Code : std::uint8_t {
        EmptyEventPath,                 // event path has no first segment
        NoEventData,                    // mount event without payload
        FailedToDeserializeMountData,   // payload is not {token: string|null}
        ClientActive                    // a Client currently owns the payload
    };

    Code code;
    std::string message{};     // deserializer detail (FailedToDeserializeMountData)
};

inline constexpr std::string_view to_string(MountError::Code code) noexcept {
    switch (code) {
        case MountError::Code::EmptyEventPath:               return "EmptyEventPath";
        case MountError::Code::NoEventData:                  return "NoEventData";
        case MountError::Code::FailedToDeserializeMountData: return "FailedToDeserializeMountData";
        case MountError::Code::ClientActive:                 return "ClientActive";
        default:                                             return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const MountError& e);

} // namespace uiwire
