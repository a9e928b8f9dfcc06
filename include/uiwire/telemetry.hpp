#pragma once

#include <cstdint>
#include <ostream>


namespace uiwire::telemetry {

// ============================================================================
// Dispatcher Telemetry
//
// Mechanical facts about request handling. Plain counters: a Dispatcher is
// driven from one thread, readers take a copy_to() snapshot on that thread.
// ============================================================================
struct Dispatcher {
    // Request bodies received
    std::uint64_t requests_total = 0;

    // Request bodies rejected before any event was dispatched
    std::uint64_t requests_rejected_total = 0;

    // Events handed to the application handler
    std::uint64_t events_total = 0;

    // Handler invocations that returned an error (one root_error each)
    std::uint64_t handler_failures_total = 0;

    // Actions written to responses (root_error actions included)
    std::uint64_t actions_total = 0;

    inline void copy_to(Dispatcher& other) const noexcept {
        other = *this;
    }

    inline void reset() noexcept {
        *this = Dispatcher{};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Dispatcher& t) {
    os << "[Telemetry] {requests=" << t.requests_total
       << ", rejected=" << t.requests_rejected_total
       << ", events=" << t.events_total
       << ", handler_failures=" << t.handler_failures_total
       << ", actions=" << t.actions_total
       << "}";
    return os;
}

} // namespace uiwire::telemetry
