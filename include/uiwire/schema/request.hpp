#pragma once

#include <string>
#include <vector>
#include <ostream>

#include "uiwire/symbol.hpp"
#include "uiwire/json/traits.hpp"


namespace uiwire::schema {

// -----------------------------
// One UI-originated event
// -----------------------------
// {"key":{"eventPath":[...]},"data":<any>}
struct RawEvent {
    EventPath path;
    json::Raw data;   // opaque payload, deserialized on demand by EventKey<T>
};

// -----------------------------
// Batch of events for one session
// -----------------------------
// {"sessionId":"...","events":[RawEvent, ...]}
struct Request {
    std::string session_id;
    std::vector<RawEvent> events;
};

std::ostream& operator<<(std::ostream&, const RawEvent&);

} // namespace uiwire::schema
