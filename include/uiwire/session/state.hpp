#pragma once

#include <optional>
#include <string>
#include <vector>

#include "uiwire/symbol.hpp"
#include "uiwire/json/traits.hpp"


namespace uiwire::session::detail {

/*
===============================================================================
Session state (OWNING STORE)
===============================================================================

Everything one incoming event can touch:
- event_path  → immutable for the state's lifetime
- event_data  → consumable at most once
- actions     → append-only log of serialized actions

Owned jointly by the SessionRoot and, while one is alive, its Client, so that
moving the root into a handler never invalidates the Client. Writes go through
the Client only; `client_active` enforces a single live Client.
===============================================================================
*/
struct State {
    EventPath event_path;
    std::optional<json::Raw> event_data;
    std::vector<std::string> actions;

    bool client_active = false;
    bool finalized = false;
};

} // namespace uiwire::session::detail
