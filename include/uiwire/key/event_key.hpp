#pragma once

#include <optional>
#include <string>
#include <utility>

#include "uiwire/symbol.hpp"
#include "uiwire/json/traits.hpp"
#include "uiwire/session/client.hpp"
#include "uiwire/session/error.hpp"
#include "lcr/result.hpp"
#include "lcr/log/logger.hpp"


namespace uiwire {

/*
===============================================================================
 EventKey<T>
===============================================================================

Path-bound identifier for events that carry a payload of type T.

T exists at compile time only: the wire carries the path, never a type tag.
A key created for one T and used to read an event produced for another type
will fail to deserialize at best and read garbage at worst. Keep the key and
the component that fires it in agreement.

Created from a Ui (Ui::event_key<T>()), embedded into component props as
{"eventPath":[...],"debugSymbol":...}, and tested against incoming events with
take_data(). Handlers typically try several keys per event; only the key whose
path matches may consume the payload, and only once.
===============================================================================
*/
template<typename T>
class EventKey {
public:
    explicit EventKey(EventPath path)
        : path_(std::move(path))
    {}

    // Cosmetic label for renderer-side diagnostics; no effect on matching
    [[nodiscard]]
    inline EventKey with_debug_symbol(std::string label) && {
        debug_symbol_ = std::move(label);
        return std::move(*this);
    }

    [[nodiscard]]
    inline EventKey with_debug_symbol(std::string label) const& {
        EventKey copy(*this);
        copy.debug_symbol_ = std::move(label);
        return copy;
    }

    [[nodiscard]] inline const EventPath& path() const noexcept { return path_; }
    [[nodiscard]] inline const std::optional<std::string>& debug_symbol() const noexcept { return debug_symbol_; }

    // Path test only (length + element-wise); never touches the payload
    [[nodiscard]]
    inline bool matches(const Client& client) const noexcept {
        return path_ == client.incoming_path();
    }

    // ---------------------------------------------------------------------
    // take_data
    // ---------------------------------------------------------------------
    // 1. path mismatch       → DifferingEventPaths (payload left in place)
    // 2. payload already gone → DataAlreadyTaken
    // 3. payload not a T      → FailedToDeserialize (payload is consumed)
    [[nodiscard]]
    lcr::result<T, TakeDataError> take_data(Client& client) const
        requires json::Readable<T>
    {
        if (!matches(client)) {
            return lcr::err{TakeDataError{TakeDataError::Code::DifferingEventPaths, path_, client.incoming_path(), {}}};
        }

        auto raw = client.take_event_data_();
        if (!raw) {
            UW_DEBUG("[KEY] Event data already taken for path " << to_string(path_));
            return lcr::err{TakeDataError{TakeDataError::Code::DataAlreadyTaken}};
        }

        T value{};
        std::string why;
        if (!json::from_text(raw->is_null() ? std::string_view("null") : std::string_view(raw->text), value, why)) {
            UW_DEBUG("[KEY] Event data for path " << to_string(path_) << " failed to deserialize: " << why);
            return lcr::err{TakeDataError{TakeDataError::Code::FailedToDeserialize, {}, {}, std::move(why)}};
        }
        return value;
    }

private:
    EventPath path_;
    std::optional<std::string> debug_symbol_;
};

} // namespace uiwire


namespace uiwire::json {

template<typename T>
struct Traits<EventKey<T>> {
    static void write(std::string& out, const EventKey<T>& key) {
        out += "{\"eventPath\":[";
        const auto& path = key.path();
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, path[i]);
        }
        out += "],";
        write_field(out, "debugSymbol", key.debug_symbol());
        out += '}';
    }
};

} // namespace uiwire::json
