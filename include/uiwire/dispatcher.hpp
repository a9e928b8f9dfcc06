#pragma once

#include <functional>
#include <future>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "uiwire/config/protocol.hpp"
#include "uiwire/parser/request.hpp"
#include "uiwire/schema/request.hpp"
#include "uiwire/schema/response.hpp"
#include "uiwire/session/root.hpp"
#include "uiwire/telemetry.hpp"
#include "lcr/result.hpp"
#include "lcr/log/logger.hpp"


namespace uiwire {

// Error types a handler may return: anything printable
template<typename E>
concept Displayable = requires(std::ostream& os, const E& e) {
    { os << e };
};

namespace detail {

template<typename X>
struct handler_result : std::false_type {};

template<typename E>
struct handler_result<lcr::result<schema::Response, E>> : std::true_type {
    using error_type = E;
};

// Synchronous handlers return the outcome directly; asynchronous ones return a future of it
template<typename R>
struct outcome_of {
    using type = R;
    static constexpr bool is_async = false;
};

template<typename R>
struct outcome_of<std::future<R>> {
    using type = R;
    static constexpr bool is_async = true;
};

} // namespace detail


// Handler contract:  (const std::string& session_id, SessionRoot) ->
//                        lcr::result<schema::Response, E>
//                     or std::future<lcr::result<schema::Response, E>>
template<typename H>
concept EventHandler =
    std::is_invocable_v<H&, const std::string&, SessionRoot&&> &&
    detail::handler_result<
        typename detail::outcome_of<std::invoke_result_t<H&, const std::string&, SessionRoot&&>>::type
    >::value &&
    Displayable<typename detail::handler_result<
        typename detail::outcome_of<std::invoke_result_t<H&, const std::string&, SessionRoot&&>>::type
    >::error_type>;


/*
===============================================================================
 Dispatcher
===============================================================================

Drives one request body through the application handler.

  1) Parse + validate the body. On failure the whole response is a single
     ["root_error"] action ("Invalid request body. <detail>"); the handler is
     never invoked.
  2) For each event, strictly in order: build a fresh SessionRoot, invoke the
     handler, wait for it to complete, then
       • success → append the handler's action log
       • failure → append one ["root_error"] action with the error text
     and move on. One event's failure never drops or blocks the others.
  3) Return the concatenated actions.

Events of one request are never handled concurrently: response order is a
hard contract and SessionRoot state is single-writer. The only suspension
point is waiting on an asynchronous handler's future; its actions are merged
only after it resolves, so nothing is ever partially committed.

Not thread safe. Use one Dispatcher per thread.
===============================================================================
*/
class Dispatcher {
public:
    template<EventHandler Handler>
    [[nodiscard]]
    schema::Response dispatch(std::string_view body, Handler&& handler) {
        ++telemetry_.requests_total;

        auto parsed = parser::parse_request(body);
        if (!parsed) {
            ++telemetry_.requests_rejected_total;
            ++telemetry_.actions_total;
            const std::string text = display_(parsed.error());
            UW_WARN("[DISPATCH] " << text);
            schema::Response response;
            response.actions.push_back(schema::make_reserved_action(config::protocol::ROOT_ERROR_SYMBOL, text));
            return response;
        }

        schema::Request request = std::move(parsed).value();
        UW_DEBUG("[DISPATCH] Session " << request.session_id << ": " << request.events.size() << " event(s)");

        schema::Response response;
        std::size_t failures = 0;
        for (auto& event : request.events) {
            ++telemetry_.events_total;
            UW_TRACE("[DISPATCH] -> " << event);

            schema::Response event_response;
            if (!run_handler_(request.session_id, std::move(event), handler, event_response)) {
                ++failures;
            }
            telemetry_.actions_total += event_response.size();
            response.append(std::move(event_response));
        }

        UW_DEBUG("[DISPATCH] Session " << request.session_id << ": " << response.size()
                 << " action(s), " << failures << " failed event(s)");
        return response;
    }

    // Text in, text out (JSON array of actions)
    template<EventHandler Handler>
    [[nodiscard]]
    std::string handle_request(std::string_view body, Handler&& handler) {
        return dispatch(body, std::forward<Handler>(handler)).to_json();
    }

    [[nodiscard]] inline const telemetry::Dispatcher& telemetry() const noexcept { return telemetry_; }

private:
    template<typename T>
    [[nodiscard]]
    static std::string display_(const T& value) {
        std::ostringstream os;
        os << value;
        return os.str();
    }

    // Returns false when the handler failed (out then holds the root_error action)
    template<typename Handler>
    bool run_handler_(const std::string& session_id, schema::RawEvent event, Handler& handler, schema::Response& out) {
        using Invoked = std::invoke_result_t<Handler&, const std::string&, SessionRoot&&>;
        using Outcome = typename detail::outcome_of<Invoked>::type;

        const EventPath path = event.path;
        auto fail = [&](const std::string& text) {
            ++telemetry_.handler_failures_total;
            UW_WARN("[DISPATCH] Handler failed for event " << to_string(path) << ": " << text);
            out.actions.clear();
            out.actions.push_back(schema::make_reserved_action(config::protocol::ROOT_ERROR_SYMBOL, text));
            return false;
        };

        auto root = SessionRoot::from_event(std::move(event));

        if constexpr (detail::outcome_of<Invoked>::is_async) {
            std::future<Outcome> pending = std::invoke(handler, session_id, std::move(root));
            if (!pending.valid()) {
                return fail("handler returned a future without shared state");
            }
            Outcome outcome = pending.get();
            if (!outcome) {
                return fail(display_(outcome.error()));
            }
            out = std::move(outcome).value();
        } else {
            Outcome outcome = std::invoke(handler, session_id, std::move(root));
            if (!outcome) {
                return fail(display_(outcome.error()));
            }
            out = std::move(outcome).value();
        }
        return true;
    }

private:
    telemetry::Dispatcher telemetry_;
};


// Free-function form for one-shot use
template<EventHandler Handler>
[[nodiscard]]
inline std::string handle_request(std::string_view body, Handler&& handler) {
    Dispatcher dispatcher;
    return dispatcher.handle_request(body, std::forward<Handler>(handler));
}

} // namespace uiwire
