#pragma once

#include <memory>
#include <optional>
#include <string>

#include "uiwire/symbol.hpp"
#include "uiwire/config/protocol.hpp"
#include "uiwire/json/traits.hpp"
#include "uiwire/schema/request.hpp"
#include "uiwire/schema/response.hpp"
#include "uiwire/schema/mount.hpp"
#include "uiwire/session/state.hpp"
#include "uiwire/session/client.hpp"
#include "uiwire/session/error.hpp"
#include "lcr/result.hpp"
#include "lcr/log/logger.hpp"


namespace uiwire {

/*
===============================================================================
 SessionRoot
===============================================================================

Per-event state handed to the application handler. Lifecycle:

  Created    → holds one unconsumed RawEvent
  Active     → a Client has been acquired; take_data / emit / scope derivation
  Finalized  → into_response() extracted the action log; nothing else is valid

One SessionRoot exists per event being processed and lives for exactly one
handler invocation. The Dispatcher folds its response into the request's
response only after the handler completed, so an abandoned handler never
leaves partial actions behind.
===============================================================================
*/
class SessionRoot {
public:
    [[nodiscard]]
    static SessionRoot from_event(schema::RawEvent event);

    SessionRoot(SessionRoot&&) noexcept = default;
    SessionRoot& operator=(SessionRoot&&) noexcept = default;
    SessionRoot(const SessionRoot&) = delete;
    SessionRoot& operator=(const SessionRoot&) = delete;

    // -----------------------------------------------------------------------
    // Client acquisition
    // -----------------------------------------------------------------------
    // Empty while another Client is alive, or after finalization.
    [[nodiscard]]
    std::optional<Client> get_client();

    // -----------------------------------------------------------------------
    // Mount handshake
    // -----------------------------------------------------------------------
    // Looks at the first path segment only:
    //   none                → EmptyEventPath
    //   "root_app_ready"    → consumes the payload as MountData
    //   anything else       → std::nullopt, payload left for normal routing
    [[nodiscard]]
    lcr::result<std::optional<schema::MountData>, MountError> take_mount_event();

    // -----------------------------------------------------------------------
    // Root UI
    // -----------------------------------------------------------------------
    // Appends a ["root_mount"] action carrying the component reference.
    // Repeated calls append repeatedly. Returns false (nothing appended) while a
    // Client is alive or after finalization.
    template<json::Writable C>
    [[nodiscard]]
    bool set_root_ui(const C& component) {
        if (!writable_("set_root_ui")) {
            return false;
        }
        state_->actions.push_back(schema::make_action(
            EventPath{Symbol(config::protocol::ROOT_MOUNT_SYMBOL)}, std::nullopt, component));
        return true;
    }

    // -----------------------------------------------------------------------
    // Finalization (terminal)
    // -----------------------------------------------------------------------
    [[nodiscard]]
    schema::Response into_response() &&;

    [[nodiscard]] const EventPath& event_path() const noexcept;
    [[nodiscard]] bool has_event_data() const noexcept;
    [[nodiscard]] bool finalized() const noexcept;

private:
    explicit SessionRoot(std::shared_ptr<session::detail::State> state) noexcept
        : state_(std::move(state))
    {}

    [[nodiscard]] bool writable_(const char* op) const;

private:
    std::shared_ptr<session::detail::State> state_;
};

} // namespace uiwire
