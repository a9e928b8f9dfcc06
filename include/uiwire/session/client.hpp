#pragma once

#include <memory>
#include <optional>
#include <string>

#include "uiwire/scope.hpp"
#include "uiwire/session/state.hpp"
#include "uiwire/session/ui.hpp"
#include "uiwire/config/protocol.hpp"


namespace uiwire {

class SessionRoot;

/*
===============================================================================
 Client
===============================================================================

The single mutation handle of a SessionRoot.

  • obtained through SessionRoot::get_client(); at most one is alive per root
  • move-only; destroying it releases the slot
  • scope chain starts at the literal "main"
  • payload consumption and action emission happen exclusively through
    EventKey<T>::take_data() and ActionKey<T>::emit(), which are its friends
===============================================================================
*/
class Client {
public:
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    Client(Client&& other) noexcept
        : state_(std::move(other.state_))
        , scope_(std::move(other.scope_))
    {}

    Client& operator=(Client&& other) noexcept {
        if (this != &other) {
            release_();
            state_ = std::move(other.state_);
            scope_ = std::move(other.scope_);
        }
        return *this;
    }

    ~Client() {
        release_();
    }

    // Read-only view sharing this client's scope chain
    [[nodiscard]] inline Ui ui() const { return Ui(scope_); }

    // Path of the event being handled (empty for a moved-from client)
    [[nodiscard]] const EventPath& incoming_path() const noexcept;

    // True while the payload has not been consumed
    [[nodiscard]] bool has_event_data() const noexcept;

    // Number of actions logged so far for this event
    [[nodiscard]] std::size_t action_count() const noexcept;

private:
    friend class SessionRoot;
    template<typename> friend class EventKey;
    template<typename> friend class ActionKey;

    explicit Client(std::shared_ptr<session::detail::State> state)
        : state_(std::move(state))
        , scope_(config::protocol::CLIENT_SCOPE_ROOT)
    {
        state_->client_active = true;
    }

    // Moves the payload out (empty if already taken)
    [[nodiscard]] std::optional<json::Raw> take_event_data_() noexcept;

    // Appends one serialized action; dropped (and logged) once finalized
    void push_action_(std::string action);

    inline void release_() noexcept {
        if (state_) {
            state_->client_active = false;
            state_.reset();
        }
    }

private:
    std::shared_ptr<session::detail::State> state_;
    ScopeChain scope_;
};

} // namespace uiwire
