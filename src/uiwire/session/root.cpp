#include "uiwire/session/root.hpp"


namespace uiwire {

namespace {

const EventPath EMPTY_PATH{};

} // namespace


// ============================================================================
// Client
// ============================================================================

const EventPath& Client::incoming_path() const noexcept {
    return state_ ? state_->event_path : EMPTY_PATH;
}

bool Client::has_event_data() const noexcept {
    return state_ && state_->event_data.has_value();
}

std::size_t Client::action_count() const noexcept {
    return state_ ? state_->actions.size() : 0;
}

std::optional<json::Raw> Client::take_event_data_() noexcept {
    if (!state_ || state_->finalized) {
        return std::nullopt;
    }
    std::optional<json::Raw> data = std::move(state_->event_data);
    state_->event_data.reset();
    return data;
}

void Client::push_action_(std::string action) {
    if (!state_) {
        UW_ERROR("[SESSION] Action emitted through a moved-from client -> dropped.");
        return;
    }
    if (state_->finalized) {
        UW_ERROR("[SESSION] Action emitted after the session root was finalized -> dropped. Path: "
                 << to_string(state_->event_path));
        return;
    }
    state_->actions.push_back(std::move(action));
}


// ============================================================================
// SessionRoot
// ============================================================================

SessionRoot SessionRoot::from_event(schema::RawEvent event) {
    auto state = std::make_shared<session::detail::State>();
    state->event_path = std::move(event.path);
    state->event_data = std::move(event.data);
    return SessionRoot(std::move(state));
}

std::optional<Client> SessionRoot::get_client() {
    if (!state_ || state_->finalized) {
        UW_ERROR("[SESSION] get_client() called on a finalized session root.");
        return std::nullopt;
    }
    if (state_->client_active) {
        UW_WARN("[SESSION] get_client() called while another client is alive -> refused. Path: "
                << to_string(state_->event_path));
        return std::nullopt;
    }
    return Client(state_);
}

lcr::result<std::optional<schema::MountData>, MountError> SessionRoot::take_mount_event() {
    if (!state_ || state_->event_path.empty()) {
        return lcr::err{MountError{MountError::Code::EmptyEventPath}};
    }

    if (state_->event_path.front() != config::protocol::MOUNT_EVENT_SYMBOL) {
        return std::optional<schema::MountData>{};
    }

    if (state_->client_active) {
        UW_WARN("[SESSION] take_mount_event() called while a client is alive -> refused.");
        return lcr::err{MountError{MountError::Code::ClientActive}};
    }

    std::optional<json::Raw> raw = std::move(state_->event_data);
    state_->event_data.reset();
    if (!raw) {
        return lcr::err{MountError{MountError::Code::NoEventData}};
    }

    schema::MountData data;
    std::string why;
    const std::string_view text = raw->text.empty() ? std::string_view("null") : std::string_view(raw->text);
    if (!json::from_text(text, data, why)) {
        UW_DEBUG("[SESSION] Mount data rejected: " << why);
        return lcr::err{MountError{MountError::Code::FailedToDeserializeMountData, std::move(why)}};
    }
    return std::optional<schema::MountData>{std::move(data)};
}

schema::Response SessionRoot::into_response() && {
    schema::Response response;
    if (!state_) {
        return response;
    }
    if (state_->client_active) {
        UW_WARN("[SESSION] into_response() called while a client is alive; further emits are dropped.");
    }
    response.actions = std::move(state_->actions);
    state_->actions.clear();
    state_->finalized = true;
    state_.reset();
    return response;
}

const EventPath& SessionRoot::event_path() const noexcept {
    return state_ ? state_->event_path : EMPTY_PATH;
}

bool SessionRoot::has_event_data() const noexcept {
    return state_ && state_->event_data.has_value();
}

bool SessionRoot::finalized() const noexcept {
    return !state_ || state_->finalized;
}

bool SessionRoot::writable_(const char* op) const {
    if (!state_ || state_->finalized) {
        UW_ERROR("[SESSION] " << op << "() called on a finalized session root.");
        return false;
    }
    if (state_->client_active) {
        UW_WARN("[SESSION] " << op << "() called while a client is alive -> refused.");
        return false;
    }
    return true;
}

} // namespace uiwire
