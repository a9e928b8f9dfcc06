#pragma once

#include <string_view>

#include "uiwire/symbol.hpp"
#include "uiwire/scope.hpp"


namespace uiwire {

template<typename T>
class EventKey;

// -----------------------------------------------------------------------------
// Ui: read-only scoped view used while building component trees
// -----------------------------------------------------------------------------
// Derives EventKeys from the current scope chain. Has no access to the event
// payload or the action log; those stay behind the Client.
class Ui {
public:
    explicit Ui(ScopeChain scope) noexcept
        : scope_(std::move(scope))
    {}

    // One level deeper. `symbol` is a literal or a codec::encode(...) result.
    [[nodiscard]]
    inline Ui scope(Symbol symbol) const {
        return Ui(scope_.push(std::move(symbol)));
    }

    template<typename T>
    [[nodiscard]]
    inline EventKey<T> event_key() const {
        return EventKey<T>(scope_.snapshot());
    }

    [[nodiscard]] inline EventPath path() const { return scope_.snapshot(); }
    [[nodiscard]] inline const ScopeChain& chain() const noexcept { return scope_; }

private:
    ScopeChain scope_;
};

} // namespace uiwire
