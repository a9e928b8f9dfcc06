#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include "uiwire/symbol.hpp"
#include "uiwire/json/traits.hpp"
#include "uiwire/schema/response.hpp"
#include "uiwire/session/client.hpp"


namespace uiwire {

namespace detail {

// Fresh 64-bit value per call; one engine per thread, seeded from the OS
[[nodiscard]]
inline std::uint64_t random_u64() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }()};
    return engine();
}

} // namespace detail


/*
===============================================================================
 ActionKey<T>
===============================================================================

Identifier of a renderer-side action that accepts data of type T.

The path is a single random segment (decimal u64) chosen at creation time and
is NOT derived from any UI scope; actions are addressed flat per session while
events are scope-addressed. Advertise the key to the renderer (it serializes as
{"actionPath":[...],"debugSymbol":...}), then emit() data to it while handling
later events. Every emit() is an independent log entry.
===============================================================================
*/
template<typename T>
class ActionKey {
public:
    [[nodiscard]]
    static ActionKey create() {
        return ActionKey(EventPath{std::to_string(detail::random_u64())});
    }

    // Cosmetic label for renderer-side diagnostics; no effect on addressing
    [[nodiscard]]
    inline ActionKey with_debug_symbol(std::string label) && {
        debug_symbol_ = std::move(label);
        return std::move(*this);
    }

    [[nodiscard]]
    inline ActionKey with_debug_symbol(std::string label) const& {
        ActionKey copy(*this);
        copy.debug_symbol_ = std::move(label);
        return copy;
    }

    [[nodiscard]] inline const EventPath& path() const noexcept { return path_; }
    [[nodiscard]] inline const std::optional<std::string>& debug_symbol() const noexcept { return debug_symbol_; }

    // Serialize {key, data} and append it to the client's action log
    void emit(const T& data, Client& client) const
        requires json::Writable<T>
    {
        client.push_action_(schema::make_action(path_, debug_symbol_, data));
    }

    bool operator==(const ActionKey&) const = default;

private:
    explicit ActionKey(EventPath path)
        : path_(std::move(path))
    {}

    EventPath path_;
    std::optional<std::string> debug_symbol_;
};

} // namespace uiwire


namespace uiwire::json {

template<typename T>
struct Traits<ActionKey<T>> {
    static void write(std::string& out, const ActionKey<T>& key) {
        schema::write_action_key(out, key.path(), key.debug_symbol());
    }
};

} // namespace uiwire::json
