#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>


namespace lcr {

// ---------------------------------------------------------------------------
// result<T, E> - Either a value or an error (never both, never neither)
// ---------------------------------------------------------------------------
//
// Errors are reported as values; nothing in here throws.
// Build from a plain T, or from err<E> / make_error(e) for the error side.
// ---------------------------------------------------------------------------

template <typename E>
struct err {
    E error;
};

template <typename E>
err(E) -> err<E>;

template <typename T, typename E>
class result {
public:
    result(const T& v) : storage_(std::in_place_index<0>, v) {}
    result(T&& v) : storage_(std::in_place_index<0>, std::move(v)) {}

    template <typename U>
        requires std::is_constructible_v<E, U&&>
    result(err<U>&& e) : storage_(std::in_place_index<1>, std::move(e.error)) {}

    template <typename U>
        requires std::is_constructible_v<E, const U&>
    result(const err<U>& e) : storage_(std::in_place_index<1>, e.error) {}

    [[nodiscard]] inline bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] inline bool has_error() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] inline const T& value() const& {
        assert(has_value() && "lcr::result::value() called on error");
        return std::get<0>(storage_);
    }
    [[nodiscard]] inline T& value() & {
        assert(has_value() && "lcr::result::value() called on error");
        return std::get<0>(storage_);
    }
    [[nodiscard]] inline T&& value() && {
        assert(has_value() && "lcr::result::value() called on error");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] inline const E& error() const& {
        assert(has_error() && "lcr::result::error() called on value");
        return std::get<1>(storage_);
    }
    [[nodiscard]] inline E&& error() && {
        assert(has_error() && "lcr::result::error() called on value");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] inline T value_or(T fallback) const& {
        return has_value() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, E> storage_;
};


template <typename E>
[[nodiscard]] inline err<std::decay_t<E>> make_error(E&& e) {
    return err<std::decay_t<E>>{std::forward<E>(e)};
}

} // namespace lcr
