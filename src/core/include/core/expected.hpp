#pragma once

// Small expected<T,E> for exception-free query paths (rebuilds and lookups run on
// the UI thread inside paint and input handlers). Subset of std::expected (C++23):
// no monadic ops, no reference payloads.

#include <type_traits>
#include <utility>
#include <variant>

namespace tg {

template <class E>
class unexpected {
public:
    static_assert(!std::is_reference_v<E>, "unexpected<E&> not supported");
    constexpr explicit unexpected(const E& e) : error_(e) {}
    constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}
    constexpr const E& error() const & noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
private:
    E error_;
};

template <class T, class E>
class expected {
public:
    static_assert(!std::is_reference_v<T>, "expected<T&> not supported");
    static_assert(!std::is_same_v<T, E>, "value and error types must differ");

    constexpr expected() : data_(std::in_place_index<0>) {}
    constexpr expected(const T& v) : data_(std::in_place_index<0>, v) {}
    constexpr expected(T&& v) : data_(std::in_place_index<0>, std::move(v)) {}
    constexpr expected(const unexpected<E>& ue) : data_(std::in_place_index<1>, ue.error()) {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }
    explicit constexpr operator bool() const noexcept { return has_value(); }

    // Only valid when has_value()
    constexpr const T& value() const & { return *std::get_if<0>(&data_); }
    constexpr T& value() & { return *std::get_if<0>(&data_); }
    constexpr const T& operator*() const & { return value(); }
    constexpr const T* operator->() const { return std::get_if<0>(&data_); }

    // Only valid when !has_value()
    constexpr const E& error() const & { return *std::get_if<1>(&data_); }

    template <class U>
    constexpr T value_or(U&& fallback) const & {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, E> data_;
};

template <class E>
unexpected<std::decay_t<E>> make_unexpected(E&& e) { return unexpected<std::decay_t<E>>(std::forward<E>(e)); }

} // namespace tg
