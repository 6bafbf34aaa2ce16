#pragma once
#include <type_traits>
#include <utility>
#include <variant>

namespace kscope {

struct ParseError;

/// Either a value or the error explaining why there is none.
template <class T, class E = ParseError>
class Result {
public:
    template <class U,
              std::enable_if_t<std::is_constructible_v<T, U&&> &&
                               !std::is_same_v<std::decay_t<U>, Result> &&
                               !std::is_same_v<std::decay_t<U>, E>, int> = 0>
    Result(U&& value) : v_(std::in_place_index<0>, std::forward<U>(value)) {}

    Result(E error) : v_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return v_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() { return std::get<0>(v_); }
    const T& value() const { return std::get<0>(v_); }

    E& error() { return std::get<1>(v_); }
    const E& error() const { return std::get<1>(v_); }

private:
    std::variant<T, E> v_;
};

} // namespace kscope
