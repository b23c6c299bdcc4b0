#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace vellum {

//-----------------------------------------------------------------------------
// Error - message with an optional chain of causes
//-----------------------------------------------------------------------------
class Error {
public:
    Error() = default;
    explicit Error(std::string message)
        : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message))
        , _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const noexcept { return _message; }
    const std::shared_ptr<const Error>& cause() const noexcept { return _cause; }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->_cause) {
            out += ": ";
            out += c->_message;
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace vellum
