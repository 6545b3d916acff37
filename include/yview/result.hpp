#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace yview {

enum class ErrorCode {
    Generic,
    Configuration,
    Parse,
    Io,
};

//=============================================================================
// Error - message with an optional chained cause
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message, ErrorCode code = ErrorCode::Generic,
                   std::shared_ptr<const Error> cause = nullptr)
        : _message(std::move(message)), _code(code), _cause(std::move(cause)) {}

    const std::string& message() const { return _message; }
    ErrorCode code() const { return _code; }
    const std::shared_ptr<const Error>& cause() const { return _cause; }

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
    ErrorCode _code = ErrorCode::Generic;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message, ErrorCode code = ErrorCode::Generic) {
    return std::unexpected(Error(std::move(message), code));
}

// Wraps the error of a failed result as the cause; the code is inherited
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected(Error(std::move(message)));
    }
    return std::unexpected(Error(std::move(message), cause.error().code(),
                                 std::make_shared<const Error>(cause.error())));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace yview
