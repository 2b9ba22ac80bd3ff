#ifndef VEILCHAT_NETWORK_ERRORS_HPP
#define VEILCHAT_NETWORK_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the codec, the masking layer and the
 *        delivery manager.
 *
 * Every failure surfaced to a caller is a MessengerError carrying an
 * ErrorKind. Connection failures additionally record the specific cause so
 * a failed send can tell "refused" from "unreachable".
 */

namespace veilchat {
namespace network {

enum class ErrorKind {
    ConnectionFailed,
    Timeout,
    DecodeError,
    MaskingError,
    NotFound
};

inline const char *kindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ConnectionFailed:
        return "ConnectionFailed";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::MaskingError:
        return "MaskingError";
    case ErrorKind::NotFound:
        return "NotFound";
    }
    return "Unknown";
}

/// Finer cause of a ConnectionFailed error.
enum class ConnectCause {
    None,
    Refused,
    Unreachable,
    Resolve,
    Closed,
    Other
};

class MessengerError : public std::runtime_error
{
public:
    MessengerError(ErrorKind kind, const std::string &what,
                   ConnectCause cause = ConnectCause::None)
        : std::runtime_error(what)
        , kind_(kind)
        , cause_(cause)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }
    ConnectCause cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    ConnectCause cause_;
};

class DecodeError : public MessengerError
{
public:
    explicit DecodeError(const std::string &what)
        : MessengerError(ErrorKind::DecodeError, "decode error: " + what)
    {
    }
};

} // namespace network
} // namespace veilchat

#endif // VEILCHAT_NETWORK_ERRORS_HPP
