#pragma once

#include <stdexcept>
#include <string>

namespace dnotify {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised when notifications are sent without the user's permission.
/// This is the only error the Notifier lets through to callers.
class AuthorisationError : public Error {
public:
    using Error::Error;
};

/// Raised by backends when the platform rejects or fails a request.
class BackendError : public Error {
public:
    using Error::Error;
};

} // namespace dnotify
