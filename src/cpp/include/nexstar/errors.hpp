#pragma once

#include <stdexcept>

namespace nexstar {

/// Base class for every error raised by the library.
class NexStarError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The transport cannot be opened or was lost mid-command.
class ConnectionError : public NexStarError {
public:
    using NexStarError::NexStarError;
};

/// No '#' terminator arrived before the command deadline.
class TimeoutError : public NexStarError {
public:
    using NexStarError::NexStarError;
};

/// A command was issued on a closed channel.
class NotConnectedError : public NexStarError {
public:
    using NexStarError::NexStarError;
};

/// The mount answered with a malformed or unexpected response.
class CommandError : public NexStarError {
public:
    using NexStarError::NexStarError;
};

/// An argument failed validation. Raised before any I/O.
class InvalidParameterError : public NexStarError {
public:
    using NexStarError::NexStarError;
};

/// A coordinate, rate or axis is outside its domain.
class InvalidCoordinateError : public InvalidParameterError {
public:
    using InvalidParameterError::InvalidParameterError;
};

} // namespace nexstar
