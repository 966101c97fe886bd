#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "constants.hpp"
#include "transport.hpp"

namespace nexstar {

/// Request/response framing over an ITransport.
///
/// Commands are written as `<command>#` and answered with `<response>#`.
/// The protocol is half-duplex, so send_command() holds a mutex for the
/// whole exchange; interactive callers and the position tracker share
/// one channel.
class CommandChannel {
public:
    explicit CommandChannel(std::unique_ptr<ITransport> transport,
                            double timeout = DEFAULT_TIMEOUT,
                            bool verbose = false);

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    /// Open the transport. No-op if already open. Throws ConnectionError.
    void open();

    /// Close the transport. Safe to call multiple times.
    void close();

    bool is_open() const;

    /// Send one command and return its response without the terminator.
    ///
    /// With expected_length set, the first expected_length response bytes
    /// are taken as data even if one of them is '#'.
    /// Throws NotConnectedError, TimeoutError or ConnectionError.
    std::string send_command(const std::string& command,
                             std::optional<std::size_t> expected_length = std::nullopt);

    double timeout() const { return timeout_.count(); }
    void set_timeout(double seconds);

    /// Endpoint of the underlying transport, for log messages.
    std::string describe() const;

private:
    std::unique_ptr<ITransport> transport_;
    std::chrono::duration<double> timeout_;
    bool verbose_;
    mutable std::mutex mutex_;
};

} // namespace nexstar
