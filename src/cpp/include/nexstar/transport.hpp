#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "constants.hpp"
#include "errors.hpp"

namespace nexstar {

enum class ConnectionType {
    SERIAL,
    TCP,
};

/// Transport settings supplied by the surrounding application.
struct ConnectionConfig {
    ConnectionType type = ConnectionType::SERIAL;
    std::string port    = DEFAULT_SERIAL_PORT;
    int baudrate        = DEFAULT_BAUDRATE;
    std::string host    = DEFAULT_TCP_HOST;
    int tcp_port        = DEFAULT_TCP_PORT;
    double timeout      = DEFAULT_TIMEOUT;   // seconds
    bool verbose        = false;

    /// "/dev/ttyUSB0" or "192.168.4.1:4030"
    std::string endpoint() const;
};

/// Abstract byte stream to the hand controller.
/// Enables dependency injection and test mocking.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Open the underlying link. Throws ConnectionError.
    virtual void open() = 0;

    /// Release the link. Safe to call when already closed.
    virtual void close() = 0;

    /// Returns true if the link is currently open.
    virtual bool is_open() const = 0;

    /// Write all bytes. Throws ConnectionError.
    virtual void write(const std::string& data) = 0;

    /// Drop any bytes received but not yet read.
    virtual void discard_input() = 0;

    /// Wait up to timeout for one byte. Returns nullopt when none arrived.
    virtual std::optional<char> read_byte(std::chrono::milliseconds timeout) = 0;

    /// Human readable endpoint for log messages.
    virtual std::string describe() const = 0;
};

/// Shared file-descriptor plumbing for serial and TCP links.
class FdTransport : public ITransport {
public:
    ~FdTransport() override;

    FdTransport(const FdTransport&) = delete;
    FdTransport& operator=(const FdTransport&) = delete;

    void close() override;
    bool is_open() const override;
    void write(const std::string& data) override;
    std::optional<char> read_byte(std::chrono::milliseconds timeout) override;

    /// Return the file descriptor (mainly for diagnostics).
    int fd() const { return fd_; }

protected:
    FdTransport() = default;

    int fd_ = -1;
};

/// RS-232 link at 9600 baud, 8 data bits, no parity, 1 stop bit.
class SerialTransport : public FdTransport {
public:
    explicit SerialTransport(std::string port, int baudrate = DEFAULT_BAUDRATE);

    void open() override;
    void discard_input() override;
    std::string describe() const override;

private:
    std::string port_;
    int baudrate_;
};

/// TCP socket carrying the same command stream (SkyPortal WiFi adapter).
class TcpTransport : public FdTransport {
public:
    TcpTransport(std::string host, int port,
                 std::chrono::milliseconds connect_timeout =
                     std::chrono::milliseconds(2000));

    void open() override;
    void discard_input() override;
    std::string describe() const override;

private:
    std::string host_;
    int port_;
    std::chrono::milliseconds connect_timeout_;
};

/// Build the transport selected by config.type (not yet opened).
std::unique_ptr<ITransport> make_transport(const ConnectionConfig& config);

} // namespace nexstar
