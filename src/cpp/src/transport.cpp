#include "nexstar/transport.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <termios.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace nexstar {

namespace {

speed_t baud_constant(int baudrate) {
    switch (baudrate) {
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        default:
            throw ConnectionError("Unsupported baud rate " + std::to_string(baudrate));
    }
}

std::string errno_text() {
    return std::strerror(errno);
}

void set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        throw ConnectionError("fcntl(F_GETFL) failed: " + errno_text());
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        throw ConnectionError("fcntl(F_SETFL) failed: " + errno_text());
    }
}

} // anonymous namespace

std::string ConnectionConfig::endpoint() const {
    if (type == ConnectionType::TCP) {
        return host + ":" + std::to_string(tcp_port);
    }
    return port;
}

// --- FdTransport ---

FdTransport::~FdTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FdTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool FdTransport::is_open() const {
    return fd_ >= 0;
}

void FdTransport::write(const std::string& data) {
    if (fd_ < 0) {
        throw NotConnectedError("Transport not open");
    }
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::send(fd_, data.data() + written, data.size() - written,
                           MSG_NOSIGNAL);
        if (n < 0 && errno == ENOTSOCK) {
            n = ::write(fd_, data.data() + written, data.size() - written);
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError("Write to " + describe() + " failed: " + errno_text());
        }
        written += static_cast<std::size_t>(n);
    }
}

std::optional<char> FdTransport::read_byte(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        throw NotConnectedError("Transport not open");
    }
    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw ConnectionError("poll on " + describe() + " failed: " + errno_text());
    }
    if (ready == 0) {
        return std::nullopt;
    }

    char byte = 0;
    ssize_t n = ::read(fd_, &byte, 1);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return std::nullopt;
        }
        throw ConnectionError("Read from " + describe() + " failed: " + errno_text());
    }
    if (n == 0) {
        throw ConnectionError("Connection closed by " + describe());
    }
    return byte;
}

// --- SerialTransport ---

SerialTransport::SerialTransport(std::string port, int baudrate)
    : port_(std::move(port))
    , baudrate_(baudrate) {
}

void SerialTransport::open() {
    if (fd_ >= 0) {
        return;
    }
    speed_t speed = baud_constant(baudrate_);

    spdlog::debug("Opening serial connection to {} at {} baud", port_, baudrate_);
    int fd = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        throw ConnectionError("Failed to open port " + port_ + ": " + errno_text());
    }

    struct termios tio{};
    if (::tcgetattr(fd, &tio) < 0) {
        std::string reason = errno_text();
        ::close(fd);
        throw ConnectionError("tcgetattr on " + port_ + " failed: " + reason);
    }
    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd, TCSANOW, &tio) < 0) {
        std::string reason = errno_text();
        ::close(fd);
        throw ConnectionError("tcsetattr on " + port_ + " failed: " + reason);
    }
    ::tcflush(fd, TCIOFLUSH);
    try {
        set_blocking(fd, true);
    } catch (const ConnectionError&) {
        ::close(fd);
        throw;
    }

    fd_ = fd;
    spdlog::info("Serial connection opened on {}", port_);
}

void SerialTransport::discard_input() {
    if (fd_ >= 0) {
        ::tcflush(fd_, TCIFLUSH);
    }
}

std::string SerialTransport::describe() const {
    return port_;
}

// --- TcpTransport ---

TcpTransport::TcpTransport(std::string host, int port,
                           std::chrono::milliseconds connect_timeout)
    : host_(std::move(host))
    , port_(port)
    , connect_timeout_(connect_timeout) {
}

void TcpTransport::open() {
    if (fd_ >= 0) {
        return;
    }
    spdlog::debug("Opening TCP connection to {}", describe());

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* result = nullptr;
    std::string service = std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConnectionError("Cannot resolve " + host_ + ": " + ::gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_text();
            continue;
        }
        try {
            set_blocking(fd, false);
            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
                if (errno != EINPROGRESS) {
                    throw ConnectionError(errno_text());
                }
                struct pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                int ready = ::poll(&pfd, 1, static_cast<int>(connect_timeout_.count()));
                if (ready <= 0) {
                    throw ConnectionError(ready == 0 ? "connect timed out" : errno_text());
                }
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                    throw ConnectionError(errno_text());
                }
                if (so_error != 0) {
                    throw ConnectionError(std::strerror(so_error));
                }
            }
            set_blocking(fd, true);
        } catch (const ConnectionError& e) {
            last_error = e.what();
            ::close(fd);
            continue;
        }

        int nodelay = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
            spdlog::warn("Cannot set TCP_NODELAY on {}: {}", describe(), errno_text());
        }
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(result);

    if (fd_ < 0) {
        throw ConnectionError("Failed to connect to " + describe() + ": " + last_error);
    }
    spdlog::info("TCP connection opened to {}", describe());
}

void TcpTransport::discard_input() {
    if (fd_ < 0) {
        return;
    }
    char buf[64];
    while (::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT) > 0) {
    }
}

std::string TcpTransport::describe() const {
    return host_ + ":" + std::to_string(port_);
}

std::unique_ptr<ITransport> make_transport(const ConnectionConfig& config) {
    if (config.type == ConnectionType::TCP) {
        auto timeout = std::chrono::milliseconds(
            static_cast<long long>(config.timeout * 1000.0));
        return std::make_unique<TcpTransport>(config.host, config.tcp_port, timeout);
    }
    return std::make_unique<SerialTransport>(config.port, config.baudrate);
}

} // namespace nexstar
