#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <stdexcept>
#include <chrono>
#include <string>
#include <thread>

#include "nexstar/codec.hpp"
#include "nexstar/controller.hpp"
#include "nexstar/errors.hpp"
#include "nexstar/transport.hpp"

namespace nexstar {
namespace {

/// Minimal NexStar mount on a loopback TCP socket. Serves one client:
/// echoes K, answers E and Z with fixed positions, acknowledges the rest.
class LoopbackMount {
public:
    LoopbackMount() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (listen_fd_ < 0 ||
            ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 1) < 0) {
            throw std::runtime_error("Cannot set up loopback listener");
        }
        socklen_t len = sizeof(addr);
        if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
            throw std::runtime_error("getsockname failed");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread(&LoopbackMount::serve, this);
    }

    ~LoopbackMount() {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }
    int commands_seen() const { return commands_.load(); }

private:
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<int> commands_{0};
    std::thread thread_;

    void serve() {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        std::string command;
        char c = 0;
        while (::read(client, &c, 1) == 1) {
            if (c != '#') {
                command += c;
                continue;
            }
            ++commands_;
            std::string reply = "#";
            if (command.size() == 2 && command[0] == 'K') {
                reply = command.substr(1) + "#";
            } else if (command == "E") {
                reply = codec::encode_pair(90.0, 45.0) + "#";
            } else if (command == "Z") {
                reply = codec::encode_pair(200.0, 330.0) + "#";
            }
            if (::write(client, reply.data(), reply.size()) < 0) {
                break;
            }
            command.clear();
        }
        ::close(client);
    }
};

TEST(TransportTest, SerialOpenFailsForMissingPort) {
    SerialTransport serial("/dev/nonexistent_nexstar_port");
    EXPECT_THROW(serial.open(), ConnectionError);
    EXPECT_FALSE(serial.is_open());
}

TEST(TransportTest, UnsupportedBaudRateRejected) {
    SerialTransport serial("/dev/null", 12345);
    EXPECT_THROW(serial.open(), ConnectionError);
}

TEST(TransportTest, TcpConnectRefused) {
    TcpTransport tcp("127.0.0.1", 1, std::chrono::milliseconds(500));
    EXPECT_THROW(tcp.open(), ConnectionError);
    EXPECT_FALSE(tcp.is_open());
}

TEST(TransportTest, ClosedTransportRejectsIo) {
    TcpTransport tcp("127.0.0.1", 4030);
    EXPECT_THROW(tcp.write("E#"), NotConnectedError);
    EXPECT_THROW(tcp.read_byte(std::chrono::milliseconds(10)), NotConnectedError);
}

TEST(TransportTest, ControllerOverLoopbackTcp) {
    LoopbackMount mount;

    ConnectionConfig config;
    config.type = ConnectionType::TCP;
    config.host = "127.0.0.1";
    config.tcp_port = mount.port();
    config.timeout = 1.0;

    TelescopeController controller(config);
    {
        ScopedConnection connection(controller);
        EXPECT_TRUE(controller.is_connected());

        EquatorialCoordinates eq = controller.get_position_ra_dec();
        EXPECT_NEAR(eq.ra_hours, 6.0, 1e-6);
        EXPECT_NEAR(eq.dec_degrees, 45.0, 1e-6);

        HorizontalCoordinates hz = controller.get_position_alt_az();
        EXPECT_NEAR(hz.azimuth, 200.0, 1e-6);
        EXPECT_NEAR(hz.altitude, -30.0, 1e-6);

        controller.goto_alt_az(10.0, 20.0);
    }
    EXPECT_FALSE(controller.is_connected());
    EXPECT_EQ(mount.commands_seen(), 4);
}

} // namespace
} // namespace nexstar
