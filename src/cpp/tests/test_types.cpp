#include <gtest/gtest.h>

#include "nexstar/transport.hpp"
#include "nexstar/types.hpp"

namespace nexstar {
namespace {

TEST(TypesTest, DirectionMapsToAxis) {
    EXPECT_EQ(axis_of(Direction::UP), Axis::ALTITUDE);
    EXPECT_EQ(axis_of(Direction::DOWN), Axis::ALTITUDE);
    EXPECT_EQ(axis_of(Direction::LEFT), Axis::AZIMUTH);
    EXPECT_EQ(axis_of(Direction::RIGHT), Axis::AZIMUTH);
}

TEST(TypesTest, DirectionMapsToSign) {
    EXPECT_EQ(sign_of(Direction::UP), MotionDirection::POSITIVE);
    EXPECT_EQ(sign_of(Direction::LEFT), MotionDirection::POSITIVE);
    EXPECT_EQ(sign_of(Direction::DOWN), MotionDirection::NEGATIVE);
    EXPECT_EQ(sign_of(Direction::RIGHT), MotionDirection::NEGATIVE);
}

TEST(TypesTest, InfoString) {
    TelescopeInfo info;
    info.model = 11;
    info.firmware_major = 5;
    info.firmware_minor = 3;
    EXPECT_EQ(info.to_string(), "Model 11, Firmware 5.03");
}

TEST(TypesTest, TimeString) {
    TelescopeTime t;
    t.year = 2024;
    t.month = 10;
    t.day = 14;
    t.hour = 9;
    t.minute = 5;
    t.second = 7;
    EXPECT_EQ(t.to_string(), "2024-10-14 09:05:07");
}

TEST(TypesTest, EnumNames) {
    EXPECT_EQ(to_string(TrackingMode::EQ_NORTH), "eq-north");
    EXPECT_EQ(to_string(SlewState::SLEWING), "slewing");
    EXPECT_EQ(to_string(Axis::AZIMUTH), "azimuth");
    EXPECT_EQ(to_string(Direction::LEFT), "left");
}

TEST(TypesTest, Endpoints) {
    ConnectionConfig serial;
    EXPECT_EQ(serial.endpoint(), "/dev/ttyUSB0");

    ConnectionConfig tcp;
    tcp.type = ConnectionType::TCP;
    EXPECT_EQ(tcp.endpoint(), "192.168.4.1:4030");
}

TEST(TypesTest, TransportFactoryDoesNotOpen) {
    ConnectionConfig tcp;
    tcp.type = ConnectionType::TCP;
    auto transport = make_transport(tcp);
    ASSERT_TRUE(transport != nullptr);
    EXPECT_FALSE(transport->is_open());
    EXPECT_EQ(transport->describe(), "192.168.4.1:4030");
}

} // namespace
} // namespace nexstar
