#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <cmath>
#include <string>

#include "nexstar/codec.hpp"
#include "nexstar/errors.hpp"

namespace nexstar {
namespace {

constexpr double QUANTUM = 360.0 / 4294967296.0;

/// Distance between two angles on the circle.
double circular_error(double a, double b) {
    double d = std::fmod(std::fabs(a - b), 360.0);
    return std::min(d, 360.0 - d);
}

// ----- degrees_to_hex -----

TEST(CodecTest, KnownAngles) {
    EXPECT_EQ(codec::degrees_to_hex(0.0), "00000000");
    EXPECT_EQ(codec::degrees_to_hex(90.0), "40000000");
    EXPECT_EQ(codec::degrees_to_hex(180.0), "80000000");
    EXPECT_EQ(codec::degrees_to_hex(270.0), "C0000000");
    EXPECT_EQ(codec::degrees_to_hex(330.0), "EAAAAAAB");
}

TEST(CodecTest, FullTurnWrapsToZero) {
    EXPECT_EQ(codec::degrees_to_hex(360.0), "00000000");
    EXPECT_EQ(codec::degrees_to_hex(-90.0), "C0000000");
}

TEST(CodecTest, AlwaysEightUppercaseDigits) {
    std::string hex = codec::degrees_to_hex(1.0);
    EXPECT_EQ(hex, "00B60B61");
    EXPECT_EQ(hex.size(), 8u);
    EXPECT_EQ(codec::degrees_to_hex(359.0), "FF49F49F");
}

TEST(CodecTest, ManyTurnsReduceToSameAngle) {
    EXPECT_EQ(codec::degrees_to_hex(810.0), "40000000");
    EXPECT_EQ(codec::degrees_to_hex(-630.0), "40000000");
    EXPECT_EQ(codec::degrees_to_hex(360.0 * 1e12 + 90.0), "40000000");
}

TEST(CodecTest, HugeFiniteAnglesStillEncode) {
    for (double deg : {1e300, -1e300, 1e20, -1e20, DBL_MAX, -DBL_MAX}) {
        std::string hex = codec::degrees_to_hex(deg);
        ASSERT_EQ(hex.size(), 8u) << deg;
        for (char c : hex) {
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << deg;
        }
        EXPECT_EQ(hex, codec::degrees_to_hex(std::fmod(deg, 360.0))) << deg;
    }
}

TEST(CodecTest, NonFiniteAngleRejected) {
    EXPECT_THROW(codec::degrees_to_hex(std::nan("")), InvalidCoordinateError);
    EXPECT_THROW(codec::degrees_to_hex(INFINITY), InvalidCoordinateError);
}

// ----- hex_to_degrees -----

TEST(CodecTest, DecodesKnownValues) {
    EXPECT_DOUBLE_EQ(codec::hex_to_degrees("00000000"), 0.0);
    EXPECT_DOUBLE_EQ(codec::hex_to_degrees("40000000"), 90.0);
    EXPECT_DOUBLE_EQ(codec::hex_to_degrees("80000000"), 180.0);
}

TEST(CodecTest, AcceptsLowercaseHex) {
    EXPECT_DOUBLE_EQ(codec::hex_to_degrees("c0000000"), 270.0);
}

TEST(CodecTest, RoundTripWithinOneQuantum) {
    for (double deg = 0.0; deg < 360.0; deg += 7.3) {
        double back = codec::hex_to_degrees(codec::degrees_to_hex(deg));
        EXPECT_LE(circular_error(back, deg), QUANTUM) << "angle " << deg;
    }
    double near_turn = 359.9999999999;
    EXPECT_LE(circular_error(codec::hex_to_degrees(codec::degrees_to_hex(near_turn)),
                             near_turn),
              QUANTUM);
}

TEST(CodecTest, MalformedHexRejected) {
    EXPECT_THROW(codec::hex_to_degrees(""), CommandError);
    EXPECT_THROW(codec::hex_to_degrees("1234567"), CommandError);
    EXPECT_THROW(codec::hex_to_degrees("123456789"), CommandError);
    EXPECT_THROW(codec::hex_to_degrees("1234567G"), CommandError);
    EXPECT_THROW(codec::hex_to_degrees("-1234567"), CommandError);
}

// ----- pairs -----

TEST(CodecTest, EncodePair) {
    EXPECT_EQ(codec::encode_pair(180.0, codec::to_unsigned(-30.0)), "80000000,EAAAAAAB");
    EXPECT_EQ(codec::encode_pair(90.0, 45.0), "40000000,20000000");
}

TEST(CodecTest, DecodePair) {
    auto [a, b] = codec::decode_pair("40000000,80000000");
    EXPECT_DOUBLE_EQ(a, 90.0);
    EXPECT_DOUBLE_EQ(b, 180.0);
}

TEST(CodecTest, DecodePairToSignedDomain) {
    auto [ra, dec] = codec::decode_pair("80000000,EAAAAAAB");
    EXPECT_NEAR(ra, 180.0, QUANTUM);
    EXPECT_NEAR(codec::to_signed(dec), -30.0, QUANTUM);
}

TEST(CodecTest, DecodePairRejectsMalformed) {
    EXPECT_THROW(codec::decode_pair(""), CommandError);
    EXPECT_THROW(codec::decode_pair("40000000"), CommandError);
    EXPECT_THROW(codec::decode_pair("40000000;80000000"), CommandError);
    EXPECT_THROW(codec::decode_pair("4000000,080000000"), CommandError);
    EXPECT_THROW(codec::decode_pair("40000000,8000000Z"), CommandError);
}

// ----- signed / unsigned -----

TEST(CodecTest, ToUnsigned) {
    EXPECT_DOUBLE_EQ(codec::to_unsigned(-30.0), 330.0);
    EXPECT_DOUBLE_EQ(codec::to_unsigned(45.0), 45.0);
    EXPECT_DOUBLE_EQ(codec::to_unsigned(0.0), 0.0);
}

TEST(CodecTest, ToSigned) {
    EXPECT_DOUBLE_EQ(codec::to_signed(330.0), -30.0);
    EXPECT_DOUBLE_EQ(codec::to_signed(45.0), 45.0);
    EXPECT_DOUBLE_EQ(codec::to_signed(180.0), 180.0);
}

TEST(CodecTest, SignedUnsignedRoundTrip) {
    for (double x = -179.5; x <= 180.0; x += 0.5) {
        EXPECT_NEAR(codec::to_signed(codec::to_unsigned(x)), x, 1e-9) << "angle " << x;
    }
}

TEST(CodecTest, RaHoursConversion) {
    EXPECT_DOUBLE_EQ(codec::ra_hours_to_degrees(12.0), 180.0);
    EXPECT_DOUBLE_EQ(codec::ra_degrees_to_hours(90.0), 6.0);
}

} // namespace
} // namespace nexstar
