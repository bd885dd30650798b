#include "gnss_rtk_bridge/errors.hpp"
#include "gnss_rtk_bridge/nmea_encoder.hpp"
#include "gnss_rtk_bridge/nmea_parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace gnss_rtk_bridge;

namespace {

const char *kGga = "$GPGGA,092750.000,5321.6802,N,00630.3372,W,1,8,1.03,61.7,M,55.2,M,,*76";
const char *kGsa = "$GPGSA,A,3,10,07,05,02,29,04,08,13,,,,,1.72,1.03,1.38*0A";
const char *kGsv = "$GPGSV,3,1,11,10,63,137,17,07,61,098,15,05,59,290,20,08,54,157,30*70";

} // namespace

TEST(NmeaParser, ParsesGga) {
    const NmeaSentence s = NmeaParser::parse(kGga);
    EXPECT_EQ(s.talker, "GP");
    EXPECT_EQ(s.type, "GGA");
    ASSERT_EQ(s.fields.size(), 14u);

    const auto &gga = std::get<GgaData>(s.data);
    ASSERT_TRUE(gga.time);
    EXPECT_EQ(gga.time->hour, 9);
    EXPECT_EQ(gga.time->minute, 27);
    EXPECT_DOUBLE_EQ(gga.time->second, 50.0);
    ASSERT_TRUE(gga.position);
    EXPECT_NEAR(gga.position->latitude, 53.0 + 21.6802 / 60.0, 1e-12);
    EXPECT_NEAR(gga.position->longitude, -(6.0 + 30.3372 / 60.0), 1e-12);
    EXPECT_EQ(gga.quality, FixQuality::Gps);
    EXPECT_EQ(gga.satellites, 8);
    EXPECT_DOUBLE_EQ(*gga.hdop, 1.03);
    EXPECT_DOUBLE_EQ(*gga.altitude_msl_m, 61.7);
    EXPECT_DOUBLE_EQ(*gga.geoid_separation_m, 55.2);
    EXPECT_FALSE(gga.correction_age_s);
    EXPECT_NEAR(*gga.ellipsoidalHeight(), 116.9, 1e-9);
}

TEST(NmeaParser, ParsesGsaAndGsv) {
    const auto gsa = std::get<GsaData>(NmeaParser::parse(kGsa).data);
    EXPECT_EQ(gsa.selection_mode, 'A');
    EXPECT_EQ(gsa.fix_type, 3);
    EXPECT_EQ(gsa.prns, (std::vector<int>{10, 7, 5, 2, 29, 4, 8, 13}));
    EXPECT_DOUBLE_EQ(*gsa.pdop, 1.72);
    EXPECT_DOUBLE_EQ(*gsa.hdop, 1.03);
    EXPECT_DOUBLE_EQ(*gsa.vdop, 1.38);

    const auto gsv = std::get<GsvData>(NmeaParser::parse(kGsv).data);
    EXPECT_EQ(gsv.total_messages, 3);
    EXPECT_EQ(gsv.message_number, 1);
    EXPECT_EQ(gsv.satellites_in_view, 11);
    ASSERT_EQ(gsv.satellites.size(), 4u);
    EXPECT_EQ(gsv.satellites[3].prn, 8);
    EXPECT_EQ(gsv.satellites[3].elevation_deg, 54);
    EXPECT_EQ(gsv.satellites[3].azimuth_deg, 157);
    EXPECT_EQ(gsv.satellites[3].snr_dbhz, 30);
}

TEST(NmeaParser, ParsesRmcWithDate) {
    const std::string line = encodeSentence(
        "GN", "RMC", {"123519.50", "A", "4807.038", "N", "01131.000", "E", "22.4", "84.4", "230394", "3.1", "W", "A"});
    const NmeaSentence s = NmeaParser::parse(line);
    EXPECT_EQ(s.talker, "GN");
    const auto &rmc = std::get<RmcData>(s.data);
    EXPECT_TRUE(rmc.valid);
    ASSERT_TRUE(rmc.time);
    EXPECT_EQ(rmc.time->year, 1994);
    EXPECT_EQ(rmc.time->month, 3);
    EXPECT_EQ(rmc.time->day, 23);
    EXPECT_DOUBLE_EQ(*rmc.speed_knots, 22.4);
    EXPECT_DOUBLE_EQ(*rmc.course_deg, 84.4);
    EXPECT_DOUBLE_EQ(*rmc.magnetic_variation_deg, -3.1);
    EXPECT_EQ(rmc.mode, 'A');
}

TEST(NmeaParser, EmptyFieldsStayUnset) {
    const std::string line = encodeSentence("GP", "GGA", {"", "", "", "", "", "0", "", "", "", "", "", "", "", ""});
    const auto gga = std::get<GgaData>(NmeaParser::parse(line).data);
    EXPECT_FALSE(gga.time);
    EXPECT_FALSE(gga.position);
    EXPECT_FALSE(gga.hdop);
    EXPECT_FALSE(gga.ellipsoidalHeight());
    EXPECT_EQ(gga.quality, FixQuality::NoFix);
}

TEST(NmeaParser, UnknownTypeKeepsRawFields) {
    const std::string line = encodeSentence("P", "UBX", {"00", "1.5", ""});
    const NmeaSentence s = NmeaParser::parse(line);
    EXPECT_EQ(s.talker, "P");
    EXPECT_EQ(s.type, "UBX");
    EXPECT_TRUE(std::holds_alternative<NmeaUnknownSentence>(s.data));
    EXPECT_EQ(s.fields, (std::vector<std::string>{"00", "1.5", ""}));
}

TEST(NmeaParser, ChecksumMismatchThrows) {
    EXPECT_THROW(NmeaParser::parse("$GPGGA,092750.000,5321.6802,N,00630.3372,W,1,8,1.03,61.7,M,55.2,M,,*77"),
                 ChecksumError);
}

TEST(NmeaParser, FramingErrors) {
    EXPECT_THROW(NmeaParser::parse("GPGGA,1,2*00"), ParseError);
    EXPECT_THROW(NmeaParser::parse("$GPGGA,1,2"), ParseError);
    EXPECT_THROW(NmeaParser::parse("$GPGGA,1,2*0"), ParseError);
    EXPECT_THROW(NmeaParser::parse("$GPGGA,1,2*ZZ"), ParseError);
    EXPECT_THROW(NmeaParser::parse(""), ParseError);
}

TEST(NmeaParser, ChecksumOfBody) {
    EXPECT_EQ(NmeaParser::checksum("GPGSA,A,3,10,07,05,02,29,04,08,13,,,,,1.72,1.03,1.38"), 0x0A);
}

TEST(NmeaParser, SplitKeepsEmptyFields) {
    std::vector<std::string> out;
    EXPECT_EQ(NmeaParser::splitCSV("a,,b,", out), 4);
    EXPECT_EQ(out, (std::vector<std::string>{"a", "", "b", ""}));
}

TEST(NmeaParser, NmeaToDeg) {
    double deg = 0.0;
    ASSERT_TRUE(NmeaParser::nmeaToDeg("4807.038", 'N', deg));
    EXPECT_NEAR(deg, 48.1173, 1e-9);
    ASSERT_TRUE(NmeaParser::nmeaToDeg("01131.000", 'W', deg));
    EXPECT_NEAR(deg, -11.516666666666667, 1e-12);
    EXPECT_FALSE(NmeaParser::nmeaToDeg("4860.000", 'N', deg));
    EXPECT_FALSE(NmeaParser::nmeaToDeg("48", 'N', deg));
    EXPECT_FALSE(NmeaParser::nmeaToDeg("4x07.038", 'N', deg));
}

TEST(NmeaDecodeLine, MalformedLineDoesNotAffectNextLine) {
    const NmeaLineResult bad = NmeaParser::decodeLine("$GPGGA,garbage*00");
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error, NmeaErrorKind::Checksum);
    EXPECT_FALSE(bad.message.empty());

    const NmeaLineResult good = NmeaParser::decodeLine(std::string(kGga) + "\r\n");
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.error, NmeaErrorKind::None);
    EXPECT_EQ(good.sentence->type, "GGA");
}

TEST(NmeaDecodeLine, ClassifiesErrors) {
    EXPECT_EQ(NmeaParser::decodeLine("hello").error, NmeaErrorKind::Framing);

    const std::string bad_lat = encodeSentence("GP", "GLL", {"9130.000", "N", "01131.000", "E", "120000", "A"});
    const NmeaLineResult field = NmeaParser::decodeLine(bad_lat);
    EXPECT_EQ(field.error, NmeaErrorKind::Field);
    EXPECT_NE(field.message.find("GLL"), std::string::npos);

    const std::string short_gga = encodeSentence("GP", "GGA", {"120000", "4807.038", "N"});
    EXPECT_EQ(NmeaParser::decodeLine(short_gga).error, NmeaErrorKind::Field);
}

TEST(NmeaLineSplitter, SplitsAcrossChunks) {
    NmeaLineSplitter splitter;
    const std::string first = "$GPGSA,A,3,10,07,05,02,29,04,08,13,,,,,1.72";
    const std::string second = ",1.03,1.38*0A\r\n$GPGSV,3,1,11,10,63,137,17,07,61,098,15,05,59,290,20,08,54,157,30*70\r\n";
    EXPECT_TRUE(splitter.feed(first.data(), first.size()).empty());
    const std::vector<std::string> lines = splitter.feed(second.data(), second.size());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], kGsa);
    EXPECT_EQ(lines[1], kGsv);
}

TEST(NmeaLineSplitter, DropsOverlongLine) {
    NmeaLineSplitter splitter;
    const std::string junk(200, 'x');
    const std::string input = junk + "\n" + kGsa + "\n";
    const std::vector<std::string> lines = splitter.feed(input.data(), input.size());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], kGsa);
    EXPECT_EQ(splitter.overflows(), 1u);
}
