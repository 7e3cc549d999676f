/*
    Meade LX200 driver

    Copyright (C) 2026 The indi-meade developers

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/

#include "lx200channel.h"
#include "lx200codec.h"
#include "mockmount.h"

#include <indilogger.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::Contains;
using ::testing::ElementsAre;

class LX200CodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(channel.attach(mount.fd(), 2), MEADE_OK);
    }

    MockMount mount;
    LX200Channel channel;
    LX200Codec codec {channel};
};

TEST(LX200Channel, ClosedPort)
{
    LX200Channel channel;
    std::string data;
    EXPECT_FALSE(channel.isOpen());
    EXPECT_EQ(channel.write(":GR#"), MEADE_LINK_ERROR);
    EXPECT_EQ(channel.read(data), MEADE_LINK_ERROR);
    EXPECT_EQ(channel.read(data, 1, true), MEADE_LINK_ERROR);
    EXPECT_EQ(channel.readUntil(data), MEADE_LINK_ERROR);
    EXPECT_EQ(channel.close(), MEADE_LINK_ERROR);
    EXPECT_EQ(channel.attach(-1), MEADE_LINK_ERROR);
}

TEST(LX200Channel, BadTraceFile)
{
    LX200Channel channel;
    EXPECT_FALSE(channel.openTrace("/nonexistent/directory/trace.log"));
    EXPECT_FALSE(channel.isTracing());
}

TEST(LX200Channel, ScopedTimeout)
{
    LX200Channel channel;
    channel.setTimeout(3);
    {
        LX200Channel::ScopedTimeout timeout(channel, 60);
        EXPECT_EQ(channel.getTimeout(), 60);
    }
    EXPECT_EQ(channel.getTimeout(), 3);
}

TEST_F(LX200CodecTest, ReadKeepsPendingInput)
{
    mount.setRaDec(6.0, 0.0);
    ASSERT_EQ(channel.write(":GR#", false), MEADE_OK);

    std::string data;
    ASSERT_EQ(channel.read(data, 9, false), MEADE_OK);
    EXPECT_EQ(data, "06\xDF" "00:00#");
}

TEST_F(LX200CodecTest, CheckConnection)
{
    EXPECT_EQ(codec.checkConnection(), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre("<ACK>"));

    mount.setReply("<ACK>", "X");
    EXPECT_EQ(codec.checkConnection(), MEADE_UNEXPECTED_REPLY);
}

TEST_F(LX200CodecTest, AlignModeWithLeadingZero)
{
    MeadeAlignMode mode;
    mount.setAlignMode('L');
    mount.setZeroBeforeMode(true);
    ASSERT_EQ(codec.getAlignMode(&mode), MEADE_OK);
    EXPECT_EQ(mode, MEADE_ALIGN_LAND);

    mount.setZeroBeforeMode(false);
    mount.setAlignMode('A');
    ASSERT_EQ(codec.getAlignMode(&mode), MEADE_OK);
    EXPECT_EQ(mode, MEADE_ALIGN_ALTAZ);
}

TEST_F(LX200CodecTest, SetAlignMode)
{
    mount.setAlignMode('A');
    EXPECT_EQ(codec.setAlignMode(MEADE_ALIGN_ALTAZ), MEADE_OK);
    // already in the mode, nothing sent after the query
    EXPECT_THAT(mount.commands(), ElementsAre("<ACK>"));

    mount.clearCommands();
    EXPECT_EQ(codec.setAlignMode(MEADE_ALIGN_POLAR), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre("<ACK>", ":AP#"));
    EXPECT_EQ(mount.getAlignMode(), 'P');

    // a missing acknowledge is tolerated
    mount.setReply(":AL#", "0");
    EXPECT_EQ(codec.setAlignMode(MEADE_ALIGN_LAND), MEADE_OK);
}

TEST_F(LX200CodecTest, HighPrecision)
{
    mount.setRaDec(12.5, 0);
    EXPECT_EQ(codec.setHighPrecision(), MEADE_OK);
    EXPECT_EQ(mount.count(":U#"), 0);

    mount.setReply(":GR#", "12:30.0#");
    EXPECT_EQ(codec.setHighPrecision(), MEADE_OK);
    EXPECT_EQ(mount.count(":U#"), 1);
}

TEST_F(LX200CodecTest, ReadPositions)
{
    Position position;
    mount.setRaDec(12.5, -30.25);
    ASSERT_EQ(codec.getPosition(Position::EQUATORIAL, &position), MEADE_OK);
    EXPECT_NEAR(position.ra(), 12.5, 1.0 / 3600.0);
    EXPECT_NEAR(position.dec(), -30.25, 1.0 / 3600.0);

    mount.setAltAz(45.0, 270.0);
    ASSERT_EQ(codec.getPosition(Position::HORIZONTAL, &position), MEADE_OK);
    EXPECT_NEAR(position.alt(), 45.0, 1.0 / 3600.0);
    EXPECT_NEAR(position.az(), 90.0, 1.0 / 3600.0);

    codec.setAzimuthCorrection(false);
    double az = 0;
    ASSERT_EQ(codec.getAz(&az), MEADE_OK);
    EXPECT_NEAR(az, 270.0, 1.0 / 3600.0);
}

TEST_F(LX200CodecTest, StalePrefixIgnored)
{
    double ra = 0, dec = 0;
    mount.setReply(":GR#", "X06\xDF" "00:00#");
    mount.setReply(":GD#", "X+10\xDF" "00:00#");
    ASSERT_EQ(codec.getRA(&ra), MEADE_OK);
    EXPECT_NEAR(ra, 6.0, 1e-6);
    ASSERT_EQ(codec.getDec(&dec), MEADE_OK);
    EXPECT_NEAR(dec, 10.0, 1e-6);
}

TEST_F(LX200CodecTest, UnparsableReply)
{
    double ra = 0;
    mount.setReply(":GR#", "junk#");
    EXPECT_EQ(codec.getRA(&ra), MEADE_UNEXPECTED_REPLY);
}

TEST_F(LX200CodecTest, Targets)
{
    EXPECT_TRUE(std::isnan(codec.getTargetAlt()));
    EXPECT_TRUE(std::isnan(codec.getTargetAz()));

    ASSERT_EQ(codec.setTargetRaDec(5.5, -20.5), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":Sr05\xDF" "30:00#", ":Sd-20\xDF" "30:00#"));

    double ra = 0, dec = 0;
    ASSERT_EQ(codec.getTargetRA(&ra), MEADE_OK);
    ASSERT_EQ(codec.getTargetDec(&dec), MEADE_OK);
    EXPECT_NEAR(ra, 5.5, 1e-6);
    EXPECT_NEAR(dec, -20.5, 1e-6);

    // azimuth goes out with the 180 degree correction
    mount.clearCommands();
    ASSERT_EQ(codec.setTargetAltAz(30.0, 90.0), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":Sa+30\xDF" "00:00#", ":Sz270\xDF" "00:00#"));
    EXPECT_DOUBLE_EQ(codec.getTargetAlt(), 30.0);
    EXPECT_DOUBLE_EQ(codec.getTargetAz(), 90.0);
}

TEST_F(LX200CodecTest, TargetRejected)
{
    mount.setRejectValues(true);
    EXPECT_EQ(codec.setTargetRA(5.5), MEADE_COMMAND_REJECTED);
    EXPECT_EQ(codec.setTargetAlt(30.0), MEADE_COMMAND_REJECTED);
    EXPECT_TRUE(std::isnan(codec.getTargetAlt()));
}

TEST_F(LX200CodecTest, StartSlew)
{
    EXPECT_EQ(codec.startSlew(Position::EQUATORIAL), MEADE_OK);
    EXPECT_EQ(codec.startSlew(Position::HORIZONTAL), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":MS#", ":MA#"));

    mount.setReply(":MS#", "1Object Below Horizon#");
    EXPECT_EQ(codec.startSlew(Position::EQUATORIAL), MEADE_COMMAND_REJECTED);

    mount.setReply(":MA#", "2");
    EXPECT_EQ(codec.startSlew(Position::HORIZONTAL), MEADE_COMMAND_REJECTED);

    // unknown acknowledgements leave the slew running
    mount.setReply(":MS#", "X");
    EXPECT_EQ(codec.startSlew(Position::EQUATORIAL), MEADE_OK);
}

TEST_F(LX200CodecTest, StartSlewWithoutReply)
{
    channel.setTimeout(1);
    mount.setReply(":MS#", "");
    EXPECT_EQ(codec.startSlew(Position::EQUATORIAL), MEADE_OK);

    // the link stays in step for the polls that follow
    Position position;
    EXPECT_EQ(codec.getPosition(Position::EQUATORIAL, &position), MEADE_OK);
}

TEST_F(LX200CodecTest, Sync)
{
    mount.setRaDec(1.0, 1.0);
    EXPECT_EQ(codec.sync(10.0, 45.0), MEADE_OK);
    EXPECT_EQ(mount.count(":CM#"), 1);
    EXPECT_NEAR(mount.getRA(), 10.0, 1e-6);
    EXPECT_NEAR(mount.getDec(), 45.0, 1e-6);

    mount.setReply(":CM#", "#");
    EXPECT_EQ(codec.sync(10.0, 45.0), MEADE_COMMAND_REJECTED);
}

TEST_F(LX200CodecTest, SlewRates)
{
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_GUIDE), MEADE_OK);
    EXPECT_EQ(codec.getSlewRate(), MEADE_SLEW_GUIDE);
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_CENTER), MEADE_OK);
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_FIND), MEADE_OK);
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_MAX), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":RG#", ":RC#", ":RM#", ":Sw4#", ":RS#"));
    EXPECT_EQ(codec.getSlewRate(), MEADE_SLEW_MAX);

    mount.setReply(":Sw4#", "0");
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_GUIDE), MEADE_OK);
    EXPECT_EQ(codec.setSlewRate(MEADE_SLEW_MAX), MEADE_COMMAND_REJECTED);
    EXPECT_EQ(codec.getSlewRate(), MEADE_SLEW_GUIDE);
}

TEST_F(LX200CodecTest, Motion)
{
    EXPECT_EQ(codec.moveStart(MEADE_NORTH), MEADE_OK);
    EXPECT_EQ(codec.moveStop(MEADE_NORTH), MEADE_OK);
    EXPECT_EQ(codec.moveStart(MEADE_WEST), MEADE_OK);
    EXPECT_EQ(codec.stopAll(), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":Mn#", ":Qn#", ":Mw#", ":Q#"));
}

TEST_F(LX200CodecTest, Date)
{
    int year, month, day;
    ASSERT_EQ(codec.getDate(&year, &month, &day), MEADE_OK);
    EXPECT_EQ(year, 2026);
    EXPECT_EQ(month, 10);
    EXPECT_EQ(day, 19);

    EXPECT_EQ(codec.setDate(2026, 10, 19), MEADE_OK);
    EXPECT_EQ(mount.count(":SC10/19/26#"), 1);

    // rejected dates are followed by a junk byte which must be consumed
    EXPECT_EQ(codec.setDate(2026, 13, 1), MEADE_COMMAND_REJECTED);
    EXPECT_EQ(codec.getDate(&year, &month, &day), MEADE_OK);
    EXPECT_EQ(month, 10);

    mount.setReply(":SC10/19/26#", "X");
    EXPECT_EQ(codec.setDate(2026, 10, 19), MEADE_UNEXPECTED_REPLY);
}

TEST_F(LX200CodecTest, SiteAndTime)
{
    double latitude, longitude, lst, offset;
    int hour, minute, second;

    ASSERT_EQ(codec.getLatitude(&latitude), MEADE_OK);
    EXPECT_NEAR(latitude, 48 + 8 / 60.0, 1e-6);
    ASSERT_EQ(codec.getLongitude(&longitude), MEADE_OK);
    EXPECT_NEAR(longitude, 348 + 25 / 60.0, 1e-6);
    ASSERT_EQ(codec.getLocalTime(&hour, &minute, &second), MEADE_OK);
    EXPECT_EQ(hour, 21);
    EXPECT_EQ(minute, 30);
    EXPECT_EQ(second, 15);
    ASSERT_EQ(codec.getSiderealTime(&lst), MEADE_OK);
    EXPECT_NEAR(lst, 6.25, 1e-6);
    ASSERT_EQ(codec.getUTCOffset(&offset), MEADE_OK);
    EXPECT_DOUBLE_EQ(offset, -2.0);

    mount.clearCommands();
    EXPECT_EQ(codec.setLocalTime(9, 5, 7), MEADE_OK);
    EXPECT_EQ(codec.setSiderealTime(6.25), MEADE_OK);
    EXPECT_EQ(codec.setUTCOffset(-2), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":SL09:05:07#", ":SS06:15:00#", ":SG-2.0#"));
}

TEST_F(LX200CodecTest, SetSite)
{
    MeadeSite site;
    site.latitude  = 48 + 8 / 60.0;
    site.longitude = 11 + 35 / 60.0;
    site.utcOffset = 2.0;

    struct tm utc = {};
    utc.tm_year = 2026 - 1900;
    utc.tm_mon  = 9;
    utc.tm_mday = 19;
    utc.tm_hour = 19;
    utc.tm_min  = 30;
    site.now = timegm(&utc);

    ASSERT_EQ(codec.setSite(site), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":St+48\xDF" "08:00#", ":Sg348\xDF" "25:00#", ":SL21:30:00#",
                ":SG-2.0#", ":SC10/19/26#"));
}

TEST_F(LX200CodecTest, Tracking)
{
    double frequency = 0;
    ASSERT_EQ(codec.getTrackingFrequency(&frequency), MEADE_OK);
    EXPECT_DOUBLE_EQ(frequency, 60.1);

    mount.clearCommands();
    EXPECT_EQ(codec.setTrackingFrequency(59.5), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre(":ST59.5#", ":TM#"));

    // tracking is stopped through LAND, the previous mode comes back
    mount.setAlignMode('P');
    EXPECT_EQ(codec.stopTracking(), MEADE_OK);
    EXPECT_EQ(mount.getAlignMode(), 'L');
    EXPECT_EQ(codec.stopTracking(), MEADE_OK);
    EXPECT_EQ(mount.getAlignMode(), 'L');
    EXPECT_EQ(codec.startTracking(), MEADE_OK);
    EXPECT_EQ(mount.getAlignMode(), 'P');

    mount.clearCommands();
    EXPECT_EQ(codec.startTracking(), MEADE_OK);
    EXPECT_THAT(mount.commands(), ElementsAre("<ACK>"));
}

TEST_F(LX200CodecTest, AutoAlign)
{
    EXPECT_EQ(codec.autoAlign(), MEADE_OK);
    EXPECT_EQ(mount.count(":Aa#"), 1);
    EXPECT_EQ(channel.getTimeout(), 2);
}

/*******************************************************************************
** Exchanges of concurrent threads must never interleave on the wire
*******************************************************************************/
TEST_F(LX200CodecTest, ConcurrentExchanges)
{
    char path[] = "/tmp/meade_traceXXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    ASSERT_TRUE(channel.openTrace(path));

    mount.setRaDec(12.5, -30.25);
    int failures = 0;
    std::thread other([&]()
    {
        for (int i = 0; i < 25; i++)
        {
            double dec = 0;
            if (codec.getDec(&dec) != MEADE_OK || std::fabs(dec + 30.25) > 1e-3)
                failures++;
        }
    });
    for (int i = 0; i < 25; i++)
    {
        double ra = 0;
        EXPECT_EQ(codec.getRA(&ra), MEADE_OK);
        EXPECT_NEAR(ra, 12.5, 1e-3);
    }
    other.join();
    channel.closeTrace();
    EXPECT_EQ(failures, 0);

    std::ifstream trace(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(trace, line))
        lines.push_back(line);
    unlink(path);

    ASSERT_EQ(lines.size(), 100u);
    for (size_t i = 0; i < lines.size(); i += 2)
    {
        ASSERT_NE(lines[i].find("[write]"), std::string::npos) << lines[i];
        ASSERT_NE(lines[i + 1].find("[read ]"), std::string::npos) << lines[i + 1];

        // same thread on both lines
        std::string writer = lines[i].substr(0, lines[i].find(" [")).substr(lines[i].find(' ') + 1);
        std::string reader = lines[i + 1].substr(0, lines[i + 1].find(" [")).substr(lines[i + 1].find(' ') + 1);
        EXPECT_EQ(writer, reader);
    }
    EXPECT_THAT(lines, Contains(::testing::HasSubstr("':GR#'")));
    EXPECT_THAT(lines, Contains(::testing::HasSubstr("':GD#'")));
}

int main(int argc, char **argv)
{
    INDI::Logger::getInstance().configure("", INDI::Logger::file_off,
                                          INDI::Logger::DBG_ERROR, INDI::Logger::DBG_ERROR);

    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
