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
#include "slewcontroller.h"

#include <indilogger.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::Contains;

// exposes the poll loop
class TestSlewController : public SlewController
{
public:
    explicit TestSlewController(LX200Codec &codec) : SlewController(codec) {}

    using SlewController::waitSlew;
    void requestAbort() { m_Abort = true; }
};

class SlewControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(channel.attach(mount.fd(), 2), MEADE_OK);
        slew.setStabilizationTime(0);
        slew.setSlewIdleTime(0.01);
    }

    // position of the first command after the given one, or -1
    int indexOf(const std::string &command)
    {
        std::vector<std::string> commands = mount.commands();
        auto it = std::find(commands.begin(), commands.end(), command);
        return it == commands.end() ? -1 : static_cast<int>(it - commands.begin());
    }

    int lastIndexOf(const std::string &command)
    {
        std::vector<std::string> commands = mount.commands();
        auto it = std::find(commands.rbegin(), commands.rend(), command);
        return it == commands.rend() ? -1 : static_cast<int>(commands.rend() - it - 1);
    }

    MockMount mount;
    LX200Channel channel;
    LX200Codec codec {channel};
    TestSlewController slew {codec};
};

TEST_F(SlewControllerTest, CompletesOnFirstPoll)
{
    mount.setRaDec(5.0, 10.0);
    SlewSession session(Position::fromRaDec(5.0, 10.0));

    EXPECT_EQ(slew.waitSlew(session), MEADE_OK);
    EXPECT_EQ(session.phase, SLEW_COMPLETE);
    EXPECT_EQ(mount.count(":GR#"), 1);
    EXPECT_EQ(mount.count(":GD#"), 1);
    EXPECT_EQ(mount.count(":Q#"), 0);
}

TEST_F(SlewControllerTest, AbortStopsOnce)
{
    SlewSession session(Position::fromRaDec(5.0, 10.0));
    slew.requestAbort();

    EXPECT_EQ(slew.waitSlew(session), MEADE_OK);
    EXPECT_EQ(session.phase, SLEW_ABORTED);
    EXPECT_EQ(mount.count(":Q#"), 1);
    EXPECT_EQ(mount.count(":GR#"), 0);
}

TEST_F(SlewControllerTest, TimeoutStopsOnce)
{
    SlewSession session(Position::fromRaDec(5.0, 10.0));
    slew.setMaxSlewTime(0);

    EXPECT_EQ(slew.waitSlew(session), MEADE_SLEW_TIMEOUT);
    EXPECT_EQ(session.phase, SLEW_TIMED_OUT);
    EXPECT_EQ(mount.count(":Q#"), 1);
    EXPECT_EQ(mount.count(":GR#"), 0);
}

TEST_F(SlewControllerTest, PositionErrorAbandonsSlew)
{
    mount.setReply(":GR#", "junk#");
    SlewSession session(Position::fromRaDec(5.0, 10.0));

    EXPECT_EQ(slew.waitSlew(session), MEADE_UNEXPECTED_REPLY);
    EXPECT_EQ(session.phase, SLEW_ABORTED);
    EXPECT_EQ(mount.count(":Q#"), 0);
}

TEST_F(SlewControllerTest, SlewToRaDec)
{
    mount.setRaDec(1.0, 0.0);
    mount.setPollsToArrive(3);

    EXPECT_EQ(slew.slewToRaDec(5.0, 20.0), MEADE_OK);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_COMPLETE);
    EXPECT_EQ(slew.getState(), SLEW_IDLE);
    EXPECT_FALSE(slew.isSlewing());

    EXPECT_LT(indexOf(":Sr05\xDF" "00:00#"), indexOf(":MS#"));
    EXPECT_LT(indexOf(":Sd+20\xDF" "00:00#"), indexOf(":MS#"));
    EXPECT_EQ(mount.count(":GR#"), 3);
    EXPECT_EQ(mount.count(":Q#"), 0);
}

TEST_F(SlewControllerTest, SlewWithoutStartReply)
{
    channel.setTimeout(1);
    mount.setRaDec(1.0, 0.0);
    mount.setPollsToArrive(2);
    mount.setReply(":MS#", "");

    EXPECT_EQ(slew.slewToRaDec(5.0, 20.0), MEADE_OK);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_COMPLETE);
    EXPECT_EQ(mount.count(":GR#"), 2);
}

TEST_F(SlewControllerTest, SlewRejected)
{
    mount.setReply(":MS#", "1Object Below Horizon#");

    EXPECT_EQ(slew.slewToRaDec(5.0, -80.0), MEADE_COMMAND_REJECTED);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_REJECTED);
    EXPECT_FALSE(slew.isSlewing());
    EXPECT_EQ(mount.count(":GR#"), 0);
}

TEST_F(SlewControllerTest, SlewTimesOut)
{
    mount.setPollsToArrive(-1);
    slew.setMaxSlewTime(0.2);

    EXPECT_EQ(slew.slewToRaDec(5.0, 20.0), MEADE_SLEW_TIMEOUT);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_TIMED_OUT);
    EXPECT_FALSE(slew.isSlewing());
    EXPECT_EQ(mount.count(":Q#"), 1);
    // no position query after the stop
    EXPECT_LT(lastIndexOf(":GD#"), indexOf(":Q#"));
}

TEST_F(SlewControllerTest, AbortFromAnotherThread)
{
    mount.setPollsToArrive(-1);
    slew.setMaxSlewTime(30);

    int rc = MEADE_LINK_ERROR;
    std::thread worker([&]()
    {
        rc = slew.slewToRaDec(5.0, 20.0);
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (mount.count(":GR#") < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(slew.isSlewing());

    EXPECT_EQ(slew.abortSlew(), MEADE_OK);
    worker.join();

    EXPECT_EQ(rc, MEADE_OK);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_ABORTED);
    EXPECT_FALSE(slew.isSlewing());
    EXPECT_GE(mount.count(":Q#"), 1);
}

TEST_F(SlewControllerTest, AbortWhenIdle)
{
    EXPECT_EQ(slew.abortSlew(), MEADE_OK);
    EXPECT_TRUE(mount.commands().empty());
}

TEST_F(SlewControllerTest, AbortBetweenSlewsIsDropped)
{
    // abort flag left over from a slew that ended first
    slew.requestAbort();
    mount.setRaDec(1.0, 0.0);
    mount.setPollsToArrive(2);

    EXPECT_EQ(slew.slewToRaDec(5.0, 20.0), MEADE_OK);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_COMPLETE);
    EXPECT_EQ(mount.count(":GR#"), 2);
    EXPECT_EQ(mount.count(":Q#"), 0);
}

TEST_F(SlewControllerTest, SlewToAltAzRestoresAlignMode)
{
    mount.setAlignMode('P');
    mount.setAltAz(10.0, 0.0);
    mount.setPollsToArrive(2);

    EXPECT_EQ(slew.slewToAltAz(45.0, 90.0), MEADE_OK);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_COMPLETE);
    EXPECT_EQ(mount.getAlignMode(), 'P');

    EXPECT_THAT(mount.commands(), Contains(":Sz270\xDF" "00:00#"));
    int altaz = indexOf(":AA#");
    int start = indexOf(":MA#");
    int polar = indexOf(":AP#");
    ASSERT_GE(altaz, 0);
    EXPECT_LT(altaz, start);
    EXPECT_LT(start, polar);
}

TEST_F(SlewControllerTest, SlewToAltAzRestoresAlignModeOnFailure)
{
    mount.setAlignMode('P');
    mount.setReply(":MA#", "1");

    EXPECT_EQ(slew.slewToAltAz(45.0, 90.0), MEADE_COMMAND_REJECTED);
    EXPECT_EQ(slew.getLastOutcome(), SLEW_REJECTED);
    EXPECT_EQ(mount.getAlignMode(), 'P');
}

TEST_F(SlewControllerTest, AlreadySlewing)
{
    {
        SlewController::MotionLock motion(slew);
        ASSERT_TRUE(motion.ownsLock());
        EXPECT_TRUE(slew.isSlewing());

        SlewController::MotionLock second(slew);
        EXPECT_FALSE(second.ownsLock());

        EXPECT_EQ(slew.slewToRaDec(5.0, 20.0), MEADE_ALREADY_SLEWING);
        EXPECT_EQ(slew.slewToAltAz(45.0, 90.0), MEADE_ALREADY_SLEWING);
        EXPECT_TRUE(mount.commands().empty());
    }
    EXPECT_FALSE(slew.isSlewing());
}

int main(int argc, char **argv)
{
    INDI::Logger::getInstance().configure("", INDI::Logger::file_off,
                                          INDI::Logger::DBG_ERROR, INDI::Logger::DBG_ERROR);

    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
