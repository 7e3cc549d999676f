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

#ifndef MEADE_MOCKMOUNT_H
#define MEADE_MOCKMOUNT_H

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/*******************************************************************************
** Simulated LX200 mount on the far end of a socket pair.
**
** Every command received is logged. Slews reach the target after a number
** of position polls, timed moves shift the position by a fixed distance.
*******************************************************************************/
class MockMount
{
public:
    MockMount();
    ~MockMount();

    // descriptor to attach the channel to
    int fd() const { return m_Fds[0]; }

    // commands received so far, the ACK byte is logged as "<ACK>"
    std::vector<std::string> commands();
    int count(const std::string &command);
    void clearCommands();

    // fixed reply for a command, the simulation still sees the command
    void setReply(const std::string &command, const std::string &reply);

    void setAlignMode(char mode);
    char getAlignMode();
    void setZeroBeforeMode(bool enabled);
    void setRaDec(double ra, double dec);
    // az as sent on the wire, before the 180 degree correction
    void setAltAz(double alt, double az);
    double getRA();
    double getDec();

    // position polls until a slew arrives, negative never arrives
    void setPollsToArrive(int polls);
    // arcsec moved by a :Mx# ... :Qx# pair
    void setMoveDistance(double arcsec);
    void setRejectValues(bool reject);

private:
    void run();
    std::string handle(const std::string &command);
    void poll(bool equatorial);

    int m_Fds[2];
    std::thread m_Thread;
    std::atomic<bool> m_Running {true};

    std::mutex m_Lock;
    std::vector<std::string> m_Commands;
    std::map<std::string, std::string> m_Replies;

    char m_AlignMode {'P'};
    bool m_ZeroBeforeMode {false};
    bool m_RejectValues {false};

    double m_RA {0}, m_Dec {0};
    double m_Alt {0}, m_Az {0};
    double m_TargetRA {0}, m_TargetDec {0};
    double m_TargetAlt {0}, m_TargetAz {0};

    int m_PollsToArrive {2};
    int m_PollsLeft {0};
    bool m_Slewing {false};
    bool m_SlewEquatorial {true};

    double m_MoveDistance {60.0};
    char m_Moving {0};
};

#endif // MEADE_MOCKMOUNT_H
