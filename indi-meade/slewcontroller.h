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

#ifndef MEADE_SLEWCONTROLLER_H
#define MEADE_SLEWCONTROLLER_H

#include "lx200codec.h"
#include "lx200types.h"

#include <atomic>
#include <chrono>

/*******************************************************************************
** One slew in flight
*******************************************************************************/
struct SlewSession
{
    SlewSession(const Position &target) : target(target), start(std::chrono::steady_clock::now()) {}

    Position target;
    std::chrono::steady_clock::time_point start;
    SlewState phase {SLEW_REQUESTED};
};

/*******************************************************************************
** Slews the mount to a position and waits until it gets there.
**
** slewTo* block the calling thread until the slew ends. abortSlew() may be
** called from any other thread meanwhile: the poll loop only takes the
** communications lock for each position query, so the stop command of
** the abort goes out between two polls.
*******************************************************************************/
class SlewController
{
public:
    explicit SlewController(LX200Codec &codec);
    virtual ~SlewController() = default;

    const char *getDeviceName() const { return m_Codec.getDeviceName(); }

    double getMaxSlewTime() const { return m_MaxSlewTime; }
    void setMaxSlewTime(double seconds) { m_MaxSlewTime = seconds; }
    double getStabilizationTime() const { return m_StabilizationTime; }
    void setStabilizationTime(double seconds) { m_StabilizationTime = seconds; }
    double getSlewIdleTime() const { return m_SlewIdleTime; }
    void setSlewIdleTime(double seconds) { m_SlewIdleTime = seconds; }

    int slewToRaDec(double ra, double dec);
    int slewToAltAz(double alt, double az);
    int abortSlew();

    bool isSlewing() const { return m_Slewing; }
    SlewState getState() const { return m_State; }
    // terminal state of the last slew
    SlewState getLastOutcome() const { return m_LastOutcome; }

    /**
     * @brief Claims the mount for a motion other than a slew (fine moves).
     * A slew started while the lock is held fails with MEADE_ALREADY_SLEWING.
     */
    class MotionLock
    {
    public:
        explicit MotionLock(SlewController &controller);
        ~MotionLock();
        bool ownsLock() const { return m_Owns; }
    private:
        SlewController &m_Controller;
        bool m_Owns;
    };

protected:
    int startSlew(SlewSession &session);
    int waitSlew(SlewSession &session);
    void finishSlew(SlewSession &session);
    void pause(double seconds);

    LX200Codec &m_Codec;
    std::atomic<bool> m_Abort {false};
    std::atomic<bool> m_Slewing {false};
    std::atomic<SlewState> m_State {SLEW_IDLE};
    std::atomic<SlewState> m_LastOutcome {SLEW_IDLE};

private:
    // switches the mount to ALT_AZ and back to the previous mode
    class AlignModeGuard
    {
    public:
        explicit AlignModeGuard(LX200Codec &codec);
        ~AlignModeGuard();
        int status() const { return m_Status; }
        const char *getDeviceName() const { return m_Codec.getDeviceName(); }
    private:
        LX200Codec &m_Codec;
        MeadeAlignMode m_Previous {MEADE_ALIGN_ALTAZ};
        bool m_Restore {false};
        int m_Status {MEADE_OK};
    };

    std::atomic<double> m_MaxSlewTime {90.0};
    std::atomic<double> m_StabilizationTime {2.0};
    std::atomic<double> m_SlewIdleTime {0.1};
};

#endif // MEADE_SLEWCONTROLLER_H
