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

#ifndef MEADE_TELESCOPE_H
#define MEADE_TELESCOPE_H

#include <inditelescope.h>

#include <indicom.h>
#include <indilogger.h>

#include "lx200channel.h"
#include "lx200codec.h"
#include "movecalibrator.h"
#include "slewcontroller.h"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#define MEADE_TRACE_FILE "/.indi/MeadeTrace.log"

// Meade specific tabs
extern const char *ADVANCED_TAB;

class MeadeTelescope : public INDI::Telescope
{
public:
    enum MeadeJob
    {
        JOB_NONE = 0,
        JOB_GOTO,
        JOB_PARK,
        JOB_FINE_MOVE,
        JOB_CALIBRATE,
        JOB_AUTO_ALIGN
    };

    MeadeTelescope();
    virtual ~MeadeTelescope();

    virtual const char *getDefaultName() override;
    virtual bool Handshake() override;
    virtual bool Disconnect() override;
    virtual void ISGetProperties(const char *dev) override;
    virtual bool ISNewSwitch(const char *dev, const char *name, ISState *states, char *names[], int n) override;
    virtual bool ISNewNumber(const char *dev, const char *name, double values[], char *names[], int n) override;
    virtual bool initProperties() override;
    virtual bool updateProperties() override;
    virtual bool saveConfigItems(FILE *fp) override;

protected:
    // Align mode
    INDI::PropertySwitch AlignModeSP {3};

    // skip the initialization sequence on connect
    INDI::PropertySwitch SkipInitSP {2};

    // serial timeout
    INDI::PropertyNumber LinkTimeoutNP {1};

    // slew timing
    INDI::PropertyNumber SlewTimingNP {3};
    enum
    {
        SLEW_MAX_TIME,
        SLEW_STABILIZATION_TIME,
        SLEW_IDLE_TIME
    };

    // mounts with the azimuth origin at south
    INDI::PropertySwitch Azimuth180SP {2};

    // LX200 traffic trace file
    INDI::PropertySwitch TraceSP {2};

    INDI::PropertyNumber TrackFrequencyNP {1};
    INDI::PropertyNumber SiderealTimeNP {1};

    // Fine moves
    INDI::PropertyNumber FineMoveNP {4};
    INDI::PropertySwitch CalibrateSP {1};
    INDI::PropertySwitch AutoAlignSP {1};

    unsigned int DBG_SCOPE;

/***********************************************************************************************
* Virtual functions
 ***********************************************************************************************/
        // Telescope:: virtual functions
    virtual bool ReadScopeStatus() override;
    virtual bool updateLocation(double latitude, double longitude, double elevation) override;
    virtual bool updateTime(ln_date *utc, double utc_offset) override;
    virtual bool Sync(double ra, double dec) override;
    virtual bool SetDefaultPark() override;
    virtual bool SetCurrentPark() override;
    virtual bool Park() override;
    virtual bool UnPark() override;
    virtual bool SetSlewRate(int index) override;
    virtual bool Goto(double ra, double dec) override;
    virtual bool Abort() override;
    virtual bool SetTrackEnabled(bool enabled) override;
    virtual bool MoveNS(INDI_DIR_NS dir, TelescopeMotionCommand command) override;
    virtual bool MoveWE(INDI_DIR_WE dir, TelescopeMotionCommand command) override;

/***********************************************************************************************
* Meade specific functions
 ***********************************************************************************************/
    bool initTelescope();
    void getBasicData();
    bool move(MeadeDirection direction, TelescopeMotionCommand command);
    bool setTrace(bool enabled);

// Worker thread for slews, parking and fine moves
    bool startJob(MeadeJob job, std::function<int()> work);
    void finishJob();
    void stopWorker();

    LX200Channel m_Channel;
    LX200Codec m_Codec;
    SlewController m_Slew;
    MoveCalibrator m_Calibrator;

private:
    std::thread m_Worker;
    std::atomic<int> m_Job {JOB_NONE};
    std::atomic<bool> m_JobDone {false};
    std::atomic<int> m_JobResult {MEADE_OK};
};

#endif // MEADE_TELESCOPE_H
