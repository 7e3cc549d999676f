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
#include "meade.h"

#include <cmath>
#include <cstring>
#include <ctime>
#include <utility>
#include <vector>

#include <libnova/julian_day.h>
#include <libnova/utility.h>

#include "config.h"

#define MEADE_PARK_AZ  180.0
#define MEADE_PARK_ALT 90.0

/*******************************************************************************
*** Meade Implementation
*******************************************************************************/
const char *ADVANCED_TAB = "Advanced";

MeadeTelescope::MeadeTelescope() : m_Codec(m_Channel), m_Slew(m_Codec), m_Calibrator(m_Codec, m_Slew)
{
    LOG_DEBUG(__FUNCTION__);
    setVersion(MEADE_VERSION_MAJOR, MEADE_VERSION_MINOR);

    DBG_SCOPE = INDI::Logger::getInstance().addDebugLevel("Scope Verbose", "SCOPE");

    SetTelescopeCapability(TELESCOPE_CAN_PARK | TELESCOPE_CAN_SYNC | TELESCOPE_CAN_GOTO | TELESCOPE_CAN_ABORT |
                           TELESCOPE_HAS_TIME | TELESCOPE_HAS_LOCATION | TELESCOPE_CAN_CONTROL_TRACK, 4);
}

MeadeTelescope::~MeadeTelescope()
{
    stopWorker();
}

/*******************************************************************************
**
** VIRTUAL METHODS
**
*******************************************************************************/

/*******************************************************************************
 *
 ******************************************************************************/
const char *MeadeTelescope::getDefaultName()
{
    return "Meade LX200";
}

/*******************************************************************************
** Handshake is called when the driver first connects (physically) to the mount
*******************************************************************************/
bool MeadeTelescope::Handshake()
{
    LOG_DEBUG(__FUNCTION__);

    m_Channel.setDeviceName(getDeviceName());
    m_Channel.setDebugLevel(DBG_SCOPE);
    m_Codec.setAzimuthCorrection(Azimuth180SP[INDI_ENABLED].getState() == ISS_ON);

    if (m_Channel.attach(PortFD, static_cast<int>(LinkTimeoutNP[0].getValue())) != MEADE_OK)
        return false;

    if (m_Codec.checkConnection() != MEADE_OK)
    {
        LOG_ERROR("Error communication with telescope.");
        return false;
    }

    if (SkipInitSP[INDI_ENABLED].getState() == ISS_ON)
        LOG_INFO("Skipping telescope initialization.");
    else if (!initTelescope())
    {
        LOG_ERROR("Telescope initialization failed.");
        return false;
    }

    m_Calibrator.loadCalibration();
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::Disconnect()
{
    LOG_DEBUG(__FUNCTION__);
    stopWorker();
    if (m_Channel.isOpen() && m_Channel.close() != MEADE_OK)
        LOG_WARN("Failed to release the port.");
    return INDI::Telescope::Disconnect();
}

/*******************************************************************************
** Options needed before the connection is made
*******************************************************************************/
void MeadeTelescope::ISGetProperties(const char *dev)
{
    INDI::Telescope::ISGetProperties(dev);

    defineProperty(LinkTimeoutNP);
    loadConfig(true, LinkTimeoutNP.getName());
    defineProperty(AlignModeSP);
    loadConfig(true, AlignModeSP.getName());
    defineProperty(SkipInitSP);
    loadConfig(true, SkipInitSP.getName());
    defineProperty(Azimuth180SP);
    loadConfig(true, Azimuth180SP.getName());
    defineProperty(SlewTimingNP);
    loadConfig(true, SlewTimingNP.getName());
    defineProperty(TraceSP);
    loadConfig(true, TraceSP.getName());
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::ISNewSwitch(const char *dev, const char *name, ISState *states, char *names[], int n)
{
    if (dev != nullptr && strcmp(dev, getDeviceName()) == 0)
    {
        // align mode
        if (AlignModeSP.isNameMatch(name))
        {
            int previous = AlignModeSP.findOnSwitchIndex();
            if (AlignModeSP.update(states, names, n) == false)
                return false;

            MeadeAlignMode mode = static_cast<MeadeAlignMode>(AlignModeSP.findOnSwitchIndex());
            if (isConnected() && m_Codec.setAlignMode(mode) != MEADE_OK)
            {
                LOGF_ERROR("Failed to set align mode %s.", alignModeName(mode));
                AlignModeSP.reset();
                if (previous >= 0)
                    AlignModeSP[previous].setState(ISS_ON);
                AlignModeSP.setState(IPS_ALERT);
                AlignModeSP.apply();
                return false;
            }
            AlignModeSP.setState(IPS_OK);
            AlignModeSP.apply();
            return true;
        }
        else if (SkipInitSP.isNameMatch(name))
        {
            SkipInitSP.update(states, names, n);
            SkipInitSP.setState(IPS_OK);
            SkipInitSP.apply();
            return true;
        }
        else if (Azimuth180SP.isNameMatch(name))
        {
            Azimuth180SP.update(states, names, n);
            m_Codec.setAzimuthCorrection(Azimuth180SP[INDI_ENABLED].getState() == ISS_ON);
            Azimuth180SP.setState(IPS_OK);
            Azimuth180SP.apply();
            return true;
        }
        else if (TraceSP.isNameMatch(name))
        {
            TraceSP.update(states, names, n);
            bool result = setTrace(TraceSP[INDI_ENABLED].getState() == ISS_ON);
            TraceSP.setState(result ? IPS_OK : IPS_ALERT);
            TraceSP.apply();
            return result;
        }
        else if (CalibrateSP.isNameMatch(name))
        {
            CalibrateSP.update(states, names, n);
            bool result = startJob(JOB_CALIBRATE, [this]()
            {
                return m_Calibrator.calibrate();
            });
            CalibrateSP.setState(result ? IPS_BUSY : IPS_ALERT);
            if (!result)
                CalibrateSP[0].setState(ISS_OFF);
            CalibrateSP.apply();
            return result;
        }
        else if (AutoAlignSP.isNameMatch(name))
        {
            AutoAlignSP.update(states, names, n);
            bool result = startJob(JOB_AUTO_ALIGN, [this]()
            {
                return m_Codec.autoAlign();
            });
            if (result)
                LOG_INFO("Automatic alignment started...");
            AutoAlignSP.setState(result ? IPS_BUSY : IPS_ALERT);
            if (!result)
                AutoAlignSP[0].setState(ISS_OFF);
            AutoAlignSP.apply();
            return result;
        }
    }

    //  Nobody has claimed this, so pass it to the parent
    return INDI::Telescope::ISNewSwitch(dev, name, states, names, n);
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::ISNewNumber(const char *dev, const char *name, double values[], char *names[], int n)
{
    if (dev != nullptr && strcmp(dev, getDeviceName()) == 0)
    {
        if (LinkTimeoutNP.isNameMatch(name))
        {
            LinkTimeoutNP.update(values, names, n);
            m_Channel.setTimeout(static_cast<int>(LinkTimeoutNP[0].getValue()));
            LinkTimeoutNP.setState(IPS_OK);
            LinkTimeoutNP.apply();
            return true;
        }
        else if (SlewTimingNP.isNameMatch(name))
        {
            SlewTimingNP.update(values, names, n);
            m_Slew.setMaxSlewTime(SlewTimingNP[SLEW_MAX_TIME].getValue());
            m_Slew.setStabilizationTime(SlewTimingNP[SLEW_STABILIZATION_TIME].getValue());
            m_Slew.setSlewIdleTime(SlewTimingNP[SLEW_IDLE_TIME].getValue());
            SlewTimingNP.setState(IPS_OK);
            SlewTimingNP.apply();
            return true;
        }
        else if (TrackFrequencyNP.isNameMatch(name))
        {
            int rc = m_Codec.setTrackingFrequency(values[0]);
            if (rc == MEADE_OK)
            {
                TrackFrequencyNP[0].setValue(values[0]);
                TrackFrequencyNP.setState(IPS_OK);
            }
            else
            {
                TrackFrequencyNP.setState(IPS_ALERT);
            }
            TrackFrequencyNP.apply();
            return rc == MEADE_OK;
        }
        else if (FineMoveNP.isNameMatch(name))
        {
            FineMoveNP.update(values, names, n);

            // N, S, W, E in the order of the property
            static const MeadeDirection directions[4] = {MEADE_NORTH, MEADE_SOUTH, MEADE_WEST, MEADE_EAST};
            std::vector<std::pair<MeadeDirection, double>> offsets;
            for (int i = 0; i < 4; i++)
            {
                if (FineMoveNP[i].getValue() > 0)
                    offsets.push_back(std::make_pair(directions[i], FineMoveNP[i].getValue()));
            }
            MeadeSlewRate rate = static_cast<MeadeSlewRate>(SlewRateSP.findOnSwitchIndex());

            bool result = !offsets.empty() && startJob(JOB_FINE_MOVE, [this, offsets, rate]()
            {
                for (const auto &offset : offsets)
                {
                    int rc = m_Calibrator.moveOffset(offset.first, offset.second, rate);
                    if (rc != MEADE_OK)
                        return rc;
                }
                return static_cast<int>(MEADE_OK);
            });
            FineMoveNP.setState(result ? IPS_BUSY : IPS_ALERT);
            FineMoveNP.apply();
            return result;
        }
    }

    //  Nobody has claimed this, so pass it to the parent
    return INDI::Telescope::ISNewNumber(dev, name, values, names, n);
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::initProperties()
{
    /* Make sure to init parent properties first */
    if (!INDI::Telescope::initProperties()) return false;

    TrackState = SCOPE_IDLE;

    // Add debug/simulation/config controls so we may debug driver if necessary
    addAuxControls();

    SetParkDataType(PARK_AZ_ALT);

    m_Channel.setDeviceName(getDeviceName());

    LinkTimeoutNP[0].fill("LINK_TIMEOUT_VALUE", "Timeout (s)", "%.0f", 1.0, 120.0, 1.0, LX200_TIMEOUT);
    LinkTimeoutNP.fill(getDeviceName(), "LINK_TIMEOUT", "Link", OPTIONS_TAB, IP_RW, 60, IPS_IDLE);

    AlignModeSP[MEADE_ALIGN_ALTAZ].fill("ALIGN_ALTAZ", "Alt/Az", ISS_ON);
    AlignModeSP[MEADE_ALIGN_POLAR].fill("ALIGN_POLAR", "Polar", ISS_OFF);
    AlignModeSP[MEADE_ALIGN_LAND].fill("ALIGN_LAND", "Land", ISS_OFF);
    AlignModeSP.fill(getDeviceName(), "ALIGN_MODE", "Align Mode", OPTIONS_TAB, IP_RW, ISR_1OFMANY, 60, IPS_IDLE);

    SkipInitSP[INDI_ENABLED].fill("INDI_ENABLED", "Skip", ISS_OFF);
    SkipInitSP[INDI_DISABLED].fill("INDI_DISABLED", "Initialize", ISS_ON);
    SkipInitSP.fill(getDeviceName(), "SKIP_INIT", "On Connect", OPTIONS_TAB, IP_RW, ISR_1OFMANY, 60, IPS_IDLE);

    Azimuth180SP[INDI_ENABLED].fill("INDI_ENABLED", "Enabled", ISS_ON);
    Azimuth180SP[INDI_DISABLED].fill("INDI_DISABLED", "Disabled", ISS_OFF);
    Azimuth180SP.fill(getDeviceName(), "AZIMUTH_180_CORRECT", "Az 180 Correct", OPTIONS_TAB, IP_RW, ISR_1OFMANY, 60,
                      IPS_IDLE);

    SlewTimingNP[SLEW_MAX_TIME].fill("MAX_SLEW_TIME", "Max slew (s)", "%.0f", 1.0, 600.0, 1.0, m_Slew.getMaxSlewTime());
    SlewTimingNP[SLEW_STABILIZATION_TIME].fill("STABILIZATION_TIME", "Stabilization (s)", "%.1f", 0.0, 60.0, 0.5,
            m_Slew.getStabilizationTime());
    SlewTimingNP[SLEW_IDLE_TIME].fill("SLEW_IDLE_TIME", "Poll interval (s)", "%.2f", 0.01, 10.0, 0.05,
                                      m_Slew.getSlewIdleTime());
    SlewTimingNP.fill(getDeviceName(), "SLEW_TIMING", "Slew Timing", OPTIONS_TAB, IP_RW, 60, IPS_IDLE);

    TraceSP[INDI_ENABLED].fill("INDI_ENABLED", "Enabled", ISS_OFF);
    TraceSP[INDI_DISABLED].fill("INDI_DISABLED", "Disabled", ISS_ON);
    TraceSP.fill(getDeviceName(), "WIRE_TRACE", "LX200 Trace", OPTIONS_TAB, IP_RW, ISR_1OFMANY, 60, IPS_IDLE);

    TrackFrequencyNP[0].fill("TRACK_FREQ", "Frequency (Hz)", "%.1f", 56.4, 60.1, 0.1, 60.1);
    TrackFrequencyNP.fill(getDeviceName(), "TRACKING_FREQUENCY", "Tracking", MOTION_TAB, IP_RW, 60, IPS_IDLE);

    SiderealTimeNP[0].fill("LST", "LST (hh:mm:ss)", "%010.6m", 0, 24, 0, 0);
    SiderealTimeNP.fill(getDeviceName(), "MOUNT_LST", "Mount LST", SITE_TAB, IP_RO, 60, IPS_IDLE);

    FineMoveNP[0].fill("FINE_MOVE_N", "North (arcsec)", "%.1f", 0.0, 3600.0, 1.0, 0.0);
    FineMoveNP[1].fill("FINE_MOVE_S", "South (arcsec)", "%.1f", 0.0, 3600.0, 1.0, 0.0);
    FineMoveNP[2].fill("FINE_MOVE_W", "West (arcsec)", "%.1f", 0.0, 3600.0, 1.0, 0.0);
    FineMoveNP[3].fill("FINE_MOVE_E", "East (arcsec)", "%.1f", 0.0, 3600.0, 1.0, 0.0);
    FineMoveNP.fill(getDeviceName(), "FINE_MOVE", "Fine Move", MOTION_TAB, IP_RW, 60, IPS_IDLE);

    CalibrateSP[0].fill("CALIBRATE", "Calibrate", ISS_OFF);
    CalibrateSP.fill(getDeviceName(), "MOVE_CALIBRATION", "Fine Move Calibration", ADVANCED_TAB, IP_RW, ISR_ATMOST1, 60,
                     IPS_IDLE);

    AutoAlignSP[0].fill("AUTO_ALIGN", "Start", ISS_OFF);
    AutoAlignSP.fill(getDeviceName(), "AUTO_ALIGN", "Auto Align", ADVANCED_TAB, IP_RW, ISR_ATMOST1, 60, IPS_IDLE);

    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::updateProperties()
{
    if (! INDI::Telescope::updateProperties()) return false;

    if (isConnected())
    {
        defineProperty(TrackFrequencyNP);
        defineProperty(SiderealTimeNP);
        defineProperty(FineMoveNP);
        defineProperty(CalibrateSP);
        defineProperty(AutoAlignSP);

        if (InitPark())
        {
            SetAxis1ParkDefault(MEADE_PARK_AZ);
            SetAxis2ParkDefault(MEADE_PARK_ALT);
        }
        else
        {
            SetAxis1Park(MEADE_PARK_AZ);
            SetAxis2Park(MEADE_PARK_ALT);
            SetAxis1ParkDefault(MEADE_PARK_AZ);
            SetAxis2ParkDefault(MEADE_PARK_ALT);
        }

        getBasicData();
    }
    else
    {
        deleteProperty(TrackFrequencyNP);
        deleteProperty(SiderealTimeNP);
        deleteProperty(FineMoveNP);
        deleteProperty(CalibrateSP);
        deleteProperty(AutoAlignSP);
    }

    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::saveConfigItems(FILE *fp)
{
    LOG_DEBUG(__FUNCTION__);
    LinkTimeoutNP.save(fp);
    AlignModeSP.save(fp);
    SkipInitSP.save(fp);
    Azimuth180SP.save(fp);
    SlewTimingNP.save(fp);
    TraceSP.save(fp);

    INDI::Telescope::saveConfigItems(fp);
    return true;
}

/*******************************************************************************
** ReadScopeStatus called by polling
*******************************************************************************/
bool MeadeTelescope::ReadScopeStatus()
{
    if (!isConnected())
        return false;

    if (m_JobDone)
        finishJob();

    // timed moves keep the link locked, don't stall the event loop on it
    if (m_Job == JOB_FINE_MOVE || m_Job == JOB_CALIBRATE || m_Job == JOB_AUTO_ALIGN)
        return true;

    Position position;
    int rc = m_Codec.getPosition(Position::EQUATORIAL, &position);
    if (rc != MEADE_OK)
    {
        LOGF_ERROR("Retrieving equatorial coordinates failed: %s", meadeErrorString(rc));
        return false;
    }

    NewRaDec(position.ra(), position.dec());
    return true;
}

/*******************************************************************************
** virtual updateLocation
*******************************************************************************/
bool MeadeTelescope::updateLocation(double latitude, double longitude, double elevation)
{
    LOGF_DEBUG("%s Lat:%.3lf Lon:%.3lf", __FUNCTION__, latitude, longitude);
    INDI_UNUSED(elevation);

    if (!isConnected())
        return false;

    if (m_Codec.setLatitude(latitude) != MEADE_OK)
    {
        LOGF_ERROR("Error setting site latitude %lf", latitude);
        return false;
    }

    // Meade longitudes grow westwards
    if (m_Codec.setLongitude(ln_range_degrees(360.0 - longitude)) != MEADE_OK)
    {
        LOGF_ERROR("Error setting site longitude %lf", longitude);
        return false;
    }

    char l[32] = {0}, L[32] = {0};
    fs_sexa(l, latitude, 3, 3600);
    fs_sexa(L, longitude, 4, 3600);
    LOGF_INFO("Site location updated to Lat %.32s - Long %.32s", l, L);
    return true;
}

/*******************************************************************************
** virtual updateTime
*******************************************************************************/
bool MeadeTelescope::updateTime(ln_date *utc, double utc_offset)
{
    LOGF_DEBUG("%s offset=%.1f", __FUNCTION__, utc_offset);

    if (!isConnected())
        return false;

    struct ln_zonedate ltm;
    ln_date_to_zonedate(utc, &ltm, static_cast<long>(utc_offset * 3600.0));

    // Meade defines UTC Offset as the offset ADDED to local time to yield UTC
    if (m_Codec.setUTCOffset(-utc_offset) != MEADE_OK)
    {
        LOG_ERROR("Error setting UTC Offset.");
        return false;
    }

    if (m_Codec.setLocalTime(ltm.hours, ltm.minutes, static_cast<int>(ltm.seconds)) != MEADE_OK)
    {
        LOG_ERROR("Error setting local time.");
        return false;
    }

    if (m_Codec.setDate(ltm.years, ltm.months, ltm.days) != MEADE_OK)
    {
        LOG_ERROR("Error setting local date.");
        return false;
    }

    LOG_INFO("Time updated, planetary data updated.");
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::Sync(double ra, double dec)
{
    LOGF_DEBUG("%s ra=%lf, dec=%lf", __FUNCTION__, ra, dec);

    if (m_Codec.sync(ra, dec) != MEADE_OK)
    {
        EqNP.setState(IPS_ALERT);
        LOG_ERROR("Synchronization failed.");
        EqNP.apply();
        return false;
    }
    LOG_INFO("Synchronization successful.");

    EqNP.setState(IPS_OK);
    EqNP.apply();
    NewRaDec(ra, dec);

    return true;
}

/*******************************************************************************
** Park positions are Az (axis 1) and Alt (axis 2)
*******************************************************************************/
bool MeadeTelescope::SetDefaultPark()
{
    LOG_DEBUG(__FUNCTION__);
    SetAxis1Park(MEADE_PARK_AZ);
    SetAxis2Park(MEADE_PARK_ALT);
    return true;
}

bool MeadeTelescope::SetCurrentPark()
{
    LOG_DEBUG(__FUNCTION__);
    Position position;
    if (m_Codec.getPosition(Position::HORIZONTAL, &position) != MEADE_OK)
    {
        LOG_ERROR("Failed to read the horizontal position.");
        return false;
    }
    SetAxis1Park(position.az());
    SetAxis2Park(position.alt());
    LOGF_INFO("Park position set to %s.", position.toString().c_str());
    return true;
}

/*******************************************************************************
** Slew to the park position, then stop tracking
*******************************************************************************/
bool MeadeTelescope::Park()
{
    LOG_DEBUG(__FUNCTION__);
    double az  = GetAxis1Park();
    double alt = GetAxis2Park();

    bool result = startJob(JOB_PARK, [this, alt, az]()
    {
        int rc = m_Slew.slewToAltAz(alt, az);
        if (rc == MEADE_OK && m_Slew.getLastOutcome() == SLEW_COMPLETE)
            rc = m_Codec.stopTracking();
        return rc;
    });
    if (!result)
    {
        LOG_ERROR("Parking failed.");
        return false;
    }

    TrackState = SCOPE_PARKING;
    LOG_INFO("Parking mount...");
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::UnPark()
{
    LOG_DEBUG(__FUNCTION__);

    if (m_Codec.startTracking() != MEADE_OK)
    {
        LOG_ERROR("Unpark failed, cannot start tracking.");
        return false;
    }
    if (!initTelescope())
    {
        LOG_ERROR("Unpark failed, cannot initialize the telescope.");
        return false;
    }

    SetParked(false);
    LOG_INFO("Mount unparked.");
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::SetSlewRate(int index)
{
    LOGF_DEBUG("%s %d", __FUNCTION__, index);

    if (m_Codec.setSlewRate(static_cast<MeadeSlewRate>(index)) != MEADE_OK)
    {
        SlewRateSP.setState(IPS_ALERT);
        SlewRateSP.apply();
        LOG_ERROR("Error setting slew mode.");
        return false;
    }

    SlewRateSP.setState(IPS_OK);
    SlewRateSP.apply();
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::Goto(double ra, double dec)
{
    LOGF_DEBUG("%s ra:%lf, dec:%lf", __FUNCTION__, ra, dec);

    if (m_Slew.isSlewing())
    {
        LOG_ERROR("Telescope already slewing.");
        return false;
    }

    bool result = startJob(JOB_GOTO, [this, ra, dec]()
    {
        return m_Slew.slewToRaDec(ra, dec);
    });
    if (!result)
    {
        EqNP.setState(IPS_ALERT);
        EqNP.apply();
        return false;
    }

    char RAStr[64] = {0}, DecStr[64] = {0};
    fs_sexa(RAStr, ra, 2, 3600);
    fs_sexa(DecStr, dec, 2, 3600);

    TrackState = SCOPE_SLEWING;
    EqNP.setState(IPS_BUSY);
    EqNP.apply();

    LOGF_INFO("Slewing to RA: %s - DEC: %s", RAStr, DecStr);
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::Abort()
{
    LOG_DEBUG(__FUNCTION__);

    if (m_Job == JOB_CALIBRATE)
    {
        LOG_WARN("Fine move calibration cannot be aborted.");
        return false;
    }

    int rc = m_Slew.isSlewing() ? m_Slew.abortSlew() : m_Codec.stopAll();
    if (rc != MEADE_OK)
    {
        LOG_ERROR("Failed to abort slew.");
        return false;
    }

    if (MovementNSSP.getState() == IPS_BUSY || MovementWESP.getState() == IPS_BUSY)
    {
        MovementNSSP.setState(IPS_IDLE);
        MovementWESP.setState(IPS_IDLE);
        MovementNSSP.reset();
        MovementWESP.reset();
        MovementNSSP.apply();
        MovementWESP.apply();
    }

    TrackState = SCOPE_IDLE;
    EqNP.setState(IPS_IDLE);
    EqNP.apply();
    LOG_INFO("Slew aborted.");
    return true;
}

/*******************************************************************************
** Tracking is switched off by the LAND align mode
*******************************************************************************/
bool MeadeTelescope::SetTrackEnabled(bool enabled)
{
    LOGF_DEBUG("%s enabled=%d", __FUNCTION__, enabled);

    int rc = enabled ? m_Codec.startTracking() : m_Codec.stopTracking();
    if (rc != MEADE_OK)
    {
        LOGF_ERROR("Failed to %s tracking.", enabled ? "start" : "stop");
        return false;
    }
    LOGF_INFO("Tracking %s.", enabled ? "started" : "stopped");
    return true;
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::MoveNS(INDI_DIR_NS dir, TelescopeMotionCommand command)
{
    LOGF_DEBUG("%s dir=%d cmd=%d", __FUNCTION__, dir, command);
    return move(dir == DIRECTION_NORTH ? MEADE_NORTH : MEADE_SOUTH, command);
}

bool MeadeTelescope::MoveWE(INDI_DIR_WE dir, TelescopeMotionCommand command)
{
    LOGF_DEBUG("%s dir=%d cmd=%d", __FUNCTION__, dir, command);
    return move(dir == DIRECTION_WEST ? MEADE_WEST : MEADE_EAST, command);
}

/*******************************************************************************
** Meade functions
*******************************************************************************/
bool MeadeTelescope::move(MeadeDirection direction, TelescopeMotionCommand command)
{
    if (m_Job != JOB_NONE)
    {
        LOG_ERROR("Telescope is busy. Cannot move.");
        return false;
    }

    if (command == MOTION_START)
    {
        // Set the slew speed as requested by the client
        if (!SetSlewRate(SlewRateSP.findOnSwitchIndex()))
            return false;
        if (m_Codec.moveStart(direction) != MEADE_OK)
        {
            LOGF_ERROR("Error starting %s motion.", directionName(direction));
            return false;
        }
    }
    else if (m_Codec.moveStop(direction) != MEADE_OK)
    {
        LOGF_ERROR("Error stopping %s motion.", directionName(direction));
        return false;
    }
    return true;
}

/*******************************************************************************
** Align mode, precision, slew rate and, when known, the site
*******************************************************************************/
bool MeadeTelescope::initTelescope()
{
    LOG_DEBUG(__FUNCTION__);

    MeadeAlignMode mode = static_cast<MeadeAlignMode>(AlignModeSP.findOnSwitchIndex());
    if (m_Codec.setAlignMode(mode) != MEADE_OK)
        return false;

    if (m_Codec.setHighPrecision() != MEADE_OK)
        return false;

    int rate = SlewRateSP.findOnSwitchIndex();
    if (m_Codec.setSlewRate(static_cast<MeadeSlewRate>(rate < 0 ? MEADE_SLEW_MAX : rate)) != MEADE_OK)
        return false;

    if (LocationNP.getState() != IPS_OK)
    {
        LOG_WARN("Cannot initialize telescope. Site location not available. Telescope attitude cannot be determined.");
        return true;
    }

    MeadeSite site;
    site.latitude  = LocationNP[LOCATION_LATITUDE].getValue();
    site.longitude = LocationNP[LOCATION_LONGITUDE].getValue();
    site.now       = time(nullptr);
    if (!parseUTCOffset(TimeTP[OFFSET].getText(), &site.utcOffset))
    {
        // no offset from the client yet, use the zone of the host
        struct tm local;
        localtime_r(&site.now, &local);
        site.utcOffset = local.tm_gmtoff / 3600.0;
    }

    return m_Codec.setSite(site) == MEADE_OK;
}

/*******************************************************************************
** getBasicData called once connected
*******************************************************************************/
void MeadeTelescope::getBasicData()
{
    LOG_DEBUG(__FUNCTION__);

    MeadeAlignMode mode;
    if (m_Codec.getAlignMode(&mode) == MEADE_OK)
    {
        AlignModeSP.reset();
        AlignModeSP[mode].setState(ISS_ON);
        AlignModeSP.setState(IPS_OK);
        AlignModeSP.apply();
        TrackStateSP.reset();
        TrackStateSP[mode == MEADE_ALIGN_LAND ? TRACK_OFF : TRACK_ON].setState(ISS_ON);
        TrackStateSP.apply();
    }

    double frequency;
    if (m_Codec.getTrackingFrequency(&frequency) == MEADE_OK)
    {
        TrackFrequencyNP[0].setValue(frequency);
        TrackFrequencyNP.setState(IPS_OK);
    }
    else
        TrackFrequencyNP.setState(IPS_ALERT);
    TrackFrequencyNP.apply();

    double lst;
    if (m_Codec.getSiderealTime(&lst) == MEADE_OK)
    {
        SiderealTimeNP[0].setValue(lst);
        SiderealTimeNP.setState(IPS_OK);
    }
    else
        SiderealTimeNP.setState(IPS_ALERT);
    SiderealTimeNP.apply();

    double latitude, longitude;
    int year, month, day, hour, minute, second;
    if (m_Codec.getLatitude(&latitude) == MEADE_OK && m_Codec.getLongitude(&longitude) == MEADE_OK &&
            m_Codec.getDate(&year, &month, &day) == MEADE_OK &&
            m_Codec.getLocalTime(&hour, &minute, &second) == MEADE_OK)
    {
        LOGF_INFO("Mount site Lat %.4f Long %.4f (west), local time %04d-%02d-%02d %02d:%02d:%02d", latitude, longitude,
                  year, month, day, hour, minute, second);
    }
    else
        LOG_WARN("Failed to read the site and time from the mount.");
}

/*******************************************************************************
**
*******************************************************************************/
bool MeadeTelescope::setTrace(bool enabled)
{
    if (!enabled)
    {
        m_Channel.closeTrace();
        return true;
    }
    return m_Channel.openTrace(GetHomeDirectory() + MEADE_TRACE_FILE);
}

/*******************************************************************************
** Long operations run on the worker thread, ReadScopeStatus reports
** the outcome back to the client.
*******************************************************************************/
bool MeadeTelescope::startJob(MeadeJob job, std::function<int()> work)
{
    if (m_Job != JOB_NONE)
    {
        LOG_ERROR("Telescope is busy.");
        return false;
    }
    if (m_Worker.joinable())
        m_Worker.join();

    m_Job = job;
    m_JobDone = false;
    m_Worker = std::thread([this, work]()
    {
        m_JobResult = work();
        m_JobDone = true;
    });
    return true;
}

void MeadeTelescope::finishJob()
{
    if (m_Worker.joinable())
        m_Worker.join();

    int job = m_Job;
    int rc = m_JobResult;
    SlewState outcome = m_Slew.getLastOutcome();
    m_Job = JOB_NONE;
    m_JobDone = false;

    switch (job)
    {
        case JOB_GOTO:
            if (rc == MEADE_OK && outcome == SLEW_COMPLETE)
            {
                TrackState = SCOPE_TRACKING;
                LOG_INFO("Slew is complete. Tracking...");
            }
            else if (outcome != SLEW_ABORTED)
            {
                TrackState = SCOPE_IDLE;
                EqNP.setState(IPS_ALERT);
                EqNP.apply();
                LOGF_ERROR("Slew failed: %s", meadeErrorString(rc));
            }
            break;

        case JOB_PARK:
            if (rc == MEADE_OK && outcome == SLEW_COMPLETE)
            {
                SetParked(true);
                LOG_INFO("Mount parked.");
            }
            else
            {
                TrackState = SCOPE_IDLE;
                ParkSP.setState(IPS_ALERT);
                ParkSP.apply();
                LOGF_ERROR("Parking failed: %s", meadeErrorString(rc));
            }
            break;

        case JOB_FINE_MOVE:
            FineMoveNP.setState(rc == MEADE_OK ? IPS_OK : IPS_ALERT);
            FineMoveNP.apply();
            break;

        case JOB_CALIBRATE:
            CalibrateSP[0].setState(ISS_OFF);
            CalibrateSP.setState(rc == MEADE_OK ? IPS_OK : IPS_ALERT);
            CalibrateSP.apply();
            break;

        case JOB_AUTO_ALIGN:
            AutoAlignSP[0].setState(ISS_OFF);
            AutoAlignSP.setState(rc == MEADE_OK ? IPS_OK : IPS_ALERT);
            AutoAlignSP.apply();
            if (rc == MEADE_OK)
                LOG_INFO("Automatic alignment finished.");
            break;

        default:
            break;
    }
}

void MeadeTelescope::stopWorker()
{
    if (!m_Worker.joinable())
        return;
    if (m_Slew.isSlewing() && m_Job != JOB_CALIBRATE)
        m_Slew.abortSlew();
    m_Worker.join();
    m_Job = JOB_NONE;
    m_JobDone = false;
}
