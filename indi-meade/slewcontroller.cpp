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

#include "slewcontroller.h"

#include <indilogger.h>

#include <thread>

/*******************************************************************************
**
*******************************************************************************/
SlewController::SlewController(LX200Codec &codec) : m_Codec(codec)
{
}

/*******************************************************************************
** Equatorial slew
*******************************************************************************/
int SlewController::slewToRaDec(double ra, double dec)
{
    LOGF_DEBUG("%s ra=%lf dec=%lf", __FUNCTION__, ra, dec);

    bool idle = false;
    if (!m_Slewing.compare_exchange_strong(idle, true))
    {
        LOG_ERROR("Telescope already slewing.");
        return MEADE_ALREADY_SLEWING;
    }
    // an abort that raced the end of the previous slew
    m_Abort = false;

    SlewSession session(Position::fromRaDec(ra, dec));
    m_State = SLEW_REQUESTED;

    int rc = m_Codec.setTargetRaDec(ra, dec);
    if (rc == MEADE_OK)
        rc = startSlew(session);
    else
        session.phase = SLEW_REJECTED;

    if (rc == MEADE_OK)
        rc = waitSlew(session);

    finishSlew(session);
    return rc;
}

/*******************************************************************************
** Horizontal slews need the mount in ALT_AZ mode, the previous mode is
** restored whatever the outcome.
*******************************************************************************/
int SlewController::slewToAltAz(double alt, double az)
{
    LOGF_DEBUG("%s alt=%lf az=%lf", __FUNCTION__, alt, az);

    bool idle = false;
    if (!m_Slewing.compare_exchange_strong(idle, true))
    {
        LOG_ERROR("Telescope already slewing.");
        return MEADE_ALREADY_SLEWING;
    }
    // an abort that raced the end of the previous slew
    m_Abort = false;

    SlewSession session(Position::fromAltAz(alt, az));
    m_State = SLEW_REQUESTED;

    int rc;
    {
        AlignModeGuard align(m_Codec);
        rc = align.status();
        if (rc == MEADE_OK)
            rc = m_Codec.setTargetAltAz(alt, az);

        if (rc == MEADE_OK)
            rc = startSlew(session);
        else
            session.phase = SLEW_REJECTED;

        if (rc == MEADE_OK)
            rc = waitSlew(session);
    }

    finishSlew(session);
    return rc;
}

/*******************************************************************************
**
*******************************************************************************/
int SlewController::abortSlew()
{
    if (!m_Slewing)
        return MEADE_OK;

    LOG_INFO("Aborting slew...");
    m_Abort = true;

    int rc = m_Codec.stopAll();
    if (rc != MEADE_OK)
        LOGF_ERROR("Failed to stop the mount: %s", meadeErrorString(rc));

    pause(m_StabilizationTime);
    return rc;
}

/*******************************************************************************
**
*******************************************************************************/
int SlewController::startSlew(SlewSession &session)
{
    int rc = m_Codec.startSlew(session.target.frame());
    if (rc != MEADE_OK)
    {
        session.phase = SLEW_REJECTED;
        return rc;
    }
    LOGF_INFO("Slewing to %s", session.target.toString().c_str());
    return MEADE_OK;
}

/*******************************************************************************
** Poll the position until the target is reached, the slew is aborted or
** the maximum slew time is over
*******************************************************************************/
int SlewController::waitSlew(SlewSession &session)
{
    session.phase = SLEW_POLLING;
    m_State = SLEW_POLLING;

    while (true)
    {
        if (m_Abort)
        {
            int rc = m_Codec.stopAll();
            if (rc != MEADE_OK)
                LOGF_ERROR("Failed to stop the mount: %s", meadeErrorString(rc));
            pause(m_StabilizationTime);
            session.phase = SLEW_ABORTED;
            LOG_INFO("Slew aborted.");
            return MEADE_OK;
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - session.start).count();
        if (elapsed >= m_MaxSlewTime)
        {
            int rc = m_Codec.stopAll();
            if (rc != MEADE_OK)
                LOGF_ERROR("Failed to stop the mount: %s", meadeErrorString(rc));
            session.phase = SLEW_TIMED_OUT;
            LOGF_ERROR("Slew aborted. Max slew time (%.1f s) reached after %.1f s.", static_cast<double>(m_MaxSlewTime),
                       elapsed);
            return MEADE_SLEW_TIMEOUT;
        }

        Position current;
        int rc = m_Codec.getPosition(session.target.frame(), &current);
        if (rc != MEADE_OK)
        {
            session.phase = SLEW_ABORTED;
            LOGF_ERROR("Slew abandoned, cannot read the position: %s", meadeErrorString(rc));
            return rc;
        }

        if (session.target.within(current, LX200_SLEW_TOLERANCE))
        {
            pause(m_StabilizationTime);
            session.phase = SLEW_COMPLETE;
            LOGF_INFO("Slew complete at %s", current.toString().c_str());
            return MEADE_OK;
        }

        pause(m_SlewIdleTime);
    }
}

void SlewController::finishSlew(SlewSession &session)
{
    LOGF_DEBUG("Slew finished: %s", slewStateName(session.phase));
    m_LastOutcome = session.phase;
    m_State = SLEW_IDLE;
    m_Abort = false;
    m_Slewing = false;
}

void SlewController::pause(double seconds)
{
    if (seconds > 0)
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

/*******************************************************************************
** MotionLock
*******************************************************************************/
SlewController::MotionLock::MotionLock(SlewController &controller) : m_Controller(controller)
{
    bool idle = false;
    m_Owns = m_Controller.m_Slewing.compare_exchange_strong(idle, true);
    if (m_Owns)
        m_Controller.m_Abort = false;
}

SlewController::MotionLock::~MotionLock()
{
    if (m_Owns)
    {
        m_Controller.m_Abort = false;
        m_Controller.m_Slewing = false;
    }
}

/*******************************************************************************
** AlignModeGuard
*******************************************************************************/
SlewController::AlignModeGuard::AlignModeGuard(LX200Codec &codec) : m_Codec(codec)
{
    m_Status = m_Codec.getAlignMode(&m_Previous);
    if (m_Status != MEADE_OK)
        return;
    m_Restore = true;
    m_Status = m_Codec.setAlignMode(MEADE_ALIGN_ALTAZ);
}

SlewController::AlignModeGuard::~AlignModeGuard()
{
    if (!m_Restore)
        return;
    int rc = m_Codec.setAlignMode(m_Previous);
    if (rc != MEADE_OK)
        LOGF_ERROR("Failed to restore align mode %s: %s", alignModeName(m_Previous), meadeErrorString(rc));
}
