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

#include "lx200codec.h"

#include <indilogger.h>

#include <libnova/utility.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>
#include <mutex>
#include <thread>

#define LX200_ALIGN_TIMEOUT 600 /* automatic alignment may take minutes */

typedef std::lock_guard<std::recursive_mutex> CommsGuard;

/*******************************************************************************
**
*******************************************************************************/
LX200Codec::LX200Codec(LX200Channel &channel) : m_Channel(channel)
{
    m_TargetAlt = std::numeric_limits<double>::quiet_NaN();
    m_TargetAz  = std::numeric_limits<double>::quiet_NaN();
}

/*******************************************************************************
** Connection and setup
*******************************************************************************/
int LX200Codec::checkConnection()
{
    LOG_DEBUG(__FUNCTION__);
    CommsGuard guard(m_Channel.commsLock());
    LX200Channel::ScopedTimeout timeout(m_Channel, LX200_CHECK_TIMEOUT);

    MeadeAlignMode mode;
    int rc = getAlignMode(&mode);
    if (rc != MEADE_OK)
    {
        LOG_ERROR("Couldn't find a Meade telescope on the port.");
        return rc;
    }
    LOGF_DEBUG("Meade telescope found in %s mode.", alignModeName(mode));
    return MEADE_OK;
}

int LX200Codec::getAlignMode(MeadeAlignMode *mode)
{
    CommsGuard guard(m_Channel.commsLock());

    std::string ack(1, static_cast<char>(LX200_ACK));
    int rc = sendCommand(ack);
    if (rc != MEADE_OK)
        return rc;

    std::string reply;
    if ((rc = m_Channel.read(reply, 1)) != MEADE_OK)
        return rc;

    // some firmwares send a '0' before the mode
    if (reply == "0")
    {
        if ((rc = m_Channel.read(reply, 1)) != MEADE_OK)
            return rc;
    }

    if (reply == "A")
        *mode = MEADE_ALIGN_ALTAZ;
    else if (reply == "P")
        *mode = MEADE_ALIGN_POLAR;
    else if (reply == "L")
        *mode = MEADE_ALIGN_LAND;
    else
    {
        LOGF_ERROR("Couldn't get the alignment mode, unexpected reply <%s>.", reply.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::setAlignMode(MeadeAlignMode mode)
{
    LOGF_DEBUG("%s %s", __FUNCTION__, alignModeName(mode));
    CommsGuard guard(m_Channel.commsLock());

    MeadeAlignMode current;
    int rc = getAlignMode(&current);
    if (rc != MEADE_OK)
        return rc;
    if (current == mode)
        return MEADE_OK;

    const char *cmd = ":AA#";
    if (mode == MEADE_ALIGN_POLAR)
        cmd = ":AP#";
    else if (mode == MEADE_ALIGN_LAND)
        cmd = ":AL#";

    bool accepted = false;
    if ((rc = sendBool(cmd, &accepted)) != MEADE_OK)
        return rc;
    if (!accepted)
        LOGF_WARN("Mount did not acknowledge align mode %s.", alignModeName(mode));
    return MEADE_OK;
}

/*******************************************************************************
** Low precision RA comes as HH:MM.T, toggle to HH:MM:SS
*******************************************************************************/
int LX200Codec::setHighPrecision()
{
    LOG_DEBUG(__FUNCTION__);
    CommsGuard guard(m_Channel.commsLock());

    std::string line;
    int rc = sendLine(":GR#", line);
    if (rc != MEADE_OK)
        return rc;

    if (payload(line).size() == 7)
    {
        LOG_INFO("Switching mount to high precision coordinates.");
        return sendCommand(":U#");
    }
    return MEADE_OK;
}

int LX200Codec::autoAlign()
{
    LOG_DEBUG(__FUNCTION__);
    CommsGuard guard(m_Channel.commsLock());
    LX200Channel::ScopedTimeout timeout(m_Channel, LX200_ALIGN_TIMEOUT);

    int rc = sendCommand(":Aa#");
    if (rc != MEADE_OK)
        return rc;

    std::string reply;
    if ((rc = m_Channel.read(reply, 1)) != MEADE_OK)
        return rc;
    if (reply.empty())
    {
        LOG_ERROR("Automatic alignment did not finish in time.");
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

/*******************************************************************************
** Push the site into the mount. Meade counts longitudes westwards and
** defines the UTC offset as the hours added to local time to get UTC.
*******************************************************************************/
int LX200Codec::setSite(const MeadeSite &site)
{
    LOGF_DEBUG("%s lat=%.4f long=%.4f utc=%+.1f", __FUNCTION__, site.latitude, site.longitude, site.utcOffset);
    CommsGuard guard(m_Channel.commsLock());

    int rc;
    if ((rc = setLatitude(site.latitude)) != MEADE_OK)
        return rc;
    if ((rc = setLongitude(ln_range_degrees(360.0 - site.longitude))) != MEADE_OK)
        return rc;

    time_t local = site.now + static_cast<time_t>(std::lround(site.utcOffset * 3600.0));
    struct tm tm;
    gmtime_r(&local, &tm);

    if ((rc = setLocalTime(tm.tm_hour, tm.tm_min, tm.tm_sec)) != MEADE_OK)
        return rc;
    if ((rc = setUTCOffset(-site.utcOffset)) != MEADE_OK)
        return rc;
    return setDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

/*******************************************************************************
** Slewing
*******************************************************************************/
int LX200Codec::setSlewRate(MeadeSlewRate rate)
{
    LOGF_DEBUG("%s %s", __FUNCTION__, slewRateName(rate));
    CommsGuard guard(m_Channel.commsLock());

    int rc = MEADE_OK;
    switch (rate)
    {
        case MEADE_SLEW_GUIDE:
            rc = sendCommand(":RG#");
            break;
        case MEADE_SLEW_CENTER:
            rc = sendCommand(":RC#");
            break;
        case MEADE_SLEW_FIND:
            rc = sendCommand(":RM#");
            break;
        case MEADE_SLEW_MAX:
        {
            bool accepted = false;
            if ((rc = sendBool(":Sw4#", &accepted)) != MEADE_OK)
                return rc;
            if (!accepted)
            {
                LOG_ERROR("Invalid slew rate MAX.");
                return MEADE_COMMAND_REJECTED;
            }
            rc = sendCommand(":RS#");
            break;
        }
    }
    if (rc == MEADE_OK)
        m_SlewRate = rate;
    return rc;
}

int LX200Codec::getRA(double *ra)
{
    return getSexa(":GR#", 9, ra);
}

int LX200Codec::getDec(double *dec)
{
    return getSexa(":GD#", 10, dec);
}

int LX200Codec::getAlt(double *alt)
{
    return getSexa(":GA#", 0, alt);
}

int LX200Codec::getAz(double *az)
{
    double value;
    int rc = getSexa(":GZ#", 0, &value);
    if (rc != MEADE_OK)
        return rc;
    *az = m_AzimuthCorrection ? correctAzimuth(value) : value;
    return MEADE_OK;
}

int LX200Codec::getPosition(Position::Frame frame, Position *position)
{
    CommsGuard guard(m_Channel.commsLock());
    double axis1, axis2;
    int rc;
    if (frame == Position::EQUATORIAL)
    {
        if ((rc = getRA(&axis1)) != MEADE_OK || (rc = getDec(&axis2)) != MEADE_OK)
            return rc;
        *position = Position::fromRaDec(axis1, axis2);
    }
    else
    {
        if ((rc = getAlt(&axis2)) != MEADE_OK || (rc = getAz(&axis1)) != MEADE_OK)
            return rc;
        *position = Position::fromAltAz(axis2, axis1);
    }
    return MEADE_OK;
}

int LX200Codec::getTargetRA(double *ra)
{
    return getSexa(":Gr#", 9, ra);
}

int LX200Codec::getTargetDec(double *dec)
{
    return getSexa(":Gd#", 10, dec);
}

int LX200Codec::setTargetRA(double ra)
{
    std::string value = formatHours(ra);
    return setValue("target RA", ":Sr" + value + "#", value);
}

int LX200Codec::setTargetDec(double dec)
{
    std::string value = formatSignedDegrees(dec);
    return setValue("target Dec", ":Sd" + value + "#", value);
}

int LX200Codec::setTargetRaDec(double ra, double dec)
{
    CommsGuard guard(m_Channel.commsLock());
    int rc = setTargetRA(ra);
    if (rc != MEADE_OK)
        return rc;
    return setTargetDec(dec);
}

int LX200Codec::setTargetAlt(double alt)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string value = formatSignedDegrees(alt);
    int rc = setValue("target altitude", ":Sa" + value + "#", value);
    if (rc == MEADE_OK)
        m_TargetAlt = alt;
    return rc;
}

int LX200Codec::setTargetAz(double az)
{
    CommsGuard guard(m_Channel.commsLock());
    double wire = m_AzimuthCorrection ? correctAzimuth(az) : az;
    std::string value = formatDegrees(wire);
    int rc = setValue("target azimuth", ":Sz" + value + "#", value);
    if (rc == MEADE_OK)
        m_TargetAz = az;
    return rc;
}

int LX200Codec::setTargetAltAz(double alt, double az)
{
    CommsGuard guard(m_Channel.commsLock());
    int rc = setTargetAlt(alt);
    if (rc != MEADE_OK)
        return rc;
    return setTargetAz(az);
}

/*******************************************************************************
** Start the slew to the target set before. The mount answers '0' when the
** slew is possible, otherwise a digit followed by a message for :MS#.
** Anything else, silence included, counts as started.
*******************************************************************************/
int LX200Codec::startSlew(Position::Frame frame)
{
    CommsGuard guard(m_Channel.commsLock());
    bool equatorial = (frame == Position::EQUATORIAL);

    int rc = sendCommand(equatorial ? ":MS#" : ":MA#");
    if (rc != MEADE_OK)
        return rc;

    std::string reply;
    if ((rc = m_Channel.read(reply, 1)) != MEADE_OK)
        return rc;

    if (reply == "0")
        return MEADE_OK;

    if (reply.empty() || reply[0] < '1' || reply[0] > '9')
    {
        LOGF_DEBUG("No slew status in reply <%s>, polling anyway.", reply.c_str());
        return MEADE_OK;
    }

    if (equatorial)
    {
        std::string message;
        if ((rc = readLine(message)) != MEADE_OK)
            return rc;
        LOGF_ERROR("Slew rejected: %s", payload(message).c_str());
    }
    else
    {
        LOGF_ERROR("Couldn't slew to Alt %.4f Az %.4f.", m_TargetAlt, m_TargetAz);
    }
    return MEADE_COMMAND_REJECTED;
}

int LX200Codec::sync(double ra, double dec)
{
    LOGF_DEBUG("%s ra=%lf dec=%lf", __FUNCTION__, ra, dec);
    CommsGuard guard(m_Channel.commsLock());

    int rc = setTargetRaDec(ra, dec);
    if (rc != MEADE_OK)
        return rc;

    std::string line;
    if ((rc = sendLine(":CM#", line)) != MEADE_OK)
        return rc;
    if (payload(line).empty())
    {
        LOGF_ERROR("Error syncing on RA %.6f Dec %.6f.", ra, dec);
        return MEADE_COMMAND_REJECTED;
    }
    return MEADE_OK;
}

/*******************************************************************************
** Motion
*******************************************************************************/
int LX200Codec::moveStart(MeadeDirection direction)
{
    char cmd[8];
    snprintf(cmd, sizeof(cmd), ":M%c#", directionChar(direction));
    return sendCommand(cmd);
}

int LX200Codec::moveStop(MeadeDirection direction)
{
    CommsGuard guard(m_Channel.commsLock());
    char cmd[8];
    snprintf(cmd, sizeof(cmd), ":Q%c#", directionChar(direction));
    int rc = sendCommand(cmd);
    if (rc != MEADE_OK)
        return rc;

    std::this_thread::sleep_for(std::chrono::duration<double>(settleTime(m_SlewRate)));
    return MEADE_OK;
}

int LX200Codec::stopAll()
{
    return sendCommand(":Q#");
}

/*******************************************************************************
** Site and time
*******************************************************************************/
int LX200Codec::getLatitude(double *latitude)
{
    return getSexa(":Gt#", 0, latitude);
}

int LX200Codec::setLatitude(double latitude)
{
    std::string value = formatSignedDegrees(latitude);
    return setValue("latitude", ":St" + value + "#", value);
}

int LX200Codec::getLongitude(double *longitude)
{
    return getSexa(":Gg#", 0, longitude);
}

int LX200Codec::setLongitude(double longitude)
{
    std::string value = formatDegrees(longitude);
    return setValue("longitude", ":Sg" + value + "#", value);
}

int LX200Codec::getDate(int *year, int *month, int *day)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string line;
    int rc = sendLine(":GC#", line);
    if (rc != MEADE_OK)
        return rc;

    int yy;
    if (sscanf(payload(line).c_str(), "%d/%d/%d", month, day, &yy) != 3)
    {
        LOGF_ERROR("Unexpected date <%s>.", line.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }
    *year = 2000 + yy;
    return MEADE_OK;
}

/*******************************************************************************
** The mount answers '1' followed by two lines once its planetary data
** is updated, which takes a while. '0' is followed by a junk byte.
*******************************************************************************/
int LX200Codec::setDate(int year, int month, int day)
{
    CommsGuard guard(m_Channel.commsLock());
    char cmd[32];
    snprintf(cmd, sizeof(cmd), ":SC%02d/%02d/%02d#", month, day, year % 100);

    int rc = sendCommand(cmd);
    if (rc != MEADE_OK)
        return rc;

    std::string reply;
    if ((rc = m_Channel.read(reply, 1)) != MEADE_OK)
        return rc;

    if (reply == "0")
    {
        std::string junk;
        if ((rc = m_Channel.read(junk, 1)) != MEADE_OK)
            return rc;
        LOGF_ERROR("Couldn't set date, invalid format %02d/%02d/%02d.", month, day, year % 100);
        return MEADE_COMMAND_REJECTED;
    }
    if (reply != "1")
    {
        LOGF_ERROR("Unexpected reply <%s> when setting the date.", reply.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }

    LX200Channel::ScopedTimeout timeout(m_Channel, LX200_DATE_TIMEOUT);
    std::string junk;
    if ((rc = readLine(junk)) != MEADE_OK)
        return rc;
    return readLine(junk);
}

int LX200Codec::getLocalTime(int *hour, int *minute, int *second)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string line;
    int rc = sendLine(":GL#", line);
    if (rc != MEADE_OK)
        return rc;
    if (sscanf(payload(line).c_str(), "%d:%d:%d", hour, minute, second) != 3)
    {
        LOGF_ERROR("Unexpected local time <%s>.", line.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::setLocalTime(int hour, int minute, int second)
{
    char value[16];
    snprintf(value, sizeof(value), "%02d:%02d:%02d", hour, minute, second);
    return setValue("local time", std::string(":SL") + value + "#", value);
}

int LX200Codec::getSiderealTime(double *lst)
{
    return getSexa(":GS#", 0, lst);
}

int LX200Codec::setSiderealTime(double lst)
{
    int h, m, s;
    long total = std::lround(ln_range_degrees(lst * 15.0) / 15.0 * 3600.0) % 86400;
    h = static_cast<int>(total / 3600);
    m = static_cast<int>((total % 3600) / 60);
    s = static_cast<int>(total % 60);
    char value[16];
    snprintf(value, sizeof(value), "%02d:%02d:%02d", h, m, s);
    return setValue("local sidereal time", std::string(":SS") + value + "#", value);
}

int LX200Codec::getUTCOffset(double *offset)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string line;
    int rc = sendLine(":GG#", line);
    if (rc != MEADE_OK)
        return rc;
    if (sscanf(payload(line).c_str(), "%lf", offset) != 1)
    {
        LOGF_ERROR("Unexpected UTC offset <%s>.", line.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::setUTCOffset(double offset)
{
    std::string value = formatUTCOffset(offset);
    return setValue("UTC offset", ":SG" + value + "#", value);
}

/*******************************************************************************
** Tracking
*******************************************************************************/
int LX200Codec::getTrackingFrequency(double *frequency)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string line;
    int rc = sendLine(":GT#", line);
    if (rc != MEADE_OK)
        return rc;
    if (sscanf(payload(line).c_str(), "%lf", frequency) != 1)
    {
        LOG_ERROR("Couldn't get the tracking rate.");
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::setTrackingFrequency(double frequency)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string value = formatTrackingFrequency(frequency);
    int rc = setValue("tracking rate", ":ST" + value + "#", value);
    if (rc != MEADE_OK)
        return rc;
    return sendCommand(":TM#");
}

int LX200Codec::startTracking()
{
    LOG_DEBUG(__FUNCTION__);
    CommsGuard guard(m_Channel.commsLock());
    MeadeAlignMode mode;
    int rc = getAlignMode(&mode);
    if (rc != MEADE_OK)
        return rc;
    if (mode != MEADE_ALIGN_LAND)
        return MEADE_OK;
    return setAlignMode(m_LastAlignMode);
}

int LX200Codec::stopTracking()
{
    LOG_DEBUG(__FUNCTION__);
    CommsGuard guard(m_Channel.commsLock());
    MeadeAlignMode mode;
    int rc = getAlignMode(&mode);
    if (rc != MEADE_OK)
        return rc;
    if (mode == MEADE_ALIGN_LAND)
        return MEADE_OK;
    m_LastAlignMode = mode;
    return setAlignMode(MEADE_ALIGN_LAND);
}

/*******************************************************************************
** Reply helpers
*******************************************************************************/
// After move commands the mount sometimes prefixes coordinates with a stray char
std::string LX200Codec::stripStalePrefix(const std::string &line, size_t width)
{
    if (width > 0 && line.size() > width)
        return line.substr(1);
    return line;
}

std::string LX200Codec::payload(const std::string &line)
{
    if (!line.empty() && line.back() == '#')
        return line.substr(0, line.size() - 1);
    return line;
}

int LX200Codec::sendCommand(const std::string &cmd)
{
    return m_Channel.write(cmd);
}

// true only for '1', anything else including silence is false
int LX200Codec::readBool(bool *value)
{
    std::string reply;
    int rc = m_Channel.read(reply, 1);
    if (rc != MEADE_OK)
        return rc;
    *value = (reply == "1");
    return MEADE_OK;
}

int LX200Codec::readLine(std::string &line)
{
    int rc = m_Channel.readUntil(line, '#');
    if (rc != MEADE_OK)
        return rc;
    if (line.empty() || line.back() != '#')
    {
        LOGF_ERROR("Unterminated reply <%s>.", line.c_str());
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::sendBool(const std::string &cmd, bool *value)
{
    CommsGuard guard(m_Channel.commsLock());
    int rc = sendCommand(cmd);
    if (rc != MEADE_OK)
        return rc;
    return readBool(value);
}

int LX200Codec::sendLine(const std::string &cmd, std::string &line)
{
    CommsGuard guard(m_Channel.commsLock());
    int rc = sendCommand(cmd);
    if (rc != MEADE_OK)
        return rc;
    return readLine(line);
}

int LX200Codec::getSexa(const char *cmd, size_t width, double *value)
{
    CommsGuard guard(m_Channel.commsLock());
    std::string line;
    int rc = sendLine(cmd, line);
    if (rc != MEADE_OK)
        return rc;

    std::string text = payload(stripStalePrefix(line, width));
    if (!parseSexa(text, value))
    {
        LOGF_ERROR("Failed to parse <%s> in reply to %s.", line.c_str(), cmd);
        return MEADE_UNEXPECTED_REPLY;
    }
    return MEADE_OK;
}

int LX200Codec::setValue(const char *what, const std::string &cmd, const std::string &shown)
{
    bool accepted = false;
    int rc = sendBool(cmd, &accepted);
    if (rc != MEADE_OK)
        return rc;
    if (!accepted)
    {
        LOGF_ERROR("Invalid %s '%s'.", what, shown.c_str());
        return MEADE_COMMAND_REJECTED;
    }
    return MEADE_OK;
}
