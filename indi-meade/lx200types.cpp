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

#include "lx200types.h"

#include <indicom.h>

#include <libnova/angular_separation.h>
#include <libnova/utility.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

/*******************************************************************************
** Names
*******************************************************************************/
const char *meadeErrorString(int error)
{
    switch (error)
    {
        case MEADE_OK:
            return "OK";
        case MEADE_LINK_ERROR:
            return "link error";
        case MEADE_UNEXPECTED_REPLY:
            return "unexpected reply";
        case MEADE_COMMAND_REJECTED:
            return "command rejected";
        case MEADE_ALREADY_SLEWING:
            return "already slewing";
        case MEADE_INVALID_DURATION:
            return "invalid duration";
        case MEADE_SLEW_TIMEOUT:
            return "slew timeout";
        default:
            return "unknown error";
    }
}

const char *slewRateName(MeadeSlewRate rate)
{
    static const char *names[MEADE_SLEW_RATES] = {"GUIDE", "CENTER", "FIND", "MAX"};
    return names[rate];
}

const char *directionName(MeadeDirection direction)
{
    static const char *names[MEADE_DIRECTIONS] = {"E", "W", "N", "S"};
    return names[direction];
}

const char *alignModeName(MeadeAlignMode mode)
{
    switch (mode)
    {
        case MEADE_ALIGN_ALTAZ:
            return "ALT_AZ";
        case MEADE_ALIGN_POLAR:
            return "POLAR";
        case MEADE_ALIGN_LAND:
            return "LAND";
    }
    return "UNKNOWN";
}

const char *slewStateName(SlewState state)
{
    static const char *names[] = {"IDLE", "REQUESTED", "POLLING", "COMPLETE", "ABORTED", "TIMED_OUT", "REJECTED"};
    return names[state];
}

char directionChar(MeadeDirection direction)
{
    static const char chars[MEADE_DIRECTIONS] = {'e', 'w', 'n', 's'};
    return chars[direction];
}

double settleTime(MeadeSlewRate rate)
{
    static const double settle[MEADE_SLEW_RATES] = {0.1, 0.2, 0.3, 0.4};
    return settle[rate];
}

bool parseUTCOffset(const char *text, double *offset)
{
    if (text == nullptr || *text == '\0')
        return false;
    char *end = nullptr;
    double value = strtod(text, &end);
    while (end != nullptr && isspace(static_cast<unsigned char>(*end)))
        end++;
    if (end == text || *end != '\0' || value < -14.0 || value > 14.0)
        return false;
    *offset = value;
    return true;
}

/*******************************************************************************
** Position
*******************************************************************************/
Position::Position() : Position(EQUATORIAL, 0, 0)
{
}

Position::Position(Frame frame, double axis1, double axis2) : m_Frame(frame), m_Axis1(axis1), m_Axis2(axis2)
{
}

Position Position::fromRaDec(double ra, double dec)
{
    return Position(EQUATORIAL, ra, dec);
}

Position Position::fromAltAz(double alt, double az)
{
    return Position(HORIZONTAL, az, alt);
}

double Position::separation(const Position &other) const
{
    double scale = (m_Frame == EQUATORIAL) ? 15.0 : 1.0;
    struct ln_equ_posn a, b;
    a.ra  = m_Axis1 * scale;
    a.dec = m_Axis2;
    b.ra  = other.m_Axis1 * scale;
    b.dec = other.m_Axis2;
    return ln_get_angular_separation(&a, &b);
}

bool Position::within(const Position &other, double arcsec) const
{
    if (m_Frame != other.m_Frame)
        return false;
    return separation(other) * 3600.0 <= arcsec;
}

std::string Position::toString() const
{
    char axis1[32] = {0}, axis2[32] = {0};
    char buffer[80] = {0};
    if (m_Frame == EQUATORIAL)
    {
        fs_sexa(axis1, m_Axis1, 2, 3600);
        fs_sexa(axis2, m_Axis2, 3, 3600);
        snprintf(buffer, sizeof(buffer), "RA %s Dec %s", axis1, axis2);
    }
    else
    {
        fs_sexa(axis1, m_Axis1, 3, 3600);
        fs_sexa(axis2, m_Axis2, 3, 3600);
        snprintf(buffer, sizeof(buffer), "Alt %s Az %s", axis2, axis1);
    }
    return buffer;
}

/*******************************************************************************
** Sexagesimal
*******************************************************************************/
bool parseSexa(const std::string &text, double *value)
{
    std::string colon = text;
    std::replace(colon.begin(), colon.end(), LX200_DEGREE_GLYPH, ':');
    if (colon.empty())
        return false;
    return f_scansexa(colon.c_str(), value) == 0;
}

// split |value| into whole units, minutes and seconds, rounded to the second
static void splitSexa(double value, long wrap, int *units, int *minutes, int *seconds)
{
    long total = std::lround(std::fabs(value) * 3600.0);
    if (wrap > 0)
        total %= wrap * 3600;
    *units   = static_cast<int>(total / 3600);
    *minutes = static_cast<int>((total % 3600) / 60);
    *seconds = static_cast<int>(total % 60);
}

std::string formatHours(double hours)
{
    int h, m, s;
    splitSexa(ln_range_degrees(hours * 15.0) / 15.0, 24, &h, &m, &s);
    char buffer[16] = {0};
    snprintf(buffer, sizeof(buffer), "%02d%c%02d:%02d", h, LX200_DEGREE_GLYPH, m, s);
    return buffer;
}

std::string formatSignedDegrees(double degrees)
{
    int d, m, s;
    splitSexa(degrees, 0, &d, &m, &s);
    char buffer[16] = {0};
    snprintf(buffer, sizeof(buffer), "%c%02d%c%02d:%02d", degrees < 0 ? '-' : '+', d, LX200_DEGREE_GLYPH, m, s);
    return buffer;
}

std::string formatDegrees(double degrees)
{
    int d, m, s;
    splitSexa(ln_range_degrees(degrees), 360, &d, &m, &s);
    char buffer[16] = {0};
    snprintf(buffer, sizeof(buffer), "%03d%c%02d:%02d", d, LX200_DEGREE_GLYPH, m, s);
    return buffer;
}

std::string formatTrackingFrequency(double hz)
{
    char buffer[16] = {0};
    snprintf(buffer, sizeof(buffer), "%02.1f", hz);
    std::string frequency(buffer);
    if (frequency.size() < 4)
        frequency.insert(0, 4 - frequency.size(), '0');
    return frequency;
}

std::string formatUTCOffset(double hours)
{
    char buffer[16] = {0};
    snprintf(buffer, sizeof(buffer), "%+02.1f", hours);
    return buffer;
}

double correctAzimuth(double azimuth)
{
    return (azimuth < 180.0) ? azimuth + 180.0 : azimuth - 180.0;
}
