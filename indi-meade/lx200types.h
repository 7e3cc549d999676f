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

#ifndef MEADE_LX200TYPES_H
#define MEADE_LX200TYPES_H

#include <ctime>
#include <string>

#define LX200_TIMEOUT        5   /* FD timeout in seconds */
#define LX200_CHECK_TIMEOUT  5   /* timeout of the connection check */
#define LX200_DATE_TIMEOUT   60  /* the date command recomputes planetary data */
#define RB_MAX_LEN           64
#define LX200_ACK            0x06
#define LX200_DEGREE_GLYPH   '\xDF'
#define LX200_SLEW_TOLERANCE 60.0 /* arcsec */

/*******************************************************************************
** Error codes returned by every core operation
*******************************************************************************/
enum MeadeError
{
    MEADE_OK               = 0,
    MEADE_LINK_ERROR       = -1,
    MEADE_UNEXPECTED_REPLY = -2,
    MEADE_COMMAND_REJECTED = -3,
    MEADE_ALREADY_SLEWING  = -4,
    MEADE_INVALID_DURATION = -5,
    MEADE_SLEW_TIMEOUT     = -6
};

const char *meadeErrorString(int error);

// Ordered like INDI::Telescope::TelescopeSlewRate
enum MeadeSlewRate
{
    MEADE_SLEW_GUIDE = 0,
    MEADE_SLEW_CENTER,
    MEADE_SLEW_FIND,
    MEADE_SLEW_MAX
};
#define MEADE_SLEW_RATES 4

enum MeadeDirection
{
    MEADE_EAST = 0,
    MEADE_WEST,
    MEADE_NORTH,
    MEADE_SOUTH
};
#define MEADE_DIRECTIONS 4

enum MeadeAlignMode
{
    MEADE_ALIGN_ALTAZ = 0,
    MEADE_ALIGN_POLAR,
    MEADE_ALIGN_LAND
};

enum SlewState
{
    SLEW_IDLE = 0,
    SLEW_REQUESTED,
    SLEW_POLLING,
    SLEW_COMPLETE,
    SLEW_ABORTED,
    SLEW_TIMED_OUT,
    SLEW_REJECTED
};

const char *slewRateName(MeadeSlewRate rate);
const char *directionName(MeadeDirection direction);
const char *alignModeName(MeadeAlignMode mode);
const char *slewStateName(SlewState state);

// lower case letter used in :Mx# and :Qx#
char directionChar(MeadeDirection direction);

// seconds to wait after a stop until the mount has settled
double settleTime(MeadeSlewRate rate);

/*******************************************************************************
** Site the mount is set up for. Longitude east positive, UTC offset
** in the usual sense (local = UTC + offset).
*******************************************************************************/
struct MeadeSite
{
    double latitude;
    double longitude;
    double utcOffset;
    time_t now;
};

// UTC offset in hours as INDI keeps it in TIME_UTC, false when empty or out of range
bool parseUTCOffset(const char *text, double *offset);

/*******************************************************************************
** Immutable pair of angles in one of two frames
*******************************************************************************/
class Position
{
public:
    enum Frame
    {
        EQUATORIAL,
        HORIZONTAL
    };

    Position();

    static Position fromRaDec(double ra, double dec);
    static Position fromAltAz(double alt, double az);

    Frame frame() const { return m_Frame; }

    double ra() const { return m_Axis1; }
    double dec() const { return m_Axis2; }
    double alt() const { return m_Axis2; }
    double az() const { return m_Axis1; }

    /** angular distance in degrees, both positions must share a frame */
    double separation(const Position &other) const;
    bool within(const Position &other, double arcsec) const;

    std::string toString() const;

private:
    Position(Frame frame, double axis1, double axis2);

    Frame m_Frame;
    // RA (hours) or Az (degrees)
    double m_Axis1;
    // Dec or Alt (degrees)
    double m_Axis2;
};

/*******************************************************************************
** Sexagesimal helpers
*******************************************************************************/
// rewrites the degree glyph to ':' and parses the result, false on garbage
bool parseSexa(const std::string &text, double *value);

std::string formatHours(double hours);           // HH°MM:SS
std::string formatSignedDegrees(double degrees); // sDD°MM:SS
std::string formatDegrees(double degrees);       // DDD°MM:SS
std::string formatTrackingFrequency(double hz);
std::string formatUTCOffset(double hours);

double correctAzimuth(double azimuth);

#endif // MEADE_LX200TYPES_H
