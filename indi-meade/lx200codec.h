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

#ifndef MEADE_LX200CODEC_H
#define MEADE_LX200CODEC_H

#include "lx200channel.h"
#include "lx200types.h"

#include <string>

/*******************************************************************************
** LX200 command set of the classic Meade mounts.
**
** Every public operation holds the communications lock of the channel for
** its complete exchange. All of them return a MeadeError code, values are
** passed back through the pointer arguments.
*******************************************************************************/
class LX200Codec
{
public:
    explicit LX200Codec(LX200Channel &channel);

    LX200Channel &channel() { return m_Channel; }
    const char *getDeviceName() const { return m_Channel.getDeviceName(); }

    void setAzimuthCorrection(bool enabled) { m_AzimuthCorrection = enabled; }
    bool getAzimuthCorrection() const { return m_AzimuthCorrection; }

// Connection and setup
    int checkConnection();
    int getAlignMode(MeadeAlignMode *mode);
    int setAlignMode(MeadeAlignMode mode);
    int setHighPrecision();
    int autoAlign();
    int setSite(const MeadeSite &site);

// Slewing
    int setSlewRate(MeadeSlewRate rate);
    MeadeSlewRate getSlewRate() const { return m_SlewRate; }
    int getRA(double *ra);
    int getDec(double *dec);
    int getAlt(double *alt);
    int getAz(double *az);
    int getPosition(Position::Frame frame, Position *position);
    int getTargetRA(double *ra);
    int getTargetDec(double *dec);
    int setTargetRA(double ra);
    int setTargetDec(double dec);
    int setTargetRaDec(double ra, double dec);
    int setTargetAlt(double alt);
    int setTargetAz(double az);
    int setTargetAltAz(double alt, double az);
    double getTargetAlt() const { return m_TargetAlt; }
    double getTargetAz() const { return m_TargetAz; }
    int startSlew(Position::Frame frame);
    int sync(double ra, double dec);

// Motion
    int moveStart(MeadeDirection direction);
    int moveStop(MeadeDirection direction);
    int stopAll();

// Site and time
    int getLatitude(double *latitude);
    int setLatitude(double latitude);
    int getLongitude(double *longitude);
    int setLongitude(double longitude);
    int getDate(int *year, int *month, int *day);
    int setDate(int year, int month, int day);
    int getLocalTime(int *hour, int *minute, int *second);
    int setLocalTime(int hour, int minute, int second);
    int getSiderealTime(double *lst);
    int setSiderealTime(double lst);
    int getUTCOffset(double *offset);
    int setUTCOffset(double offset);

// Tracking
    int getTrackingFrequency(double *frequency);
    int setTrackingFrequency(double frequency);
    int startTracking();
    int stopTracking();

// Reply helpers, also used by the tests
    static std::string stripStalePrefix(const std::string &line, size_t width);
    static std::string payload(const std::string &line);

protected:
    int sendCommand(const std::string &cmd);
    int readBool(bool *value);
    int readLine(std::string &line);
    int sendBool(const std::string &cmd, bool *value);
    int sendLine(const std::string &cmd, std::string &line);
    int getSexa(const char *cmd, size_t width, double *value);
    int setValue(const char *what, const std::string &cmd, const std::string &shown);

private:
    LX200Channel &m_Channel;
    bool m_AzimuthCorrection {true};
    MeadeSlewRate m_SlewRate {MEADE_SLEW_MAX};
    // previous mode, restored when tracking is switched back on
    MeadeAlignMode m_LastAlignMode {MEADE_ALIGN_ALTAZ};
    double m_TargetAlt;
    double m_TargetAz;
};

#endif // MEADE_LX200CODEC_H
