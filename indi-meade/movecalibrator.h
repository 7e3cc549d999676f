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

#ifndef MEADE_MOVECALIBRATOR_H
#define MEADE_MOVECALIBRATOR_H

#include "lx200codec.h"
#include "lx200types.h"
#include "slewcontroller.h"

#include <string>

#define MOVE_CALIBRATION_FILE      "~/.indi/MoveCalibration.xml"
#define MOVE_REFERENCE_DURATION    5.0

/*******************************************************************************
** Timed fine moves by an angular offset.
**
** The mount has no "move by" command, so the calibrator measures how far
** each (slew rate, direction) pair moves during a reference duration and
** scales the duration of later moves accordingly.
*******************************************************************************/
class MoveCalibrator
{
public:
    MoveCalibrator(LX200Codec &codec, SlewController &slew);

    const char *getDeviceName() const { return m_Codec.getDeviceName(); }

    const std::string &getCalibrationFile() const { return m_CalibrationFile; }
    void setCalibrationFile(const std::string &path) { m_CalibrationFile = path; }
    double getReferenceDuration() const { return m_ReferenceDuration; }
    void setReferenceDuration(double seconds) { m_ReferenceDuration = seconds; }

    bool isCalibrated() const { return m_Calibrated; }
    // arcsec moved during the reference duration
    double getFactor(MeadeSlewRate rate, MeadeDirection direction) const;

    bool loadCalibration();
    bool saveCalibration();

    int calibrate();
    int computeDuration(double arcsec, MeadeDirection direction, MeadeSlewRate rate, double *duration);

    /**
     * @brief Moves the mount for exactly the given time.
     * @param displacement if not null, receives the measured distance in arcsec
     */
    int move(MeadeDirection direction, double duration, MeadeSlewRate rate, double *displacement = nullptr);
    int moveOffset(MeadeDirection direction, double arcsec, MeadeSlewRate rate);

private:
    void reset();
    int timedMove(MeadeDirection direction, double duration, MeadeSlewRate rate, double *displacement);

    LX200Codec &m_Codec;
    SlewController &m_Slew;

    std::string m_CalibrationFile {MOVE_CALIBRATION_FILE};
    double m_ReferenceDuration {MOVE_REFERENCE_DURATION};
    double m_Factors[MEADE_SLEW_RATES][MEADE_DIRECTIONS];
    bool m_Calibrated {false};
};

#endif // MEADE_MOVECALIBRATOR_H
