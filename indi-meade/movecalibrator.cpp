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

#include "movecalibrator.h"

#include <indiapi.h>
#include <indilogger.h>
#include <lilxml.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <wordexp.h>

typedef std::lock_guard<std::recursive_mutex> CommsGuard;

/*******************************************************************************
**
*******************************************************************************/
MoveCalibrator::MoveCalibrator(LX200Codec &codec, SlewController &slew) : m_Codec(codec), m_Slew(slew)
{
    reset();
}

void MoveCalibrator::reset()
{
    for (int rate = 0; rate < MEADE_SLEW_RATES; rate++)
        for (int direction = 0; direction < MEADE_DIRECTIONS; direction++)
            m_Factors[rate][direction] = 1.0;
    m_Calibrated = false;
}

double MoveCalibrator::getFactor(MeadeSlewRate rate, MeadeDirection direction) const
{
    return m_Factors[rate][direction];
}

/*******************************************************************************
** Two reference moves per slew rate and direction, the mean distance
** becomes the factor of the pair
*******************************************************************************/
int MoveCalibrator::calibrate()
{
    LOG_INFO("Calibrating fine movements...");
    CommsGuard guard(m_Codec.channel().commsLock());
    SlewController::MotionLock motion(m_Slew);
    if (!motion.ownsLock())
    {
        LOG_ERROR("Telescope is slewing. Cannot calibrate.");
        return MEADE_ALREADY_SLEWING;
    }

    // the table is replaced only once every pair is measured
    double factors[MEADE_SLEW_RATES][MEADE_DIRECTIONS];
    for (int r = 0; r < MEADE_SLEW_RATES; r++)
    {
        for (int d = 0; d < MEADE_DIRECTIONS; d++)
        {
            MeadeSlewRate rate = static_cast<MeadeSlewRate>(r);
            MeadeDirection direction = static_cast<MeadeDirection>(d);
            LOGF_DEBUG("Calibrating %s %s", slewRateName(rate), directionName(direction));

            double total = 0;
            for (int trial = 0; trial < 2; trial++)
            {
                double moved = 0;
                int rc = timedMove(direction, m_ReferenceDuration, rate, &moved);
                if (rc != MEADE_OK)
                {
                    LOGF_ERROR("Calibration of %s %s failed: %s", slewRateName(rate), directionName(direction),
                               meadeErrorString(rc));
                    return rc;
                }
                total += moved;
            }
            factors[r][d] = total / 2.0;
            LOGF_DEBUG("> %f", factors[r][d]);
        }
    }
    memcpy(m_Factors, factors, sizeof(m_Factors));
    m_Calibrated = true;

    if (!saveCalibration())
        LOG_WARN("Problems persisting calibration data.");

    LOG_INFO("Calibration was OK.");
    return MEADE_OK;
}

int MoveCalibrator::computeDuration(double arcsec, MeadeDirection direction, MeadeSlewRate rate, double *duration)
{
    CommsGuard guard(m_Codec.channel().commsLock());
    if (!m_Calibrated)
    {
        LOG_INFO("Telescope fine movement not calibrated. Calibrating now...");
        int rc = calibrate();
        if (rc != MEADE_OK)
            return rc;
    }

    LOGF_DEBUG("[move] asked for %.2f arcsec", arcsec);
    double factor = m_Factors[rate][direction];
    if (factor <= 0)
    {
        LOGF_ERROR("Mount did not move during calibration of %s %s.", slewRateName(rate), directionName(direction));
        return MEADE_INVALID_DURATION;
    }
    *duration = arcsec * m_ReferenceDuration / factor;
    return MEADE_OK;
}

/*******************************************************************************
** The stop must follow the start after exactly the given duration, so
** the wait is a spin on the steady clock with the link locked.
*******************************************************************************/
int MoveCalibrator::move(MeadeDirection direction, double duration, MeadeSlewRate rate, double *displacement)
{
    if (duration <= 0)
    {
        LOGF_ERROR("Move duration must be positive, got %.3f s.", duration);
        return MEADE_INVALID_DURATION;
    }

    CommsGuard guard(m_Codec.channel().commsLock());
    SlewController::MotionLock motion(m_Slew);
    if (!motion.ownsLock())
    {
        LOG_ERROR("Telescope is slewing. Cannot move.");
        return MEADE_ALREADY_SLEWING;
    }
    return timedMove(direction, duration, rate, displacement);
}

// caller holds the link and the motion claim
int MoveCalibrator::timedMove(MeadeDirection direction, double duration, MeadeSlewRate rate, double *displacement)
{
    int rc = m_Codec.setSlewRate(rate);
    if (rc != MEADE_OK)
        return rc;

    Position start;
    if ((rc = m_Codec.getPosition(Position::EQUATORIAL, &start)) != MEADE_OK)
        return rc;

    if ((rc = m_Codec.moveStart(direction)) != MEADE_OK)
        return rc;

    auto finish = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                      std::chrono::duration<double>(duration));
    LOGF_DEBUG("[move] %s at %s for %.3f s", directionName(direction), slewRateName(rate), duration);

    while (std::chrono::steady_clock::now() < finish)
        ;

    if ((rc = m_Codec.moveStop(direction)) != MEADE_OK)
        return rc;

    Position end;
    if ((rc = m_Codec.getPosition(Position::EQUATORIAL, &end)) != MEADE_OK)
        return rc;

    double moved = end.separation(start) * 3600.0;
    LOGF_DEBUG("[move] moved %f arcsec", moved);
    if (displacement != nullptr)
        *displacement = moved;
    return MEADE_OK;
}

int MoveCalibrator::moveOffset(MeadeDirection direction, double arcsec, MeadeSlewRate rate)
{
    LOGF_DEBUG("%s %s %.2f arcsec at %s", __FUNCTION__, directionName(direction), arcsec, slewRateName(rate));
    double duration = 0;
    int rc = computeDuration(arcsec, direction, rate, &duration);
    if (rc != MEADE_OK)
        return rc;
    return move(direction, duration, rate);
}

/*******************************************************************************
** Persistence
**
** <movecalibration>
**   <device name="Meade LX200" reference="5.000000">
**     <factor rate="GUIDE" direction="E">12.345000</factor>
**     ...
*******************************************************************************/
static bool expandPath(const std::string &path, std::string &expanded)
{
    wordexp_t wexp;
    if (wordexp(path.c_str(), &wexp, 0) || wexp.we_wordc < 1)
    {
        wordfree(&wexp);
        return false;
    }
    expanded = wexp.we_wordv[0];
    wordfree(&wexp);
    return true;
}

static XMLEle *readCalibrationFile(const std::string &filename, char *errmsg)
{
    FILE *fp = fopen(filename.c_str(), "r");
    if (fp == nullptr)
    {
        snprintf(errmsg, MAXRBUF, "%s", strerror(errno));
        return nullptr;
    }
    LilXML *lp = newLilXML();
    XMLEle *root = readXMLFile(fp, lp, errmsg);
    fclose(fp);
    delLilXML(lp);
    return root;
}

bool MoveCalibrator::loadCalibration()
{
    std::string filename;
    if (!expandPath(m_CalibrationFile, filename))
    {
        LOGF_WARN("Badly formed calibration filename %s.", m_CalibrationFile.c_str());
        return false;
    }

    char errmsg[MAXRBUF] = {0};
    XMLEle *root = readCalibrationFile(filename, errmsg);
    if (root == nullptr)
    {
        LOGF_INFO("No fine movement calibration loaded from %s: %s", filename.c_str(), errmsg);
        return false;
    }
    if (strcmp(tagXMLEle(root), "movecalibration"))
    {
        LOGF_WARN("%s is not a movement calibration file.", filename.c_str());
        delXMLEle(root);
        return false;
    }

    XMLEle *device = nullptr;
    for (XMLEle *ep = nextXMLEle(root, 1); ep != nullptr; ep = nextXMLEle(root, 0))
    {
        if (!strcmp(tagXMLEle(ep), "device") && !strcmp(findXMLAttValu(ep, "name"), getDeviceName()))
        {
            device = ep;
            break;
        }
    }
    if (device == nullptr)
    {
        LOGF_INFO("No fine movement calibration for %s in %s.", getDeviceName(), filename.c_str());
        delXMLEle(root);
        return false;
    }

    // factors are stored for the reference duration of the calibration run
    double reference = atof(findXMLAttValu(device, "reference"));
    double scale = (reference > 0) ? m_ReferenceDuration / reference : 1.0;

    double factors[MEADE_SLEW_RATES][MEADE_DIRECTIONS];
    int found = 0;
    for (XMLEle *ep = nextXMLEle(device, 1); ep != nullptr; ep = nextXMLEle(device, 0))
    {
        if (strcmp(tagXMLEle(ep), "factor"))
            continue;
        const char *rateText = findXMLAttValu(ep, "rate");
        const char *directionText = findXMLAttValu(ep, "direction");
        int r = 0, d = 0;
        while (r < MEADE_SLEW_RATES && strcmp(rateText, slewRateName(static_cast<MeadeSlewRate>(r))))
            r++;
        while (d < MEADE_DIRECTIONS && strcmp(directionText, directionName(static_cast<MeadeDirection>(d))))
            d++;
        double value = atof(pcdataXMLEle(ep));
        if (r == MEADE_SLEW_RATES || d == MEADE_DIRECTIONS || value <= 0)
        {
            LOGF_WARN("Ignoring invalid calibration entry %s %s.", rateText, directionText);
            continue;
        }
        factors[r][d] = value * scale;
        found |= 1 << (r * MEADE_DIRECTIONS + d);
    }
    delXMLEle(root);

    if (found != (1 << (MEADE_SLEW_RATES * MEADE_DIRECTIONS)) - 1)
    {
        LOGF_WARN("Incomplete fine movement calibration in %s.", filename.c_str());
        return false;
    }

    CommsGuard guard(m_Codec.channel().commsLock());
    memcpy(m_Factors, factors, sizeof(m_Factors));
    m_Calibrated = true;
    LOGF_INFO("Fine movement calibration loaded from %s.", filename.c_str());
    return true;
}

/*******************************************************************************
** Entries of other devices are kept. The file is replaced atomically.
*******************************************************************************/
bool MoveCalibrator::saveCalibration()
{
    std::string filename;
    if (!expandPath(m_CalibrationFile, filename))
    {
        LOGF_WARN("Badly formed calibration filename %s.", m_CalibrationFile.c_str());
        return false;
    }

    char errmsg[MAXRBUF] = {0};
    XMLEle *root = readCalibrationFile(filename, errmsg);
    if (root != nullptr && strcmp(tagXMLEle(root), "movecalibration"))
    {
        delXMLEle(root);
        root = nullptr;
    }
    if (root == nullptr)
        root = addXMLEle(nullptr, "movecalibration");

    XMLEle *ep = nextXMLEle(root, 1);
    while (ep != nullptr)
    {
        if (!strcmp(tagXMLEle(ep), "device") && !strcmp(findXMLAttValu(ep, "name"), getDeviceName()))
        {
            delXMLEle(ep);
            ep = nextXMLEle(root, 1);
            continue;
        }
        ep = nextXMLEle(root, 0);
    }

    char pcdata[32];
    XMLEle *device = addXMLEle(root, "device");
    addXMLAtt(device, "name", getDeviceName());
    snprintf(pcdata, sizeof(pcdata), "%lf", m_ReferenceDuration);
    addXMLAtt(device, "reference", pcdata);

    for (int r = 0; r < MEADE_SLEW_RATES; r++)
    {
        for (int d = 0; d < MEADE_DIRECTIONS; d++)
        {
            XMLEle *factor = addXMLEle(device, "factor");
            addXMLAtt(factor, "rate", slewRateName(static_cast<MeadeSlewRate>(r)));
            addXMLAtt(factor, "direction", directionName(static_cast<MeadeDirection>(d)));
            snprintf(pcdata, sizeof(pcdata), "%lf", m_Factors[r][d]);
            editXMLEle(factor, pcdata);
        }
    }

    std::string tmpname = filename + ".tmp";
    FILE *fp = fopen(tmpname.c_str(), "w");
    if (fp == nullptr)
    {
        LOGF_WARN("Can not write file %s: %s", tmpname.c_str(), strerror(errno));
        delXMLEle(root);
        return false;
    }
    prXMLEle(fp, root, 0);
    delXMLEle(root);

    if (fclose(fp) != 0 || rename(tmpname.c_str(), filename.c_str()) != 0)
    {
        LOGF_WARN("Can not write file %s: %s", filename.c_str(), strerror(errno));
        remove(tmpname.c_str());
        return false;
    }
    LOGF_DEBUG("Fine movement calibration saved to %s.", filename.c_str());
    return true;
}
