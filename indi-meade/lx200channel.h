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

#ifndef MEADE_LX200CHANNEL_H
#define MEADE_LX200CHANNEL_H

#include "lx200types.h"

#include <cstdio>
#include <mutex>
#include <string>

/*******************************************************************************
** Byte level access to the serial link of one mount.
**
** The channel either opens the port itself or attaches to a descriptor
** opened by the INDI serial connection plugin. It owns the communications
** lock: every LX200 exchange (write + read) must hold it for its whole
** duration so replies are never handed to the wrong caller.
*******************************************************************************/
class LX200Channel
{
public:
    explicit LX200Channel(const char *deviceName = "Meade LX200");
    ~LX200Channel();

    LX200Channel(const LX200Channel &) = delete;
    LX200Channel &operator=(const LX200Channel &) = delete;

    int open(const char *device, int baudRate = 9600, int timeout = LX200_TIMEOUT);
    int attach(int fd, int timeout = LX200_TIMEOUT);
    int close();
    bool isOpen() const { return m_PortFD >= 0; }

    int write(const std::string &data, bool flush = true);
    // reads up to nbytes, a timeout leaves the bytes received so far in data.
    // flush drops pending input first, for reads that expect unsolicited bytes.
    int read(std::string &data, int nbytes = 1, bool flush = false);
    // reads up to and including the terminator, or whatever arrived before the timeout
    int readUntil(std::string &data, char terminator = '#');

    int getTimeout() const { return m_Timeout; }
    void setTimeout(int seconds) { m_Timeout = seconds; }

    bool openTrace(const std::string &path);
    void closeTrace();
    bool isTracing();

    std::recursive_mutex &commsLock() { return m_CommsLock; }

    const char *getDeviceName() const { return m_DeviceName.c_str(); }
    void setDeviceName(const char *name) { m_DeviceName = name; }
    unsigned int getDebugLevel() const { return m_DebugLevel; }
    void setDebugLevel(unsigned int level) { m_DebugLevel = level; }

    // Overrides the I/O timeout of a channel and restores it when going out of scope
    class ScopedTimeout
    {
    public:
        ScopedTimeout(LX200Channel &channel, int seconds);
        ~ScopedTimeout();
    private:
        LX200Channel &m_Channel;
        int m_Previous;
    };

private:
    void trace(const char *tag, const std::string &data);

    std::string m_DeviceName;
    unsigned int m_DebugLevel;
    int m_PortFD {-1};
    bool m_OwnsPort {false};
    int m_Timeout {LX200_TIMEOUT};

    std::recursive_mutex m_CommsLock;

    std::mutex m_TraceLock;
    FILE *m_TraceFile {nullptr};
};

#endif // MEADE_LX200CHANNEL_H
