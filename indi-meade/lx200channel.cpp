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

#include "lx200channel.h"

#include <indiapi.h>
#include <indicom.h>
#include <indilogger.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <sstream>
#include <termios.h>
#include <thread>
#include <unistd.h>

/*******************************************************************************
**
*******************************************************************************/
LX200Channel::LX200Channel(const char *deviceName) : m_DeviceName(deviceName)
{
    m_DebugLevel = INDI::Logger::DBG_DEBUG;
}

LX200Channel::~LX200Channel()
{
    if (isOpen())
        close();
    closeTrace();
}

/*******************************************************************************
** Open the serial port at 8N1 without flow control
*******************************************************************************/
int LX200Channel::open(const char *device, int baudRate, int timeout)
{
    LOGF_DEBUG("%s %s at %d baud", __FUNCTION__, device, baudRate);
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);

    int fd = -1;
    int returnCode = tty_connect(device, baudRate, 8, 0, 1, &fd);
    if (returnCode != TTY_OK)
    {
        char errorString[MAXRBUF];
        tty_error_msg(returnCode, errorString, MAXRBUF);
        LOGF_ERROR("Failed to open %s: %s", device, errorString);
        return MEADE_LINK_ERROR;
    }
    m_PortFD   = fd;
    m_OwnsPort = true;
    m_Timeout  = timeout;
    return MEADE_OK;
}

/*******************************************************************************
** Use a port opened by someone else, close() will not release it
*******************************************************************************/
int LX200Channel::attach(int fd, int timeout)
{
    LOGF_DEBUG("%s fd=%d", __FUNCTION__, fd);
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);
    if (fd < 0)
    {
        LOG_ERROR("Cannot attach to an invalid port.");
        return MEADE_LINK_ERROR;
    }
    m_PortFD   = fd;
    m_OwnsPort = false;
    m_Timeout  = timeout;
    return MEADE_OK;
}

/*******************************************************************************
**
*******************************************************************************/
int LX200Channel::close()
{
    LOG_DEBUG(__FUNCTION__);
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);
    if (!isOpen())
        return MEADE_LINK_ERROR;

    int returnCode = TTY_OK;
    if (m_OwnsPort)
        returnCode = tty_disconnect(m_PortFD);
    m_PortFD   = -1;
    m_OwnsPort = false;

    if (returnCode != TTY_OK)
    {
        char errorString[MAXRBUF];
        tty_error_msg(returnCode, errorString, MAXRBUF);
        LOGF_WARN("Failed to close the port: %s", errorString);
        return MEADE_LINK_ERROR;
    }
    return MEADE_OK;
}

/*******************************************************************************
** Write a command. Unless flush is false, pending input is discarded
** first, the mount sometimes emits bytes nobody asked for.
*******************************************************************************/
int LX200Channel::write(const std::string &data, bool flush)
{
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);
    if (!isOpen())
    {
        LOGF_ERROR("Cannot send %s, port not open.", data.c_str());
        return MEADE_LINK_ERROR;
    }

    if (flush)
        tcflush(m_PortFD, TCIFLUSH);

    trace("write", data);

    int bytesWritten = 0;
    int returnCode = tty_write(m_PortFD, data.data(), static_cast<int>(data.size()), &bytesWritten);
    if (returnCode != TTY_OK)
    {
        char errorString[MAXRBUF];
        tty_error_msg(returnCode, errorString, MAXRBUF);
        LOGF_WARN("Failed to transmit %s. Wrote %d bytes and got error %s.", data.c_str(), bytesWritten, errorString);
        return MEADE_LINK_ERROR;
    }
    return MEADE_OK;
}

/*******************************************************************************
**
*******************************************************************************/
int LX200Channel::read(std::string &data, int nbytes, bool flush)
{
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);
    data.clear();
    if (!isOpen())
    {
        LOG_ERROR("Cannot read, port not open.");
        return MEADE_LINK_ERROR;
    }

    if (flush)
        tcflush(m_PortFD, TCIFLUSH);

    char buffer[RB_MAX_LEN] = {0};
    if (nbytes > RB_MAX_LEN)
        nbytes = RB_MAX_LEN;

    int bytesRead = 0;
    int returnCode = tty_read(m_PortFD, buffer, nbytes, m_Timeout, &bytesRead);
    if (returnCode != TTY_OK && returnCode != TTY_TIME_OUT)
    {
        char errorString[MAXRBUF];
        tty_error_msg(returnCode, errorString, MAXRBUF);
        LOGF_WARN("Failed to receive response: %s. (Return code: %d)", errorString, returnCode);
        return MEADE_LINK_ERROR;
    }

    data.assign(buffer, bytesRead > 0 ? bytesRead : 0);
    trace("read ", data);
    return MEADE_OK;
}

/*******************************************************************************
**
*******************************************************************************/
int LX200Channel::readUntil(std::string &data, char terminator)
{
    std::lock_guard<std::recursive_mutex> guard(m_CommsLock);
    data.clear();
    if (!isOpen())
    {
        LOG_ERROR("Cannot read, port not open.");
        return MEADE_LINK_ERROR;
    }

    while (data.size() < RB_MAX_LEN)
    {
        char c = 0;
        int bytesRead = 0;
        int returnCode = tty_read(m_PortFD, &c, 1, m_Timeout, &bytesRead);
        if (returnCode == TTY_TIME_OUT)
            break;
        if (returnCode != TTY_OK)
        {
            char errorString[MAXRBUF];
            tty_error_msg(returnCode, errorString, MAXRBUF);
            LOGF_WARN("Failed to receive full response: %s. (Return code: %d)", errorString, returnCode);
            trace("read ", data);
            return MEADE_LINK_ERROR;
        }
        if (bytesRead < 1)
            break;
        data.push_back(c);
        if (c == terminator)
            break;
    }

    trace("read ", data);
    return MEADE_OK;
}

/*******************************************************************************
** Debug trace of the wire traffic
*******************************************************************************/
bool LX200Channel::openTrace(const std::string &path)
{
    std::lock_guard<std::mutex> guard(m_TraceLock);
    if (m_TraceFile != nullptr)
        fclose(m_TraceFile);
    m_TraceFile = fopen(path.c_str(), "a");
    if (m_TraceFile == nullptr)
    {
        LOGF_WARN("Cannot open trace file %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    LOGF_INFO("Tracing LX200 traffic to %s", path.c_str());
    return true;
}

void LX200Channel::closeTrace()
{
    std::lock_guard<std::mutex> guard(m_TraceLock);
    if (m_TraceFile != nullptr)
    {
        fclose(m_TraceFile);
        m_TraceFile = nullptr;
    }
}

bool LX200Channel::isTracing()
{
    std::lock_guard<std::mutex> guard(m_TraceLock);
    return m_TraceFile != nullptr;
}

void LX200Channel::trace(const char *tag, const std::string &data)
{
    std::string printable;
    for (unsigned char c : data)
    {
        if (c >= 0x20 && c < 0x7f && c != '\\')
            printable.push_back(static_cast<char>(c));
        else
        {
            char hex[5];
            snprintf(hex, sizeof(hex), "\\x%02x", c);
            printable += hex;
        }
    }
    DEBUGFDEVICE(getDeviceName(), m_DebugLevel, "%s <%s>", strcmp(tag, "write") == 0 ? "CMD" : "RES", printable.c_str());

    std::lock_guard<std::mutex> guard(m_TraceLock);
    if (m_TraceFile == nullptr)
        return;

    auto now = std::chrono::system_clock::now();
    time_t seconds = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm local;
    localtime_r(&seconds, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);

    std::ostringstream thread;
    thread << std::this_thread::get_id();

    fprintf(m_TraceFile, "%s.%03ld %s [%s] '%s'\n", stamp, millis, thread.str().c_str(), tag, printable.c_str());
    fflush(m_TraceFile);
}

/*******************************************************************************
** ScopedTimeout
*******************************************************************************/
LX200Channel::ScopedTimeout::ScopedTimeout(LX200Channel &channel, int seconds)
    : m_Channel(channel), m_Previous(channel.getTimeout())
{
    m_Channel.setTimeout(seconds);
}

LX200Channel::ScopedTimeout::~ScopedTimeout()
{
    m_Channel.setTimeout(m_Previous);
}
