/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <unistd.h>
#include <mutex>
#include <vector>

namespace coinuri {

// Once the log grows past this, it moves aside and a fresh one starts:
static const long logSizeLimit = 512 * 1024;

static std::mutex gLogMutex;
static FILE *gLogFile = nullptr;
static std::string gLogPath;

static void
logClose()
{
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

/**
 * Moves the current log to the ".prev" slot and opens an empty one.
 * The caller must hold the log mutex.
 */
static Status
logStartFresh()
{
    logClose();

    const auto previous = gLogPath + ".prev";
    if (0 == access(gLogPath.c_str(), F_OK) &&
            0 != rename(gLogPath.c_str(), previous.c_str()))
        return CU_ERROR(CU_CC_SysError, "Cannot move " + gLogPath +
                        " to " + previous);

    gLogFile = fopen(gLogPath.c_str(), "w");
    if (!gLogFile)
        return CU_ERROR(CU_CC_SysError, "Cannot open " + gLogPath);

    return Status();
}

Status
debugInitialize(const std::string &path)
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    gLogPath = path;
    return logStartFresh();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    logClose();
}

#ifdef DEBUG
static std::string
formatLine(const char *format, va_list args)
{
    char stamp[32];
    const time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S CU_Log: ", &utc);

    va_list copy;
    va_copy(copy, args);
    const int size = vsnprintf(nullptr, 0, format, copy);
    va_end(copy);
    if (size < 0)
        return std::string();

    std::vector<char> body(size + 1);
    vsnprintf(body.data(), body.size(), format, args);

    std::string out(stamp);
    out.append(body.data(), size);
    if ('\n' != out.back())
        out += '\n';
    return out;
}
#endif

void CU_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    va_list args;
    va_start(args, format);
    const auto line = formatLine(format, args);
    va_end(args);
    if (line.empty())
        return;

    std::lock_guard<std::mutex> lock(gLogMutex);
    fputs(line.c_str(), stdout);
    if (!gLogFile)
        return;

    if (logSizeLimit < ftell(gLogFile))
    {
        // Status::log would deadlock on the mutex, so report directly:
        const Status s = logStartFresh();
        if (!s)
        {
            fprintf(stderr, "%s\n", s.message().c_str());
            return;
        }
    }
    fwrite(line.data(), 1, line.size(), gLogFile);
    fflush(gLogFile);
#else
    (void)format;
#endif
}

} // namespace coinuri
