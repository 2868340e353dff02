#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <string.h>
#include <strings.h>
#include <iostream>
#include <vector>

#ifdef WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

#include <boost/thread/thread.hpp>

#include "logger.h"

using namespace Logger;

static char pchLogLevelMapping[][10]={"DISABLE","FATAL","SEVERE","ERROR","WARNING","INFO","DEBUG","ALWAYS"};
static int nLogLevel = SI_LOG_INFO;

static const int MAX_LOG_BUFFER_SIZE = 64 * 1024; // in bytes, 64KB

Log gLog;

#define RETURN_ON_LOG_LEVEL_CHECK(LogLevel)  \
    {   \
        if (SI_LOG_DISABLE == nLogLevel || \
            (SI_LOG_ALWAYS != LogLevel && \
             LogLevel > nLogLevel)) \
        {   \
            return; \
        }   \
    }

bool GetLogLevelName(SI_LOG_LEVEL logLevel, std::string& name)
{
    if (logLevel >= 0 && logLevel < SI_LOG_LEVEL_COUNT)
    {
        name = pchLogLevelMapping[logLevel];
        return true;
    }

    return false;
}

bool GetLogLevel(const std::string &logLevelName, SI_LOG_LEVEL &logLevel)
{
    for (size_t ind = 0; ind < ARRAYSIZE(pchLogLevelMapping); ind++)
    {
        if (0 == strcasecmp(logLevelName.c_str(), pchLogLevelMapping[ind]))
        {
            logLevel = static_cast<SI_LOG_LEVEL>(ind);
            return true;
        }
    }

    return false;
}

//
// Set the debug log level
//
void SetLogLevel(int level)
{
    if(level <= SI_LOG_ALWAYS && level >= SI_LOG_DISABLE)
        nLogLevel = level;
}

//
// Initialize the debug log file name
//
void SetLogFileName(const char* fileName)
{
    gLog.SetLogFileName(fileName);
}

void SetLogMaxSize(uint32_t size)
{
    gLog.SetLogFileSize(size);
}

//
// Close the debug log
//
void CloseDebug()
{
    gLog.CloseLogFile();
}

void Log::SetLogFileSize(uint32_t size)
{
    m_logMaxSize = size;
}

void Log::SetLogFileName(const std::string& fileName)
{
    boost::mutex::scoped_lock guard(m_syncLog);

    m_logFileName = fileName;

    if (m_logStream.is_open())
    {
        m_logStream.close();
    }

    m_logStream.clear();
    m_logStream.open(fileName.c_str(), std::ios::out | std::ios::app);
}

void Log::TruncateLogFile()
{
    m_logStream.close();
    m_logStream.clear();
    m_logStream.open(m_logFileName.c_str(), std::ios::out | std::ios::trunc);
}

void Log::CloseLogFile()
{
    boost::mutex::scoped_lock guard(m_syncLog);

    if (m_logStream.is_open())
    {
        m_logStream.close();
    }
    m_logFileName.clear();
}

std::string Log::FormatPrefix(SI_LOG_LEVEL logLevel) const
{
    struct tm today;
    time_t ltime;
    time(&ltime);

    localtime_r(&ltime, &today);

    char present[70];
    memset(present, 0, sizeof(present));
    snprintf(present, sizeof(present), "(%02d-%02d-20%02d %02d:%02d:%02d): %7s ",
        today.tm_mon + 1,
        today.tm_mday,
        today.tm_year - 100,
        today.tm_hour,
        today.tm_min,
        today.tm_sec,
        pchLogLevelMapping[logLevel]
        );

    return present;
}

void Log::Printf(SI_LOG_LEVEL logLevel, const std::string& message)
{
    boost::mutex::scoped_lock guard(m_syncLog);

    if (m_logFileName.empty())
    {
        if (logLevel <= SI_LOG_WARNING || SI_LOG_ALWAYS == logLevel)
        {
            std::cerr << FormatPrefix(logLevel) << message;
        }
        return;
    }

    if (m_logStream.good())
    {
        std::streamoff currPos = m_logStream.tellp();
        if (currPos != -1)
        {
            // Each char costs one byte.
            if (currPos > static_cast<std::streamoff>(m_logMaxSize))
                TruncateLogFile();
        }
        else
        {
            m_logStream.clear();
        }
    }

    if (m_logStream.fail())
    {
        m_logStream.clear();
    }

    m_logStream << LOG_START_INDICATOR
        << FormatPrefix(logLevel) << " "
        << getpid() << " "
        << boost::this_thread::get_id() << " "
        << m_logSequenceNum++ << " "
        << message;
    m_logStream.flush();
}

static void DebugPrintfV(SI_LOG_LEVEL LogLevel, const char* format, va_list args)
{
    std::vector<char> buffer(MAX_LOG_BUFFER_SIZE);
    int written = vsnprintf(&buffer[0], buffer.size(), format, args);
    if (written < 0)
    {
        return;
    }
    gLog.Printf(LogLevel, std::string(&buffer[0]));
}

///
/// Sends printf() style arguments to the debug log. Like all variadic functions, is
/// not typesafe; you must pass the same number of arguments as there are format fields.
///
void SI_CDECL DebugPrintf( SI_LOG_LEVEL LogLevel, const char* format, ... )
{
    RETURN_ON_LOG_LEVEL_CHECK(LogLevel)

    if( 0 == strlen( format ) )
    {
        return;
    }

    va_list a;
    va_start( a, format );
    DebugPrintfV( LogLevel, format, a );
    va_end( a );
}
