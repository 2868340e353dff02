#ifndef LOGGER__H
#define LOGGER__H

#include <fstream>
#include <string>

#include <boost/cstdint.hpp>
#include <boost/thread/mutex.hpp>

#include "portable.h"

#define LOG_DEFAULT_MAX_SIZE_IN_BYTES    10485760 // 10MB
#define LOG_START_INDICATOR              "#~> "

bool GetLogLevelName(SI_LOG_LEVEL logLevel, std::string& name);
bool GetLogLevel(const std::string &logLevelName, SI_LOG_LEVEL &logLevel);

void CloseDebug();
void SetLogLevel(int level);
void SetLogFileName(const char* fileName);
void SetLogMaxSize(uint32_t size);

namespace Logger
{
    /// \brief process wide log file
    ///
    /// lines are written as
    /// "#~> (MM-DD-20YY hh:mm:ss):   LEVEL pid thread seq message"
    /// when no file is set, messages at SI_LOG_WARNING or more severe go to stderr
    class Log {
    public:
        Log() :
        m_logMaxSize(LOG_DEFAULT_MAX_SIZE_IN_BYTES),
        m_logSequenceNum(1){}

        std::ofstream m_logStream;
        std::string m_logFileName;
        boost::mutex m_syncLog;
        uint32_t m_logMaxSize;
        uint64_t m_logSequenceNum;

        void SetLogFileName(const std::string& fileName);
        void SetLogFileSize(uint32_t logSize);
        
        void CloseLogFile();
        void Printf(SI_LOG_LEVEL logLevel, const std::string& message);

    private:
        void TruncateLogFile();
        std::string FormatPrefix(SI_LOG_LEVEL logLevel) const;
    };
}

#endif
