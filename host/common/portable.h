//
// @file portable.h: OS portability layer shared by the SanImport libraries
//
#ifndef PORTABLE__H
#define PORTABLE__H

#include <string>
#include <cstring>

#include <boost/function.hpp>

//
// Calling conventions
//
#ifndef WIN32
#define SI_CDECL
#else
#define SI_CDECL __cdecl
#endif

#ifdef WIN32
#define FUNCTION_NAME __FUNCTION__
#else
#define FUNCTION_NAME __func__
#endif

#ifndef ARRAYSIZE
#define ARRAYSIZE(a) (sizeof(a) / sizeof(*(a)))
#endif

/// \brief polled by long running operations, returns true when the caller wants them to stop
/// the argument is the number of seconds the callee is willing to wait, 0 to just poll
typedef boost::function<bool (int)> QuitFunction_t;

//
// Debug utility functions
//
enum SI_LOG_LEVEL { SI_LOG_DISABLE,
                    SI_LOG_FATAL,
                    SI_LOG_SEVERE,
                    SI_LOG_ERROR,
                    SI_LOG_WARNING,
                    SI_LOG_INFO,
                    SI_LOG_DEBUG,
                    SI_LOG_ALWAYS,
                    SI_LOG_LEVEL_COUNT};

void SI_CDECL DebugPrintf( SI_LOG_LEVEL LogLevel, const char* format, ... );

#endif
