//
// @file sistatus.cpp
// Name table for the SISTATUS codes.
//
#include "sistatus.h"
#include "portable.h"

#undef SISTATUS_ENUM
#define SISTATUS_ENUM(x) #x

static const char* const s_statusNames[] = { SISTATUS_LIST };

const char* SiStatusToString(SISTATUS status)
{
    if (status >= 0 && static_cast<size_t>(status) < ARRAYSIZE(s_statusNames))
    {
        return s_statusNames[status];
    }
    return "SISTATUS_UNKNOWN";
}
