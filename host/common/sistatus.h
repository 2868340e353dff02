//
// @file sistatus.h
// Defines the status codes returned by the SanImport libraries.
// Included in different ways to define error codes & error code functions.
//
// SISTATUS_LIST is       a list of char* literals if SISTATUS_GET_STRINGS is defined.
//                        a list of enum constants otherwise. Creates enum SISTATUS.
//
#ifndef SISTATUS__H
#define SISTATUS__H

#undef SISTATUS_ENUM
#ifdef SISTATUS_GET_STRINGS
#define SISTATUS_ENUM(x) #x
#else
#define SISTATUS_ENUM(x) x
#endif

/* N.B. SIS_* denotes successful returns
 *      SIE_* denotes failures
 */
#define SISTATUS_LIST \
    SISTATUS_ENUM( SIS_OK ), \
    SISTATUS_ENUM( SIS_FALSE ), \
    SISTATUS_ENUM( SIE_INVALIDARG ), \
    SISTATUS_ENUM( SIE_FAIL ), \
    SISTATUS_ENUM( SIE_INVALID_FORMAT ), \
    SISTATUS_ENUM( SIE_NOTIMPL ), \
    SISTATUS_ENUM( SIE_ABORT ), \
    SISTATUS_ENUM( SIE_FILE_NOT_FOUND ), \
    SISTATUS_ENUM( SIE_HTTP_RESPONSE_FAILED ), \
    SISTATUS_ENUM( SIE_RESOURCE_LOCKED ), \
    SISTATUS_ENUM( SIE_BUSY ), \
    SISTATUS_ENUM( SIE_PARTIAL_FAILURE )

#ifndef SISTATUS_GET_STRINGS
enum SISTATUS { SISTATUS_LIST };

/// \brief returns the enumerator name, "SISTATUS_UNKNOWN" for out of range values
const char* SiStatusToString(SISTATUS status);

/// \brief true for SIS_* codes
inline bool SiSucceeded(SISTATUS status)
{
    return status == SIS_OK || status == SIS_FALSE;
}
#endif

#endif // SISTATUS__H
