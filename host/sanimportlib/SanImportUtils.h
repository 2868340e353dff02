/*
+------------------------------------------------------------------------------------+
File        : SanImportUtils.h

Description : Text, WWPN and JSON helpers shared by the SanImport modules.

+------------------------------------------------------------------------------------+
*/
#ifndef _SAN_IMPORT_UTILS_H
#define _SAN_IMPORT_UTILS_H

#include <string>

#include <boost/property_tree/ptree.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "SanImportContracts.h"

namespace SanImportLib
{
    /// \brief splits text on \n, dropping a trailing \r, numbering lines from 1
    SourceLines_t SplitLines(const std::string& text);

    /// \brief canonical form of a WWPN: 16 lowercase hex digits grouped in pairs with ':'
    ///
    /// any non-hex character is treated as a delimiter, so "50-05-07-63-0A-03-17-E4",
    /// "500507630a0317e4" and "50:05:07:63:0a:03:17:e4" all normalize the same way
    /// \returns false when the input does not carry exactly 16 hex digits
    bool NormalizeWwpn(const std::string& raw, std::string& normalized);

    /// \brief first four hex digits of a normalized WWPN, used for vendor prefix lookups
    std::string WwpnPrefix(const std::string& normalized);

    /// \brief last four hex digits of a normalized WWPN
    std::string WwpnSuffix(const std::string& normalized);

    /// \brief case-insensitive search for any of the markers
    template <size_t N>
    bool ContainsAnyMarker(const std::string& text, const char* const (&markers)[N])
    {
        for (size_t i = 0; i < N; i++)
        {
            if (boost::algorithm::icontains(text, markers[i]))
                return true;
        }
        return false;
    }

    /// \brief compact JSON with numeric and boolean values for the listed keys unquoted
    ///
    /// property_tree writes every value as a string, the persistence service expects
    /// typed values for ids and flags
    std::string WriteTypedJson(const boost::property_tree::ptree& pt);

    /// \brief reads a JSON document, returns false on a parse error
    bool ReadJson(const std::string& json, boost::property_tree::ptree& pt, std::string& errMsg);
}

#endif
