/*
+------------------------------------------------------------------------------------+
File        : FormatClassifier.cpp

Description : FormatClassifier implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>

#include "FormatClassifier.h"
#include "SanImportUtils.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        // ----- show device-alias database
        // `show zoneset active vsan 10`
        // MDS-A# show zone
        const boost::regex s_showBanner(
            "^\\s*(?:-+\\s*|`|\\S+#\\s*)show\\s+([^`]+?)`?\\s*-*\\s*$",
            boost::regex::icase);

        const boost::regex s_deviceAliasDatabaseHeader("^\\s*device-alias\\s+database\\s*$",
            boost::regex::icase);

        const boost::regex s_aliasSyntax(
            "^\\s*(?:device-alias\\s+name\\s+\\S+\\s+pwwn\\s+[0-9a-f:.\\-]+|fcalias\\s+name\\s+\\S+)",
            boost::regex::icase);

        const boost::regex s_zoneKeyword("^\\s*zone(?:set)?\\s+name\\s+\\S+", boost::regex::icase);
    }

    bool FormatClassifier::IsShowBanner(const std::string& line, std::string& command)
    {
        boost::smatch what;
        if (!boost::regex_match(line, what, s_showBanner))
        {
            return false;
        }
        command = boost::algorithm::trim_copy(what.str(1));
        return true;
    }

    bool FormatClassifier::HasDumpMarker(const std::string& line)
    {
        std::string command;
        return IsShowBanner(line, command) || boost::regex_match(line, s_deviceAliasDatabaseHeader);
    }

    bool FormatClassifier::IsAliasSyntax(const std::string& line)
    {
        return boost::regex_search(line, s_aliasSyntax);
    }

    bool FormatClassifier::IsZoneKeyword(const std::string& line)
    {
        return boost::regex_search(line, s_zoneKeyword);
    }

    SourceFormat FormatClassifier::Classify(const std::string& text) const
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        if (text.size() > m_dumpSizeThreshold)
        {
            DebugPrintf(SI_LOG_INFO, "%s: %lu bytes exceeds the dump threshold %lu\n",
                FUNCTION_NAME, text.size(), m_dumpSizeThreshold);
            return FORMAT_TECH_SUPPORT_DUMP;
        }

        SourceLines_t lines = SplitLines(text);
        size_t aliasMatches = 0, zoneMatches = 0;

        SourceLines_t::const_iterator it = lines.begin();
        for (/* empty */; it != lines.end(); ++it)
        {
            if (HasDumpMarker(it->Text))
            {
                DebugPrintf(SI_LOG_INFO, "%s: dump marker at line %lu\n", FUNCTION_NAME, it->Number);
                return FORMAT_TECH_SUPPORT_DUMP;
            }

            if (IsZoneKeyword(it->Text))
            {
                zoneMatches++;
            }
            else if (IsAliasSyntax(it->Text))
            {
                aliasMatches++;
            }
        }

        SourceFormat format = FORMAT_UNKNOWN;
        if (zoneMatches)
        {
            format = FORMAT_ZONE_EXPORT;
        }
        else if (aliasMatches)
        {
            format = FORMAT_ALIAS_EXPORT;
        }

        DebugPrintf(SI_LOG_DEBUG, "%s: zone keywords %lu, alias lines %lu, format %s\n",
            FUNCTION_NAME, zoneMatches, aliasMatches, SourceFormatToString(format));
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return format;
    }
}
