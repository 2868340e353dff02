/*
+------------------------------------------------------------------------------------+
File        : SanImportUtils.cpp

Description : Text, WWPN and JSON helpers shared by the SanImport modules.

+------------------------------------------------------------------------------------+
*/
#include <ctype.h>
#include <sstream>

#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "SanImportUtils.h"

namespace SanImportLib
{
    namespace
    {
        const size_t WWPN_HEX_DIGITS = 16;

        const boost::regex s_typedValue(
            "\"(id|fabric|project_id|vsan|create|exists|include_in_zoning|selected|origin_line|"
            "refresh_confirmed|total_aliases|new_aliases|existing_aliases|duplicates_removed|"
            "conflicts_resolved|smart_detected|defaulted_roles|total_zones|new_zones|"
            "duplicate_zones_removed|unresolved_members)\":\\s*\"(-?[0-9]+|true|false)\"");

        // arrays of ids
        const boost::regex s_idArray(
            "\"(members|created|created_alias_ids|created_zone_ids)\":\\s*(\"\"|\\[[^\\]]*\\])");

        // arrays of objects or strings, written as "" by property_tree when empty
        const boost::regex s_emptyArray(
            "\"(aliases|zones|documents|warnings|unresolved|batch_members|skipped_duplicates|"
            "failures|unresolved_after_refresh|errors)\":\\s*\"\"");

        const boost::regex s_quotedNumber("\"(-?[0-9]+)\"");

        struct IdArrayFormatter
        {
            std::string operator()(const boost::smatch& what) const
            {
                std::string ids = what.str(2);
                if (ids == "\"\"")
                {
                    // property_tree writes an empty child as ""
                    return "\"" + what.str(1) + "\":[]";
                }
                return "\"" + what.str(1) + "\":" + boost::regex_replace(ids, s_quotedNumber, "$1");
            }
        };
    }

    SourceLines_t SplitLines(const std::string& text)
    {
        SourceLines_t lines;
        size_t lineNumber = 1;
        std::string::size_type start = 0;

        while (start <= text.size())
        {
            std::string::size_type end = text.find('\n', start);
            if (std::string::npos == end)
            {
                end = text.size();
            }

            std::string line = text.substr(start, end - start);
            if (!line.empty() && '\r' == line[line.size() - 1])
            {
                line.erase(line.size() - 1);
            }

            if (end == text.size() && line.empty() && start == text.size() && start != 0)
            {
                // trailing newline does not open another line
                break;
            }

            lines.push_back(SourceLine(lineNumber++, line));
            start = end + 1;
        }

        return lines;
    }

    bool NormalizeWwpn(const std::string& raw, std::string& normalized)
    {
        std::string digits;
        digits.reserve(WWPN_HEX_DIGITS);

        std::string::const_iterator it = raw.begin();
        for (/* empty */; it != raw.end(); ++it)
        {
            unsigned char ch = static_cast<unsigned char>(*it);
            if (isxdigit(ch))
            {
                digits += static_cast<char>(tolower(ch));
            }
        }

        if (WWPN_HEX_DIGITS != digits.size())
        {
            return false;
        }

        normalized.clear();
        for (size_t i = 0; i < digits.size(); i += 2)
        {
            if (i)
            {
                normalized += ':';
            }
            normalized += digits.substr(i, 2);
        }
        return true;
    }

    std::string WwpnPrefix(const std::string& normalized)
    {
        std::string digits = boost::algorithm::erase_all_copy(normalized, ":");
        return digits.substr(0, 4);
    }

    std::string WwpnSuffix(const std::string& normalized)
    {
        std::string digits = boost::algorithm::erase_all_copy(normalized, ":");
        return (digits.size() > 4) ? digits.substr(digits.size() - 4) : digits;
    }

    std::string WriteTypedJson(const boost::property_tree::ptree& pt)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, pt, false);

        std::string json = boost::regex_replace(stream.str(), s_typedValue, "\"$1\":$2");
        json = boost::regex_replace(json, s_idArray, IdArrayFormatter());
        json = boost::regex_replace(json, s_emptyArray, "\"$1\":[]");
        boost::algorithm::trim_right(json);
        return json;
    }

    bool ReadJson(const std::string& json, boost::property_tree::ptree& pt, std::string& errMsg)
    {
        try
        {
            std::istringstream stream(json);
            boost::property_tree::read_json(stream, pt);
        }
        catch (const boost::property_tree::json_parser_error& e)
        {
            errMsg = e.what();
            return false;
        }
        return true;
    }
}
