/*
+------------------------------------------------------------------------------------+
File        : WwpnPrefixClassifier.cpp

Description : WwpnPrefixClassifier implementation

+------------------------------------------------------------------------------------+
*/
#include <ctype.h>
#include <fstream>
#include <sstream>

#include <boost/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include "WwpnPrefixClassifier.h"
#include "SanImportUtils.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        const char PREFIX_SECTION[] = "prefixes";
        const size_t PREFIX_LENGTH = 4;

        bool IsHexPrefix(const std::string& prefix)
        {
            if (PREFIX_LENGTH != prefix.size())
                return false;

            std::string::const_iterator it = prefix.begin();
            for (/* empty */; it != prefix.end(); ++it)
            {
                if (!isxdigit(static_cast<unsigned char>(*it)))
                    return false;
            }
            return true;
        }
    }

    bool WwpnPrefixClassifier::AddRule(const std::string& prefix, const std::string& wwpnType, const std::string& vendor)
    {
        std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(prefix));
        AliasRole role;
        if (!IsHexPrefix(key) || !ParseAliasRole(wwpnType, role))
        {
            DebugPrintf(SI_LOG_WARNING, "%s: ignoring prefix rule '%s' -> '%s'\n", FUNCTION_NAME,
                prefix.c_str(), wwpnType.c_str());
            return false;
        }

        m_rules[key] = WwpnPrefixRule(role, vendor);
        return true;
    }

    void WwpnPrefixClassifier::AddJsonRule(const boost::property_tree::ptree& item)
    {
        AddRule(item.get("prefix", std::string()),
            item.get("wwpn_type", std::string()),
            item.get("vendor", std::string()));
    }

    SISTATUS WwpnPrefixClassifier::LoadFromJson(const std::string& json)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        boost::property_tree::ptree pt;
        std::string errMsg;
        if (!ReadJson(json, pt, errMsg))
        {
            DebugPrintf(SI_LOG_ERROR, "%s: invalid prefix table: %s\n", FUNCTION_NAME, errMsg.c_str());
            return SIE_INVALID_FORMAT;
        }

        boost::optional<boost::property_tree::ptree&> results = pt.get_child_optional(SanRestJson::Results);
        const boost::property_tree::ptree& items = results ? *results : pt;
        BOOST_FOREACH(const boost::property_tree::ptree::value_type& item, items)
        {
            AddJsonRule(item.second);
        }

        DebugPrintf(SI_LOG_INFO, "%s: %lu prefix rules loaded\n", FUNCTION_NAME, m_rules.size());
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return SIS_OK;
    }

    SISTATUS WwpnPrefixClassifier::LoadFromFile(const std::string& path)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        boost::system::error_code ec;
        if (!boost::filesystem::exists(path, ec))
        {
            DebugPrintf(SI_LOG_ERROR, "%s: prefix file %s does not exist\n", FUNCTION_NAME, path.c_str());
            return SIE_FILE_NOT_FOUND;
        }

        if (boost::algorithm::iequals(boost::filesystem::path(path).extension().string(), ".ini"))
        {
            boost::property_tree::ptree pt;
            try
            {
                boost::property_tree::ini_parser::read_ini(path, pt);
            }
            catch (const boost::property_tree::ini_parser_error& e)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: failed to read %s: %s\n", FUNCTION_NAME, path.c_str(), e.what());
                return SIE_INVALID_FORMAT;
            }

            boost::optional<boost::property_tree::ptree&> section = pt.get_child_optional(PREFIX_SECTION);
            if (section)
            {
                BOOST_FOREACH(const boost::property_tree::ptree::value_type& rule, *section)
                {
                    std::vector<std::string> fields;
                    boost::algorithm::split(fields, rule.second.data(), boost::algorithm::is_any_of(","));
                    AddRule(rule.first, fields[0], fields.size() > 1 ? boost::algorithm::trim_copy(fields[1]) : std::string());
                }
            }

            DebugPrintf(SI_LOG_INFO, "%s: %lu prefix rules loaded from %s\n", FUNCTION_NAME, m_rules.size(), path.c_str());
            DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
            return SIS_OK;
        }

        std::ifstream file(path.c_str());
        if (!file)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: failed to open %s\n", FUNCTION_NAME, path.c_str());
            return SIE_FILE_NOT_FOUND;
        }

        std::stringstream contents;
        contents << file.rdbuf();

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return LoadFromJson(contents.str());
    }

    SISTATUS WwpnPrefixClassifier::LoadFromService(SanRestClient& client)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        SISTATUS status = client.GetAllPages(SanRestEndpoints::WwpnPrefixes,
            boost::bind(&WwpnPrefixClassifier::AddJsonRule, this, _1));

        DebugPrintf(SI_LOG_INFO, "%s: %lu prefix rules loaded, %s\n", FUNCTION_NAME, m_rules.size(),
            SiStatusToString(status));
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS WwpnPrefixClassifier::Classify(const std::string& wwpn, AliasRole& role)
    {
        std::string normalized;
        if (!NormalizeWwpn(wwpn, normalized))
        {
            return SIE_INVALIDARG;
        }

        std::map<std::string, WwpnPrefixRule>::const_iterator found = m_rules.find(WwpnPrefix(normalized));
        if (found == m_rules.end())
        {
            return SIS_FALSE;
        }

        role = found->second.Role;
        return SIS_OK;
    }
}
