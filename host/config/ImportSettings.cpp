/*
+------------------------------------------------------------------------------------+
File        : ImportSettings.cpp

Description : ImportSettings class implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include "ImportSettings.h"
#include "errorexception.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        template <typename ENUM_TYPE>
        void ParseOrThrow(const std::string& key,
            const std::string& value,
            bool (*parse)(const std::string&, ENUM_TYPE&),
            ENUM_TYPE& result)
        {
            if (!parse(value, result))
            {
                throw ERROR_EXCEPTION << "invalid value '" << value << "' for " << key;
            }
        }

        template <typename VALUE_TYPE>
        VALUE_TYPE GetOrThrow(const boost::property_tree::ptree& pt, const std::string& key, VALUE_TYPE defaultValue)
        {
            if (!pt.get_optional<std::string>(key))
            {
                return defaultValue;
            }

            try
            {
                return pt.get<VALUE_TYPE>(key);
            }
            catch (const boost::property_tree::ptree_bad_data& e)
            {
                throw ERROR_EXCEPTION << "invalid value for " << key << ": " << e.what();
            }
        }
    }

    ImportSettings::ImportSettings()
        : m_DumpSizeThresholdBytes(DEFAULT_DUMP_SIZE_THRESHOLD),
        m_DividerMinLength(DEFAULT_DIVIDER_MIN_LENGTH),
        m_RefreshPolicy(5, 1000, 10000),
        m_LockRetryPolicy(3, 500, 4000),
        m_ClassifierMode("backend"),
        m_ClassifierThreads(1),
        m_LogLevel("INFO"),
        m_LogMaxSizeBytes(LOG_DEFAULT_MAX_SIZE_IN_BYTES)
    {
    }

    ImportSettings::ImportSettings(const std::string& file)
        : m_DumpSizeThresholdBytes(DEFAULT_DUMP_SIZE_THRESHOLD),
        m_DividerMinLength(DEFAULT_DIVIDER_MIN_LENGTH),
        m_RefreshPolicy(5, 1000, 10000),
        m_LockRetryPolicy(3, 500, 4000),
        m_ClassifierMode("backend"),
        m_ClassifierThreads(1),
        m_LogLevel("INFO"),
        m_LogMaxSizeBytes(LOG_DEFAULT_MAX_SIZE_IN_BYTES),
        m_SettingsFilePath(file)
    {
        namespace bpt = boost::property_tree;
        bpt::ptree pt;
        try
        {
            bpt::ini_parser::read_ini(m_SettingsFilePath, pt);
        }
        catch (const bpt::ini_parser_error& e)
        {
            throw ERROR_EXCEPTION << "failed to read settings " << m_SettingsFilePath << ": " << e.what();
        }

        Load(pt);
    }

    void ImportSettings::Load(const boost::property_tree::ptree& pt)
    {
        m_AliasDefaults.Create = GetOrThrow(pt, "import.Create", m_AliasDefaults.Create);
        m_AliasDefaults.IncludeInZoning = GetOrThrow(pt, "import.IncludeInZoning", m_AliasDefaults.IncludeInZoning);

        boost::optional<std::string> value = pt.get_optional<std::string>("import.RoleMode");
        if (value)
            SetRoleMode(*value);

        if ((value = pt.get_optional<std::string>("import.AliasSyntax")))
            SetAliasSyntax(*value);

        if ((value = pt.get_optional<std::string>("import.ConflictPolicy")))
            SetConflictPolicy(*value);

        if ((value = pt.get_optional<std::string>("import.FcaliasMemberNaming")))
            ParseOrThrow("import.FcaliasMemberNaming", *value, ParseFcaliasMemberNaming, m_AliasDefaults.MemberNaming);

        m_ZoneDefaults.Create = GetOrThrow(pt, "import.ZoneCreate", m_ZoneDefaults.Create);
        m_ZoneDefaults.Exists = GetOrThrow(pt, "import.ZoneExists", m_ZoneDefaults.Exists);

        if ((value = pt.get_optional<std::string>("import.ZoneTypeMode")))
            SetZoneTypeMode(*value);

        m_DumpSizeThresholdBytes = GetOrThrow(pt, "format.DumpSizeThresholdBytes", m_DumpSizeThresholdBytes);
        m_DividerMinLength = GetOrThrow(pt, "format.DividerMinLength", m_DividerMinLength);

        m_Backend.ServiceUri = GetOrThrow(pt, "backend.ServiceUri", m_Backend.ServiceUri);
        m_Backend.ProjectId = GetOrThrow(pt, "backend.ProjectId", m_Backend.ProjectId);
        m_Backend.TransferTimeout = GetOrThrow(pt, "backend.TransferTimeout", m_Backend.TransferTimeout);
        m_Backend.CaFile = GetOrThrow(pt, "backend.CaFile", m_Backend.CaFile);
        m_Backend.AuthToken = GetOrThrow(pt, "backend.AuthToken", m_Backend.AuthToken);
        m_Backend.ListPageSize = GetOrThrow(pt, "backend.ListPageSize", m_Backend.ListPageSize);

        m_RefreshPolicy.MaxAttempts = GetOrThrow(pt, "retry.RefreshMaxAttempts", m_RefreshPolicy.MaxAttempts);
        m_RefreshPolicy.BaseDelayMs = GetOrThrow(pt, "retry.RefreshBaseDelayMs", m_RefreshPolicy.BaseDelayMs);
        m_RefreshPolicy.MaxDelayMs = GetOrThrow(pt, "retry.RefreshMaxDelayMs", m_RefreshPolicy.MaxDelayMs);
        m_LockRetryPolicy.MaxAttempts = GetOrThrow(pt, "retry.LockRetryAttempts", m_LockRetryPolicy.MaxAttempts);
        m_LockRetryPolicy.BaseDelayMs = GetOrThrow(pt, "retry.LockRetryDelayMs", m_LockRetryPolicy.BaseDelayMs);
        m_LockRetryPolicy.MaxDelayMs = m_LockRetryPolicy.BaseDelayMs * 8;

        if (!m_RefreshPolicy.MaxAttempts || !m_LockRetryPolicy.MaxAttempts)
        {
            throw ERROR_EXCEPTION << "retry attempts must be at least 1";
        }

        m_ClassifierMode = boost::algorithm::to_lower_copy(GetOrThrow(pt, "classifier.Mode", m_ClassifierMode));
        if (m_ClassifierMode != "backend" && m_ClassifierMode != "file")
        {
            throw ERROR_EXCEPTION << "invalid value '" << m_ClassifierMode << "' for classifier.Mode";
        }
        m_PrefixFile = GetOrThrow(pt, "classifier.PrefixFile", m_PrefixFile);
        m_ClassifierThreads = GetOrThrow(pt, "classifier.Threads", m_ClassifierThreads);

        m_LogPath = GetOrThrow(pt, "log.LogPath", m_LogPath);
        m_LogLevel = GetOrThrow(pt, "log.LogLevel", m_LogLevel);
        m_LogMaxSizeBytes = GetOrThrow(pt, "log.LogMaxSizeBytes", m_LogMaxSizeBytes);

        SI_LOG_LEVEL level;
        if (!GetLogLevel(m_LogLevel, level))
        {
            throw ERROR_EXCEPTION << "invalid value '" << m_LogLevel << "' for log.LogLevel";
        }
    }

    void ImportSettings::SetRoleMode(const std::string& value)
    {
        ParseOrThrow("import.RoleMode", value, ParseRoleMode, m_AliasDefaults.Role);
    }

    void ImportSettings::SetAliasSyntax(const std::string& value)
    {
        ParseOrThrow("import.AliasSyntax", value, ParseAliasSyntaxOverride, m_AliasDefaults.SyntaxOverride);
    }

    void ImportSettings::SetConflictPolicy(const std::string& value)
    {
        ParseOrThrow("import.ConflictPolicy", value, ParseConflictPolicy, m_AliasDefaults.Policy);
    }

    void ImportSettings::SetZoneTypeMode(const std::string& value)
    {
        ParseOrThrow("import.ZoneTypeMode", value, ParseZoneTypeMode, m_ZoneDefaults.TypeMode);
    }
}
