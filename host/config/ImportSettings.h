/*
+------------------------------------------------------------------------------------+
File        : ImportSettings.h

Description : ini file settings of the SanImport command line.

+------------------------------------------------------------------------------------+
*/
#ifndef IMPORT_SETTINGS_H
#define IMPORT_SETTINGS_H

#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/property_tree/ptree.hpp>

#include "SanImportContracts.h"
#include "SanRestClient.h"
#include "RetryPolicy.h"
#include "SanImportConstants.h"

namespace SanImportLib
{
    /// \brief import settings are read from an ini file, every key has a default
    ///
    /// invalid values throw ErrorException naming the offending key
    class ImportSettings
    {
    public:
        ImportSettings();

        explicit ImportSettings(const std::string& file);

        /// \brief applies the keys present in pt over the current values
        void Load(const boost::property_tree::ptree& pt);

        /// \brief command line overrides, same value syntax as the ini keys
        void SetRoleMode(const std::string& value);
        void SetAliasSyntax(const std::string& value);
        void SetConflictPolicy(const std::string& value);
        void SetZoneTypeMode(const std::string& value);

        /// \brief [import] section params
        /// \brief create, include_in_zoning, role mode, syntax override, conflict policy, fcalias naming
        AliasDefaults m_AliasDefaults;

        /// \brief zone create, exists and type mode
        ZoneDefaults m_ZoneDefaults;

        /// \brief [format] section params
        /// \brief text larger than this is a tech-support dump
        size_t m_DumpSizeThresholdBytes;

        /// \brief shortest line of '-', '=' or '*' that closes a dump section
        size_t m_DividerMinLength;

        /// \brief [backend] section params
        SanRestClientSettings m_Backend;

        /// \brief [retry] section params
        /// \brief post-submission alias refresh
        RetryPolicy m_RefreshPolicy;

        /// \brief resubmission after lock contention
        RetryPolicy m_LockRetryPolicy;

        /// \brief [classifier] section params
        /// \brief "backend" or "file"
        std::string m_ClassifierMode;

        /// \brief prefix table used in file mode
        std::string m_PrefixFile;

        unsigned int m_ClassifierThreads;

        /// \brief [log] section params
        /// \brief log file, stderr when empty
        std::string m_LogPath;

        std::string m_LogLevel;

        /// \brief the log file is truncated once it grows past this size
        uint32_t m_LogMaxSizeBytes;

    private:
        std::string m_SettingsFilePath;
    };

    typedef boost::shared_ptr<ImportSettings> ImportSettingsPtr;
}

#endif
