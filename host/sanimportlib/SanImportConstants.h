/*
+------------------------------------------------------------------------------------+
File        : SanImportConstants.h

Description : Constants used across the SanImport library.

+------------------------------------------------------------------------------------+
*/
#ifndef _SAN_IMPORT_CONSTANTS_H
#define _SAN_IMPORT_CONSTANTS_H

#include <string>

namespace SanImportLib
{
    /// \brief text larger than this is always treated as a tech-support dump
    const size_t DEFAULT_DUMP_SIZE_THRESHOLD = 1024 * 1024;

    /// \brief a line of at least this many '-', '=' or '*' closes a dump section
    const size_t DEFAULT_DIVIDER_MIN_LENGTH = 40;

    /// \brief consecutive blank lines that close a device-alias section
    const size_t DEVICE_ALIAS_SECTION_MAX_BLANK_LINES = 3;

    namespace ClassificationNotes
    {
        const std::string SmartDetected("Smart detected: ");
        const std::string NoRuleFound("No prefix rule found - defaulted to init");
        const std::string ClassificationFailed("Classification failed (");
        const std::string DefaultedToInit(") - defaulted to init");
        const std::string NoClassifier("No classifier available - defaulted to init");
        const std::string RoleTagFromSource("Role tag from source");
        const std::string ConflictResolved("Conflict resolved: kept ");
    }

    namespace UnresolvedKind
    {
        const std::string Pwwn("pwwn");
        const std::string DeviceAlias("device-alias");
        const std::string Fcalias("fcalias");
        const std::string Fcid("fcid");
        const std::string BatchAlias("batch-alias");
    }

    namespace SanRestEndpoints
    {
        const std::string AliasesByFabric("/api/san/aliases/fabric/");
        const std::string ZonesByFabric("/api/san/zones/fabric/");
        const std::string SaveAliases("/api/san/aliases/save/");
        const std::string SaveZones("/api/san/zones/save/");
        const std::string WwpnPrefixes("/api/san/wwpn-prefixes/");
    }

    namespace SanRestJson
    {
        const std::string ContentType("application/json");
        const std::string Results("results");
        const std::string Next("next");
        const std::string Errors("errors");
        const std::string Id("id");
        const std::string Name("name");
        const std::string Wwpn("wwpn");
        const std::string Fabric("fabric");
        const std::string Error("error");
        const std::string Message("message");
        const std::string Created("created");
        const std::string ProjectId("project_id");
        const std::string Aliases("aliases");
        const std::string Zones("zones");
    }

    /// \brief substrings of backend responses that indicate lock contention
    const char* const LockContentionMarkers[] = { "database is locked", "deadlock", "resource is locked" };

    /// \brief substrings of per-item errors that indicate the item already exists
    const char* const DuplicateMarkers[] = { "already exists", "duplicate", "unique" };
}

#endif
