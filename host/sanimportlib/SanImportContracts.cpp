/*
+------------------------------------------------------------------------------------+
File        : SanImportContracts.cpp

Description : String conversions and DTO serialization for the SanImport contracts.

+------------------------------------------------------------------------------------+
*/
#include <boost/algorithm/string.hpp>

#include "SanImportContracts.h"

namespace SanImportLib
{
    const char* SourceFormatToString(SourceFormat format)
    {
        switch (format)
        {
        case FORMAT_TECH_SUPPORT_DUMP:
            return "TechSupportDump";
        case FORMAT_ZONE_EXPORT:
            return "ZoneExport";
        case FORMAT_ALIAS_EXPORT:
            return "AliasExport";
        default:
            return "Unknown";
        }
    }

    const char* AliasRoleToString(AliasRole role)
    {
        switch (role)
        {
        case ROLE_INITIATOR:
            return "init";
        case ROLE_TARGET:
            return "target";
        case ROLE_BOTH:
            return "both";
        default:
            return "pending";
        }
    }

    const char* AliasSyntaxToString(AliasSyntax syntax)
    {
        return (SYNTAX_FCALIAS == syntax) ? "fcalias" : "device-alias";
    }

    const char* ZoneTypeToString(ZoneType zoneType)
    {
        switch (zoneType)
        {
        case ZONE_TYPE_SMART:
            return "smart";
        case ZONE_TYPE_PEER:
            return "peer";
        default:
            return "standard";
        }
    }

    bool ParseAliasRole(const std::string& value, AliasRole& role)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "init" || lowered == "initiator")
            role = ROLE_INITIATOR;
        else if (lowered == "target")
            role = ROLE_TARGET;
        else if (lowered == "both")
            role = ROLE_BOTH;
        else
            return false;
        return true;
    }

    bool ParseRoleMode(const std::string& value, RoleMode& mode)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "smart")
        {
            mode = ROLE_MODE_SMART;
            return true;
        }

        AliasRole role;
        if (!ParseAliasRole(lowered, role))
            return false;

        mode = (ROLE_TARGET == role) ? ROLE_MODE_TARGET :
            (ROLE_BOTH == role) ? ROLE_MODE_BOTH : ROLE_MODE_INITIATOR;
        return true;
    }

    bool ParseAliasSyntaxOverride(const std::string& value, AliasSyntaxOverride& syntaxOverride)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "original")
            syntaxOverride = SYNTAX_OVERRIDE_ORIGINAL;
        else if (lowered == "device-alias")
            syntaxOverride = SYNTAX_OVERRIDE_DEVICE_ALIAS;
        else if (lowered == "fcalias")
            syntaxOverride = SYNTAX_OVERRIDE_FCALIAS;
        else
            return false;
        return true;
    }

    bool ParseConflictPolicy(const std::string& value, ConflictPolicy& policy)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "prefer-device-alias" || lowered == "device-alias")
            policy = CONFLICT_PREFER_DEVICE_ALIAS;
        else if (lowered == "prefer-fcalias" || lowered == "fcalias")
            policy = CONFLICT_PREFER_FCALIAS;
        else
            return false;
        return true;
    }

    bool ParseFcaliasMemberNaming(const std::string& value, FcaliasMemberNaming& naming)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "shared")
            naming = FCALIAS_NAMING_SHARED;
        else if (lowered == "suffixed")
            naming = FCALIAS_NAMING_SUFFIXED;
        else
            return false;
        return true;
    }

    bool ParseZoneTypeMode(const std::string& value, ZoneTypeMode& mode)
    {
        std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
        if (lowered == "detect")
            mode = ZONE_TYPE_MODE_DETECT;
        else if (lowered == "standard")
            mode = ZONE_TYPE_MODE_STANDARD;
        else if (lowered == "smart")
            mode = ZONE_TYPE_MODE_SMART;
        else if (lowered == "peer")
            mode = ZONE_TYPE_MODE_PEER;
        else
            return false;
        return true;
    }

    AliasDto::AliasDto(const AliasCandidate& candidate)
        : Name(candidate.Name),
        Wwpn(candidate.Wwpn),
        Use(AliasRoleToString(ROLE_PENDING_CLASSIFICATION == candidate.Role ? ROLE_INITIATOR : candidate.Role)),
        CiscoAlias(AliasSyntaxToString(candidate.Syntax)),
        FabricId(candidate.FabricId),
        Create(candidate.Create),
        IncludeInZoning(candidate.IncludeInZoning)
    {
    }

    void AliasDto::serialize(boost::property_tree::ptree& node) const
    {
        node.put("name", Name);
        node.put("wwpn", Wwpn);
        node.put("use", Use);
        node.put("cisco_alias", CiscoAlias);
        node.put("fabric", FabricId);
        node.put("create", Create);
        node.put("include_in_zoning", IncludeInZoning);
    }

    ZoneDto::ZoneDto(const ZoneCandidate& candidate, const std::vector<SanObjectId>& members)
        : Name(candidate.Name),
        FabricId(candidate.FabricId),
        Vsan(candidate.Vsan),
        ZoneType(ZoneTypeToString(candidate.Type)),
        Create(candidate.Create),
        Exists(candidate.Exists),
        Members(members)
    {
    }

    void ZoneDto::serialize(boost::property_tree::ptree& node) const
    {
        node.put("name", Name);
        node.put("fabric", FabricId);
        if (Vsan)
        {
            node.put("vsan", *Vsan);
        }
        node.put("zone_type", ZoneType);
        node.put("create", Create);
        node.put("exists", Exists);

        boost::property_tree::ptree members;
        std::vector<SanObjectId>::const_iterator it = Members.begin();
        for (/* empty */; it != Members.end(); ++it)
        {
            boost::property_tree::ptree member;
            member.put_value(*it);
            members.push_back(std::make_pair(std::string(), member));
        }
        node.add_child("members", members);
    }
}
