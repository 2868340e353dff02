/*
+------------------------------------------------------------------------------------+
File        : ZoneExtractor.cpp

Description : ZoneExtractor implementation

+------------------------------------------------------------------------------------+
*/
#include <algorithm>
#include <vector>

#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "ZoneExtractor.h"
#include "SanImportUtils.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        const boost::regex s_zoneset("^zoneset\\s+name\\s+(\\S+)(?:\\s+vsan\\s+(\\d+))?", boost::regex::icase);
        const boost::regex s_zone("^zone\\s+name\\s+(\\S+)(?:\\s+vsan\\s+(\\d+))?", boost::regex::icase);
        const boost::regex s_fcaliasHeader("^fcalias\\s+name\\s+(\\S+)", boost::regex::icase);
        const boost::regex s_peerAttribute("^attribute\\s+peer-zone\\b", boost::regex::icase);

        const boost::regex s_memberByName("^member\\s+(fcalias|device-alias)\\s+(\\S+)", boost::regex::icase);

        const boost::regex s_memberPwwn(
            "^(?:member\\s+)?pwwn\\s+([0-9a-f:.\\-]+)(?:\\s+\\[([^\\]]+)\\])?(?:\\s+(init|target|both))?",
            boost::regex::icase);

        const boost::regex s_fcidStatus("^\\*\\s*fcid\\s+(0x[0-9a-f]+)(.*)$", boost::regex::icase);
        const boost::regex s_bracketGroup("\\[([^\\]]+)\\]");

        const boost::regex s_standaloneDeviceAlias(
            "^(?:member\\s+)?device-alias\\s+(?!(?:database|commit|name|mode|distribute|abort|clear)\\b)"
            "(\\S+)(?:\\s+\\[\\s*pwwn\\s+([^\\]]+)\\])?",
            boost::regex::icase);

        const boost::regex s_otherMember("^member\\s+(\\S+)\\s+(\\S+)", boost::regex::icase);

        size_t Indentation(const std::string& line)
        {
            size_t indent = line.find_first_not_of(" \t");
            return (std::string::npos == indent) ? line.size() : indent;
        }

        boost::optional<int> ToVsan(const boost::ssub_match& match)
        {
            boost::optional<int> vsan;
            if (match.matched)
            {
                try
                {
                    vsan = boost::lexical_cast<int>(match.str());
                }
                catch (const boost::bad_lexical_cast&)
                {
                    DebugPrintf(SI_LOG_WARNING, "ignoring out of range vsan %s\n", match.str().c_str());
                }
            }
            return vsan;
        }

        boost::optional<std::string> ToWwpn(const std::string& raw)
        {
            std::string wwpn;
            if (NormalizeWwpn(raw, wwpn))
                return wwpn;
            return boost::optional<std::string>();
        }
    }

    AliasLookup::AliasLookup(const PersistedAliases_t& persisted, const AliasCandidates_t& batch)
    {
        std::string wwpn;

        PersistedAliases_t::const_iterator persistedIt = persisted.begin();
        for (/* empty */; persistedIt != persisted.end(); ++persistedIt)
        {
            m_persistedByName.insert(std::make_pair(boost::algorithm::to_lower_copy(persistedIt->Name), persistedIt->Id));
            if (NormalizeWwpn(persistedIt->Wwpn, wwpn))
            {
                m_persistedByWwpn.insert(std::make_pair(wwpn, persistedIt->Id));
            }
        }

        AliasCandidates_t::const_iterator batchIt = batch.begin();
        for (/* empty */; batchIt != batch.end(); ++batchIt)
        {
            m_batchByName.insert(std::make_pair(boost::algorithm::to_lower_copy(batchIt->Name), batchIt->Name));
            m_batchByWwpn.insert(std::make_pair(batchIt->Wwpn, batchIt->Name));
        }
    }

    boost::optional<MemberRef> AliasLookup::Resolve(const boost::optional<std::string>& name,
        const boost::optional<std::string>& wwpn) const
    {
        std::map<std::string, SanObjectId>::const_iterator persistedIt;
        std::map<std::string, std::string>::const_iterator batchIt;
        const std::string key = name ? boost::algorithm::to_lower_copy(*name) : std::string();

        if (name && (persistedIt = m_persistedByName.find(key)) != m_persistedByName.end())
            return MemberRef(PersistedMember(persistedIt->second));

        if (wwpn && (persistedIt = m_persistedByWwpn.find(*wwpn)) != m_persistedByWwpn.end())
            return MemberRef(PersistedMember(persistedIt->second));

        if (name && (batchIt = m_batchByName.find(key)) != m_batchByName.end())
            return MemberRef(InBatchMember(batchIt->second));

        if (wwpn && (batchIt = m_batchByWwpn.find(*wwpn)) != m_batchByWwpn.end())
            return MemberRef(InBatchMember(batchIt->second));

        return boost::optional<MemberRef>();
    }

    void ZoneExtractor::AddMember(OpenZone& open,
        const boost::optional<std::string>& name,
        const boost::optional<std::string>& wwpn,
        const std::string& kind,
        const std::string& rawToken,
        size_t originLine,
        const AliasLookup& lookup) const
    {
        boost::optional<MemberRef> member = lookup.Resolve(name, wwpn);
        if (member)
        {
            MemberRefs_t& members = open.Zone.Members;
            if (std::find(members.begin(), members.end(), *member) == members.end())
            {
                members.push_back(*member);
            }
            return;
        }

        UnresolvedMembers_t& unresolved = open.Zone.Unresolved;
        UnresolvedMembers_t::const_iterator it = unresolved.begin();
        for (/* empty */; it != unresolved.end(); ++it)
        {
            if (it->Kind == kind && it->RawToken == rawToken)
                return;
        }

        DebugPrintf(SI_LOG_DEBUG, "%s: zone %s member %s %s at line %lu is unresolved\n",
            FUNCTION_NAME, open.Zone.Name.c_str(), kind.c_str(), rawToken.c_str(), originLine);
        unresolved.push_back(UnresolvedMember(kind, rawToken, originLine));
    }

    void ZoneExtractor::CloseZone(boost::optional<OpenZone>& open, ZoneCandidates_t& zones) const
    {
        if (!open)
        {
            return;
        }

        ZoneCandidate& zone = open->Zone;
        switch (m_defaults.TypeMode)
        {
        case ZONE_TYPE_MODE_STANDARD:
            zone.Type = ZONE_TYPE_STANDARD;
            break;
        case ZONE_TYPE_MODE_SMART:
            zone.Type = ZONE_TYPE_SMART;
            break;
        case ZONE_TYPE_MODE_PEER:
            zone.Type = ZONE_TYPE_PEER;
            break;
        default:
            zone.Type = (open->RoleTagged || open->PeerAttribute) ? ZONE_TYPE_PEER : ZONE_TYPE_STANDARD;
            break;
        }

        zones.push_back(zone);
        open.reset();
    }

    void ZoneExtractor::Extract(const SourceLines_t& fragment,
        const std::string& sourceName,
        const boost::optional<int>& ambientVsan,
        const AliasLookup& lookup,
        ZoneCandidates_t& zones) const
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const size_t firstNew = zones.size();
        boost::optional<int> vsan = ambientVsan;
        boost::optional<OpenZone> open;

        SourceLines_t::const_iterator it = fragment.begin();
        for (/* empty */; it != fragment.end(); ++it)
        {
            const std::string line = boost::algorithm::trim_copy(it->Text);
            const size_t indent = Indentation(it->Text);
            boost::smatch what;

            if (boost::regex_search(line, what, s_zoneset))
            {
                CloseZone(open, zones);
                boost::optional<int> zonesetVsan = ToVsan(what[2]);
                if (zonesetVsan)
                {
                    vsan = zonesetVsan;
                }
                continue;
            }

            if (boost::regex_search(line, what, s_zone))
            {
                CloseZone(open, zones);
                open = OpenZone();
                open->Indent = indent;
                open->Zone.OriginLine = it->Number;
                open->Zone.SourceName = sourceName;
                open->Zone.Name = what.str(1);
                open->Zone.FabricId = m_fabricId;
                open->Zone.Vsan = ToVsan(what[2]);
                if (!open->Zone.Vsan)
                {
                    open->Zone.Vsan = vsan;
                }
                open->Zone.Create = m_defaults.Create;
                open->Zone.Exists = m_defaults.Exists;
                continue;
            }

            if (!open || line.empty())
            {
                continue;
            }

            if (open->InlineFcaliasIndent)
            {
                if (indent > *open->InlineFcaliasIndent)
                {
                    // pwwn lines of an fcalias expanded under the zone
                    continue;
                }
                open->InlineFcaliasIndent.reset();
            }

            if (boost::regex_search(line, what, s_fcaliasHeader))
            {
                if (indent > open->Indent)
                {
                    AddMember(*open, what.str(1), boost::optional<std::string>(),
                        UnresolvedKind::Fcalias, what.str(1), it->Number, lookup);
                    open->InlineFcaliasIndent = indent;
                }
                else
                {
                    // an fcalias definition ends the zone block
                    CloseZone(open, zones);
                }
                continue;
            }

            if (boost::regex_search(line, s_peerAttribute))
            {
                open->PeerAttribute = true;
            }
            else if (boost::regex_search(line, what, s_memberByName))
            {
                std::string kind = boost::algorithm::to_lower_copy(what.str(1));
                AddMember(*open, what.str(2), boost::optional<std::string>(), kind, what.str(2), it->Number, lookup);
            }
            else if (boost::regex_search(line, what, s_memberPwwn))
            {
                boost::optional<std::string> wwpn = ToWwpn(what.str(1));
                boost::optional<std::string> name;
                if (what[2].matched)
                {
                    name = boost::algorithm::trim_copy(what.str(2));
                }
                if (what[3].matched)
                {
                    open->RoleTagged = true;
                }

                AddMember(*open, name, wwpn, UnresolvedKind::Pwwn, what.str(1), it->Number, lookup);
            }
            else if (boost::regex_search(line, what, s_fcidStatus))
            {
                boost::optional<std::string> name, wwpn;
                const std::string fcid = what.str(1);
                const std::string rest = what.str(2);

                boost::sregex_iterator groupIt(rest.begin(), rest.end(), s_bracketGroup);
                boost::sregex_iterator groupEnd;
                for (/* empty */; groupIt != groupEnd; ++groupIt)
                {
                    std::string group = boost::algorithm::trim_copy((*groupIt).str(1));
                    std::vector<std::string> tokens;
                    boost::algorithm::split(tokens, group, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
                    if (tokens.size() == 2 && boost::algorithm::iequals(tokens[0], "pwwn"))
                    {
                        wwpn = ToWwpn(tokens[1]);
                    }
                    else if (tokens.size() == 2 && boost::algorithm::iequals(tokens[0], "device-alias"))
                    {
                        name = tokens[1];
                    }
                    else if (tokens.size() == 1 && !tokens[0].empty())
                    {
                        name = tokens[0];
                    }
                }

                AddMember(*open, name, wwpn, UnresolvedKind::Fcid, name ? *name : fcid, it->Number, lookup);
            }
            else if (boost::regex_search(line, what, s_standaloneDeviceAlias))
            {
                boost::optional<std::string> wwpn;
                if (what[2].matched)
                {
                    wwpn = ToWwpn(what.str(2));
                }
                AddMember(*open, what.str(1), wwpn, UnresolvedKind::DeviceAlias, what.str(1), it->Number, lookup);
            }
            else if (boost::regex_search(line, what, s_otherMember))
            {
                std::string kind = boost::algorithm::to_lower_copy(what.str(1));
                AddMember(*open, boost::optional<std::string>(), boost::optional<std::string>(),
                    kind, what.str(2), it->Number, lookup);
            }
        }

        CloseZone(open, zones);

        DebugPrintf(SI_LOG_DEBUG, "%s: %lu zones from %s\n", FUNCTION_NAME, zones.size() - firstNew, sourceName.c_str());
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }
}
