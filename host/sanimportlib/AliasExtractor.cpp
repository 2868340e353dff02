/*
+------------------------------------------------------------------------------------+
File        : AliasExtractor.cpp

Description : AliasExtractor implementation

+------------------------------------------------------------------------------------+
*/
#include <algorithm>

#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "AliasExtractor.h"
#include "SanImportUtils.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        const boost::regex s_deviceAlias(
            "^device-alias\\s+name\\s+(\\S+)\\s+pwwn\\s+(\\S+)",
            boost::regex::icase);

        const boost::regex s_singleLineFcalias(
            "^fcalias\\s+name\\s+(\\S+)\\s+vsan\\s+(\\d+)\\s*;\\s*member\\s+pwwn\\s+([0-9a-f:.\\-]+)"
            "(?:\\s+(init|target|both))?",
            boost::regex::icase);

        const boost::regex s_fcaliasHeader(
            "^fcalias\\s+name\\s+(\\S+)(?:\\s+vsan\\s+(\\d+))?\\s*$",
            boost::regex::icase);

        // member pwwn 10:00:00:00:c9:2e:31:6a init
        // pwwn 10:00:00:00:c9:2e:31:6a [HOST1_HBA0]
        const boost::regex s_memberPwwn(
            "^(?:member\\s+)?pwwn\\s+([0-9a-f:.\\-]+)(?:\\s+\\[[^\\]]*\\])?(?:\\s+(init|target|both))?\\s*$",
            boost::regex::icase);

        const boost::regex s_otherMember("^member\\s+\\S+", boost::regex::icase);

        const boost::regex s_zoneHeader("^zone(?:set)?\\s+name\\s", boost::regex::icase);

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

        boost::optional<AliasRole> ToRoleTag(const boost::ssub_match& match)
        {
            boost::optional<AliasRole> tag;
            AliasRole role;
            if (match.matched && ParseAliasRole(match.str(), role))
            {
                tag = role;
            }
            return tag;
        }

        size_t Indentation(const std::string& line)
        {
            size_t indent = line.find_first_not_of(" \t");
            return (std::string::npos == indent) ? line.size() : indent;
        }
    }

    AliasCandidate AliasExtractor::MakeCandidate(size_t originLine,
        const std::string& sourceName,
        const std::string& name,
        const std::string& wwpn,
        AliasSyntax syntax,
        const boost::optional<int>& vsan,
        const boost::optional<AliasRole>& tag) const
    {
        AliasCandidate candidate;
        candidate.OriginLine = originLine;
        candidate.SourceName = sourceName;
        candidate.Name = name;
        candidate.Wwpn = wwpn;
        candidate.FabricId = m_fabricId;
        candidate.Vsan = vsan;
        candidate.Create = m_defaults.Create;
        candidate.IncludeInZoning = m_defaults.IncludeInZoning;

        switch (m_defaults.SyntaxOverride)
        {
        case SYNTAX_OVERRIDE_DEVICE_ALIAS:
            candidate.Syntax = SYNTAX_DEVICE_ALIAS;
            break;
        case SYNTAX_OVERRIDE_FCALIAS:
            candidate.Syntax = SYNTAX_FCALIAS;
            break;
        default:
            candidate.Syntax = syntax;
            break;
        }

        if (tag)
        {
            candidate.Role = *tag;
            candidate.ClassificationNote = ClassificationNotes::RoleTagFromSource;
        }
        else
        {
            switch (m_defaults.Role)
            {
            case ROLE_MODE_TARGET:
                candidate.Role = ROLE_TARGET;
                break;
            case ROLE_MODE_BOTH:
                candidate.Role = ROLE_BOTH;
                break;
            case ROLE_MODE_SMART:
                candidate.Role = ROLE_PENDING_CLASSIFICATION;
                break;
            default:
                candidate.Role = ROLE_INITIATOR;
                break;
            }
        }

        return candidate;
    }

    void AliasExtractor::EmitFcalias(const FcaliasBlock& block,
        const std::string& sourceName,
        AliasCandidates_t& candidates) const
    {
        if (block.Members.empty())
        {
            DebugPrintf(SI_LOG_DEBUG, "%s: fcalias %s at line %lu has no pwwn members\n",
                FUNCTION_NAME, block.Name.c_str(), block.OriginLine);
            return;
        }

        bool suffixed = (FCALIAS_NAMING_SUFFIXED == m_defaults.MemberNaming) && (block.Members.size() > 1);

        std::vector<FcaliasMember>::const_iterator it = block.Members.begin();
        for (/* empty */; it != block.Members.end(); ++it)
        {
            std::string name = block.Name;
            if (suffixed)
            {
                name += "_" + WwpnSuffix(it->Wwpn);
            }
            candidates.push_back(MakeCandidate(it->OriginLine, sourceName, name, it->Wwpn,
                SYNTAX_FCALIAS, block.Vsan, it->Tag));
        }
    }

    void AliasExtractor::Extract(const SourceLines_t& fragment,
        const std::string& sourceName,
        const boost::optional<int>& ambientVsan,
        AliasCandidates_t& candidates) const
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const size_t firstNew = candidates.size();
        boost::optional<FcaliasBlock> block;
        boost::optional<size_t> zoneIndent;
        std::string wwpn;

        SourceLines_t::const_iterator it = fragment.begin();
        for (/* empty */; it != fragment.end(); ++it)
        {
            const std::string line = boost::algorithm::trim_copy(it->Text);
            const size_t indent = Indentation(it->Text);
            boost::smatch what;

            if (block && block->Inline && indent <= block->Indent)
            {
                EmitFcalias(*block, sourceName, candidates);
                block.reset();
            }

            if (block)
            {
                if (boost::regex_match(line, what, s_memberPwwn))
                {
                    if (NormalizeWwpn(what.str(1), wwpn))
                    {
                        FcaliasMember member;
                        member.OriginLine = it->Number;
                        member.Wwpn = wwpn;
                        member.Tag = ToRoleTag(what[2]);
                        block->Members.push_back(member);
                    }
                    else
                    {
                        DebugPrintf(SI_LOG_DEBUG, "%s: skipping invalid pwwn '%s' at line %lu\n",
                            FUNCTION_NAME, what.str(1).c_str(), it->Number);
                    }
                    continue;
                }

                if (boost::regex_search(line, s_otherMember))
                {
                    continue;
                }

                EmitFcalias(*block, sourceName, candidates);
                block.reset();
            }

            if (boost::regex_search(line, s_zoneHeader))
            {
                zoneIndent = indent;
            }
            else if (boost::regex_search(line, what, s_deviceAlias))
            {
                if (NormalizeWwpn(what.str(2), wwpn))
                {
                    candidates.push_back(MakeCandidate(it->Number, sourceName, what.str(1), wwpn,
                        SYNTAX_DEVICE_ALIAS, boost::optional<int>(), boost::optional<AliasRole>()));
                }
                else
                {
                    DebugPrintf(SI_LOG_DEBUG, "%s: skipping device-alias %s with invalid pwwn at line %lu\n",
                        FUNCTION_NAME, what.str(1).c_str(), it->Number);
                }
            }
            else if (boost::regex_search(line, what, s_singleLineFcalias))
            {
                if (NormalizeWwpn(what.str(3), wwpn))
                {
                    candidates.push_back(MakeCandidate(it->Number, sourceName, what.str(1), wwpn,
                        SYNTAX_FCALIAS, ToVsan(what[2]), ToRoleTag(what[4])));
                }
            }
            else if (boost::regex_match(line, what, s_fcaliasHeader))
            {
                block = FcaliasBlock();
                block->OriginLine = it->Number;
                block->Indent = indent;
                block->Inline = zoneIndent && indent > *zoneIndent;
                if (!block->Inline)
                {
                    zoneIndent.reset();
                }
                block->Name = what.str(1);
                block->Vsan = ToVsan(what[2]);
                if (!block->Vsan)
                {
                    block->Vsan = ambientVsan;
                }
            }
        }

        if (block)
        {
            EmitFcalias(*block, sourceName, candidates);
        }

        if (m_roleResolver && ROLE_MODE_SMART == m_defaults.Role && candidates.size() > firstNew)
        {
            AliasCandidates_t extracted(candidates.begin() + firstNew, candidates.end());
            m_roleResolver->Resolve(extracted);
            std::copy(extracted.begin(), extracted.end(), candidates.begin() + firstNew);
        }

        DebugPrintf(SI_LOG_DEBUG, "%s: %lu aliases from %s\n", FUNCTION_NAME,
            candidates.size() - firstNew, sourceName.c_str());
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }
}
