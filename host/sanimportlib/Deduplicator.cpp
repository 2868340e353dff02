/*
+------------------------------------------------------------------------------------+
File        : Deduplicator.cpp

Description : Deduplicator implementation

+------------------------------------------------------------------------------------+
*/
#include <map>
#include <set>
#include <vector>

#include "Deduplicator.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    void Deduplicator::DeduplicateAliases(AliasCandidates_t& candidates)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const AliasSyntax preferred =
            (CONFLICT_PREFER_FCALIAS == m_policy) ? SYNTAX_FCALIAS : SYNTAX_DEVICE_ALIAS;
        const AliasSyntax other =
            (SYNTAX_FCALIAS == preferred) ? SYNTAX_DEVICE_ALIAS : SYNTAX_FCALIAS;

        // group indexes by WWPN in first-seen order
        std::map<std::string, size_t> groupByWwpn;
        std::vector<std::vector<size_t> > groups;
        for (size_t i = 0; i < candidates.size(); i++)
        {
            std::map<std::string, size_t>::const_iterator found = groupByWwpn.find(candidates[i].Wwpn);
            if (found == groupByWwpn.end())
            {
                groupByWwpn.insert(std::make_pair(candidates[i].Wwpn, groups.size()));
                groups.push_back(std::vector<size_t>(1, i));
            }
            else
            {
                groups[found->second].push_back(i);
            }
        }

        AliasCandidates_t kept;
        kept.reserve(groups.size());

        std::vector<std::vector<size_t> >::const_iterator groupIt = groups.begin();
        for (/* empty */; groupIt != groups.end(); ++groupIt)
        {
            const std::vector<size_t>& group = *groupIt;
            size_t winner = group.front();
            bool conflict = false;

            std::vector<size_t>::const_iterator memberIt = group.begin();
            for (/* empty */; memberIt != group.end(); ++memberIt)
            {
                if (candidates[*memberIt].Syntax != candidates[winner].Syntax)
                {
                    conflict = true;
                    break;
                }
            }

            if (conflict)
            {
                for (memberIt = group.begin(); memberIt != group.end(); ++memberIt)
                {
                    if (candidates[*memberIt].Syntax == preferred)
                    {
                        winner = *memberIt;
                        break;
                    }
                }

                AliasCandidate resolved = candidates[winner];
                std::string note = ClassificationNotes::ConflictResolved +
                    AliasSyntaxToString(preferred) + " over " + AliasSyntaxToString(other);
                resolved.ClassificationNote = resolved.ClassificationNote ?
                    *resolved.ClassificationNote + "; " + note : note;

                DebugPrintf(SI_LOG_INFO, "%s: wwpn %s declared as %s and %s, kept %s (line %lu)\n",
                    FUNCTION_NAME, resolved.Wwpn.c_str(), AliasSyntaxToString(preferred),
                    AliasSyntaxToString(other), resolved.Name.c_str(), resolved.OriginLine);

                kept.push_back(resolved);
                m_stats.ConflictsResolved++;
                m_stats.DuplicateAliasesRemoved += group.size() - 1;
            }
            else
            {
                kept.push_back(candidates[winner]);
                m_stats.DuplicateAliasesRemoved += group.size() - 1;
            }
        }

        DebugPrintf(SI_LOG_DEBUG, "%s: %lu aliases reduced to %lu\n", FUNCTION_NAME,
            candidates.size(), kept.size());
        candidates.swap(kept);

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }

    void Deduplicator::DeduplicateZones(ZoneCandidates_t& zones)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::set<std::pair<std::string, SanObjectId> > seen;
        ZoneCandidates_t kept;
        kept.reserve(zones.size());

        ZoneCandidates_t::const_iterator it = zones.begin();
        for (/* empty */; it != zones.end(); ++it)
        {
            if (seen.insert(std::make_pair(it->Name, it->FabricId)).second)
            {
                kept.push_back(*it);
            }
            else
            {
                DebugPrintf(SI_LOG_DEBUG, "%s: dropping repeated zone %s from line %lu of %s\n",
                    FUNCTION_NAME, it->Name.c_str(), it->OriginLine, it->SourceName.c_str());
                m_stats.DuplicateZonesRemoved++;
            }
        }

        zones.swap(kept);

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }
}
