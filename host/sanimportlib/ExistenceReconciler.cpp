/*
+------------------------------------------------------------------------------------+
File        : ExistenceReconciler.cpp

Description : ExistenceReconciler implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/algorithm/string.hpp>

#include "ExistenceReconciler.h"
#include "SanImportUtils.h"
#include "logger.h"

namespace SanImportLib
{
    ExistenceReconciler::ExistenceReconciler(const PersistedAliases_t& aliases,
        const boost::optional<PersistedZones_t>& zones)
    {
        std::string wwpn;
        PersistedAliases_t::const_iterator aliasIt = aliases.begin();
        for (/* empty */; aliasIt != aliases.end(); ++aliasIt)
        {
            m_aliasNames.insert(boost::algorithm::to_lower_copy(aliasIt->Name));
            if (NormalizeWwpn(aliasIt->Wwpn, wwpn))
            {
                m_aliasWwpns.insert(wwpn);
            }
        }

        if (!zones)
        {
            DebugPrintf(SI_LOG_DEBUG, "%s: no zone snapshot, every zone is new\n", FUNCTION_NAME);
            return;
        }

        PersistedZones_t::const_iterator zoneIt = zones->begin();
        for (/* empty */; zoneIt != zones->end(); ++zoneIt)
        {
            m_zoneKeys.insert(std::make_pair(boost::algorithm::to_lower_copy(zoneIt->Name), zoneIt->FabricId));
        }
    }

    bool ExistenceReconciler::AliasExists(const AliasCandidate& candidate) const
    {
        return m_aliasNames.count(boost::algorithm::to_lower_copy(candidate.Name)) ||
            m_aliasWwpns.count(candidate.Wwpn);
    }

    bool ExistenceReconciler::ZoneExists(const ZoneCandidate& candidate) const
    {
        return m_zoneKeys.count(std::make_pair(boost::algorithm::to_lower_copy(candidate.Name), candidate.FabricId)) != 0;
    }

    void ExistenceReconciler::ReconcileAliases(const AliasCandidates_t& candidates,
        AliasReconciliations_t& results) const
    {
        size_t existing = 0;
        AliasCandidates_t::const_iterator it = candidates.begin();
        for (/* empty */; it != candidates.end(); ++it)
        {
            bool exists = AliasExists(*it);
            existing += exists ? 1 : 0;
            results.push_back(AliasReconciliation(*it, exists));
        }

        DebugPrintf(SI_LOG_INFO, "%s: %lu of %lu aliases already exist\n", FUNCTION_NAME,
            existing, candidates.size());
    }

    void ExistenceReconciler::ReconcileZones(const ZoneCandidates_t& candidates,
        ZoneReconciliations_t& results) const
    {
        size_t existing = 0;
        ZoneCandidates_t::const_iterator it = candidates.begin();
        for (/* empty */; it != candidates.end(); ++it)
        {
            bool exists = ZoneExists(*it);
            existing += exists ? 1 : 0;
            results.push_back(ZoneReconciliation(*it, exists));
        }

        DebugPrintf(SI_LOG_INFO, "%s: %lu of %lu zones already exist\n", FUNCTION_NAME,
            existing, candidates.size());
    }
}
