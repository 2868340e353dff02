/*
+------------------------------------------------------------------------------------+
File        : ExistenceReconciler.h

Description : Flags deduplicated candidates as new or already persisted by comparing
              them against a snapshot of the fabric's persisted records.

+------------------------------------------------------------------------------------+
*/
#ifndef _EXISTENCE_RECONCILER_H
#define _EXISTENCE_RECONCILER_H

#include <set>
#include <string>

#include <boost/optional.hpp>

#include "SanImportContracts.h"

namespace SanImportLib
{
    class ExistenceReconciler
    {
    public:
        /// \param aliases persisted aliases of the active fabric
        /// \param zones persisted zones, absent when the snapshot could not be read
        ExistenceReconciler(const PersistedAliases_t& aliases,
            const boost::optional<PersistedZones_t>& zones);

        /// \brief case-insensitive name match or normalized WWPN match
        bool AliasExists(const AliasCandidate& candidate) const;

        /// \brief case-insensitive name match within the same fabric, false without a snapshot
        bool ZoneExists(const ZoneCandidate& candidate) const;

        void ReconcileAliases(const AliasCandidates_t& candidates, AliasReconciliations_t& results) const;
        void ReconcileZones(const ZoneCandidates_t& candidates, ZoneReconciliations_t& results) const;

    private:
        std::set<std::string> m_aliasNames;
        std::set<std::string> m_aliasWwpns;
        std::set<std::pair<std::string, SanObjectId> > m_zoneKeys;
    };
}

#endif
