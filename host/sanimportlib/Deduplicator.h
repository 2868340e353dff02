/*
+------------------------------------------------------------------------------------+
File        : Deduplicator.h

Description : Collapses alias candidates sharing a WWPN and zone candidates sharing
              a (name, fabric) key, keeping first-seen order.

+------------------------------------------------------------------------------------+
*/
#ifndef _DEDUPLICATOR_H
#define _DEDUPLICATOR_H

#include "SanImportContracts.h"

namespace SanImportLib
{
    class DeduplicationStats
    {
    public:
        DeduplicationStats() : DuplicateAliasesRemoved(0), ConflictsResolved(0), DuplicateZonesRemoved(0) {}

        /// \brief candidates dropped because an earlier one had the same WWPN and syntax
        size_t DuplicateAliasesRemoved;

        /// \brief WWPN groups whose candidates disagreed on syntax
        size_t ConflictsResolved;

        size_t DuplicateZonesRemoved;
    };

    class Deduplicator
    {
    public:
        explicit Deduplicator(ConflictPolicy policy) : m_policy(policy) {}

        /// \brief one candidate per normalized WWPN
        ///
        /// a group whose candidates share one syntax keeps its first occurrence,
        /// a group mixing device-alias and fcalias keeps the first candidate of the
        /// preferred syntax and records the decision in its classification note.
        /// each kept candidate takes the position of the first occurrence of its group
        void DeduplicateAliases(AliasCandidates_t& candidates);

        /// \brief one zone per (name, fabric), first occurrence wins
        void DeduplicateZones(ZoneCandidates_t& zones);

        const DeduplicationStats& Stats() const { return m_stats; }

    private:
        ConflictPolicy m_policy;
        DeduplicationStats m_stats;
    };
}

#endif
