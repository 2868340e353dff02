/*
+------------------------------------------------------------------------------------+
File        : ImportBatch.h

Description : Results of one import run: prepared candidates with their existence
              and selection flags, statistics, events and the submission report.

+------------------------------------------------------------------------------------+
*/
#ifndef _IMPORT_BATCH_H
#define _IMPORT_BATCH_H

#include <map>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/property_tree/ptree.hpp>

#include "sistatus.h"
#include "SanImportContracts.h"

namespace SanImportLib
{
    class ImportStatistics
    {
    public:
        ImportStatistics()
            : TotalAliases(0), NewAliases(0), ExistingAliases(0),
            DuplicatesRemoved(0), ConflictsResolved(0),
            SmartDetected(0), DefaultedRoles(0),
            TotalZones(0), NewZones(0), DuplicateZonesRemoved(0),
            UnresolvedMembers(0)
        {}

        size_t TotalAliases;
        size_t NewAliases;
        size_t ExistingAliases;
        size_t DuplicatesRemoved;
        size_t ConflictsResolved;

        /// \brief roles answered by the classifier
        size_t SmartDetected;

        /// \brief pending roles that fell back to initiator
        size_t DefaultedRoles;

        size_t TotalZones;
        size_t NewZones;
        size_t DuplicateZonesRemoved;
        size_t UnresolvedMembers;

        void serialize(boost::property_tree::ptree& node) const;
    };

    /// \brief zone member token that matched no alias, with the zone and document it came from
    class UnmatchedMember
    {
    public:
        UnmatchedMember() : OriginLine(0) {}
        UnmatchedMember(const std::string& zoneName, const std::string& sourceName, const UnresolvedMember& member)
            : ZoneName(zoneName), SourceName(sourceName), Kind(member.Kind),
            RawToken(member.RawToken), OriginLine(member.OriginLine) {}

        std::string ZoneName;
        std::string SourceName;
        std::string Kind;
        std::string RawToken;
        size_t OriginLine;

        void serialize(boost::property_tree::ptree& node) const;
    };

    typedef std::vector<UnmatchedMember> UnmatchedMembers_t;

    class ImportBatch
    {
    public:
        ImportBatch() : FabricId(0) {}

        SanObjectId FabricId;

        /// \brief documents with the format detected for each
        SourceDocuments_t Documents;

        /// \brief every alias declared by the documents, before deduplication
        AliasCandidates_t Pool;

        AliasReconciliations_t Aliases;
        ZoneReconciliations_t Zones;

        /// \brief non-fatal conditions met while preparing
        std::vector<std::string> Warnings;

        ImportStatistics Stats;

        /// \brief normalized WWPN of every pooled alias name, first declaration wins
        std::map<std::string, std::string> PoolWwpns;

        bool Empty() const { return Documents.empty(); }

        /// \brief unresolved tokens of every zone, in zone order
        UnmatchedMembers_t UnmatchedMembers() const;

        /// \brief preview document: formats, candidates with flags, warnings and statistics
        void serialize(boost::property_tree::ptree& node) const;

        void Clear();
    };

    enum ImportEventType {
        EVENT_BATCH_PREPARED,
        EVENT_ALIAS_SELECTION_CHANGED,
        EVENT_ZONE_SELECTION_CHANGED,
        EVENT_BATCH_CLEARED,
        EVENT_SUBMISSION_COMPLETED
    };

    const char* ImportEventTypeToString(ImportEventType type);

    /// \brief notification emitted when a batch changes state
    class ImportEvent
    {
    public:
        ImportEvent(ImportEventType type, SanObjectId fabricId, size_t index = 0, bool selected = false)
            : Type(type), FabricId(fabricId), Index(index), Selected(selected) {}

        ImportEventType Type;
        SanObjectId FabricId;

        /// \brief alias or zone index for selection events
        size_t Index;

        /// \brief new selection state for selection events
        bool Selected;
    };

    typedef boost::function<void (const ImportEvent&)> ImportEventCallback_t;

    /// \brief alias or zone the backend did not create
    class SubmissionFailure
    {
    public:
        SubmissionFailure() {}
        SubmissionFailure(const std::string& kind, const std::string& name, const std::string& reason)
            : Kind(kind), Name(name), Reason(reason) {}

        /// \brief "alias" or "zone"
        std::string Kind;
        std::string Name;
        std::string Reason;

        void serialize(boost::property_tree::ptree& node) const;
    };

    typedef std::vector<SubmissionFailure> SubmissionFailures_t;

    class SubmissionReport
    {
    public:
        SubmissionReport() : RefreshConfirmed(false), Status(SIS_OK) {}

        std::vector<SanObjectId> CreatedAliasIds;
        std::vector<SanObjectId> CreatedZoneIds;

        /// \brief names reported by the backend, or found after a lock retry, as already existing
        std::vector<std::string> SkippedDuplicates;

        SubmissionFailures_t Failures;

        /// \brief zone members still unresolved after the post-submission refresh
        UnmatchedMembers_t UnresolvedAfterRefresh;

        /// \brief every submitted alias name was seen in the refreshed alias set
        bool RefreshConfirmed;

        /// \brief SIS_OK, SIE_PARTIAL_FAILURE, SIE_RESOURCE_LOCKED or SIE_FAIL
        SISTATUS Status;

        void serialize(boost::property_tree::ptree& node) const;

        std::string ToJson() const;
    };
}

#endif
