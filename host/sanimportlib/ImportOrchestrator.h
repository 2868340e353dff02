/*
+------------------------------------------------------------------------------------+
File        : ImportOrchestrator.h

Description : Runs the import pipeline over a batch of source documents and submits
              the selected aliases and zones to the persistence service.

+------------------------------------------------------------------------------------+
*/
#ifndef _IMPORT_ORCHESTRATOR_H
#define _IMPORT_ORCHESTRATOR_H

#include <set>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>

#include "portable.h"
#include "sistatus.h"
#include "SanImportContracts.h"
#include "SanImportConstants.h"
#include "SanPersistenceClient.h"
#include "RoleClassifier.h"
#include "RoleResolver.h"
#include "RetryPolicy.h"
#include "SectionExtractor.h"
#include "ZoneExtractor.h"
#include "ImportBatch.h"

namespace SanImportLib
{
    class ImportOptions
    {
    public:
        ImportOptions()
            : DumpSizeThreshold(DEFAULT_DUMP_SIZE_THRESHOLD),
            DividerMinLength(DEFAULT_DIVIDER_MIN_LENGTH),
            RefreshPolicy(5, 1000, 10000),
            LockRetryPolicy(3, 500, 4000),
            ClassifierThreads(1)
        {}

        AliasDefaults Aliases;
        ZoneDefaults Zones;
        size_t DumpSizeThreshold;
        size_t DividerMinLength;

        /// \brief read-after-write refresh of the alias set
        RetryPolicy RefreshPolicy;

        /// \brief resubmission after lock contention, MaxAttempts counts the first submission
        RetryPolicy LockRetryPolicy;

        unsigned int ClassifierThreads;
    };

    /// \brief two phase import of one batch of documents against one fabric
    ///
    /// Prepare collects the aliases of every document first so a zone in one document
    /// can reference an alias declared in another, then extracts the final aliases and
    /// zones, deduplicates them and flags the ones already persisted.
    /// Submit stores the selected new aliases, waits until they are visible, rewrites
    /// the zone members that referenced them and stores the selected new zones.
    class ImportOrchestrator
    {
    public:
        ImportOrchestrator(SanPersistenceClientPtr client, const ImportOptions& options);

        /// \brief classifier used when the role mode is smart, may be null
        void SetRoleClassifier(RoleClassifierPtr classifier);

        void RegisterEventCallback(ImportEventCallback_t callback);

        /// \brief prepares a batch, batch is only written on success
        ///
        /// \param qf polled between documents and between phases, SIE_ABORT when it returns true
        /// \returns SIS_OK, SIE_INVALIDARG without documents, SIE_BUSY while a submission for the
        /// fabric is in flight, SIE_ABORT, or the status of a failed alias listing
        SISTATUS Prepare(SanObjectId fabricId,
            const SourceDocuments_t& documents,
            ImportBatch& batch,
            QuitFunction_t qf = QuitFunction_t());

        /// \brief submits every selected new alias, then every selected new zone
        ///
        /// not cancellable once started, runs until done or out of retries
        /// \returns report.Status, or SIE_BUSY when another submission for the fabric is in flight
        SISTATUS Submit(ImportBatch& batch, SubmissionReport& report);

        SISTATUS SetAliasSelected(ImportBatch& batch, size_t index, bool selected);
        SISTATUS SetZoneSelected(ImportBatch& batch, size_t index, bool selected);

        /// \brief selects every candidate not already persisted and deselects the others
        void SelectAllNew(ImportBatch& batch);

        void ClearBatch(ImportBatch& batch);

        /// \brief true while Submit runs for the fabric in this process
        static bool IsSubmissionInFlight(SanObjectId fabricId);

        ImportOptions& Options() { return m_options; }

    private:
        /// \brief lines handed to the extractors for one document
        void SplitDocument(const SourceDocument& document, ExtractedSections& sections) const;

        void CollectAliases(SanObjectId fabricId,
            const SourceDocument& document,
            const ExtractedSections& sections,
            RoleResolverPtr resolver,
            AliasCandidates_t& aliases) const;

        void CollectZones(SanObjectId fabricId,
            const SourceDocument& document,
            const ExtractedSections& sections,
            const AliasLookup& lookup,
            ZoneCandidates_t& zones) const;

        SISTATUS SubmitAliases(ImportBatch& batch, SubmissionReport& report, std::vector<std::string>& expected);

        /// \brief lists the alias set until every expected name shows up or the policy runs out
        bool RefreshAliases(SanObjectId fabricId, const std::vector<std::string>& expected, PersistedAliases_t& aliases);

        /// \brief rewrites InBatch members to Persisted ids using the refreshed set
        void ResolveBatchMembers(ImportBatch& batch, const PersistedAliases_t& aliases, SubmissionReport& report);

        SISTATUS SubmitZones(ImportBatch& batch, SubmissionReport& report);

        /// \brief files per-item errors of one submission call into the report
        /// \param lockRetry lock contention errors are left for the next attempt instead of failing
        /// \param dropped receives the names that must not be resubmitted
        void RecordItemErrors(const std::string& kind,
            const SubmissionItemErrors_t& errors,
            bool lockRetry,
            SubmissionReport& report,
            std::set<std::string>& dropped) const;

        void ComputeStatistics(ImportBatch& batch) const;

        void Emit(const ImportEvent& event);

        SanPersistenceClientPtr m_client;
        ImportOptions m_options;
        RoleClassifierPtr m_classifier;
        std::vector<ImportEventCallback_t> m_callbacks;

        /// \brief fabrics with a submission in flight
        static std::set<SanObjectId> s_inFlightFabrics;
        static boost::mutex s_inFlightLock;

        friend class FabricSubmissionGuard;
    };

    typedef boost::shared_ptr<ImportOrchestrator> ImportOrchestratorPtr;
}

#endif
