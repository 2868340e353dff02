/*
+------------------------------------------------------------------------------------+
File        : ImportOrchestrator.cpp

Description : ImportOrchestrator implementation

+------------------------------------------------------------------------------------+
*/
#include <algorithm>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "ImportOrchestrator.h"
#include "FormatClassifier.h"
#include "AliasExtractor.h"
#include "Deduplicator.h"
#include "ExistenceReconciler.h"
#include "SanImportUtils.h"
#include "errorexception.h"
#include "logger.h"

namespace SanImportLib
{
    std::set<SanObjectId> ImportOrchestrator::s_inFlightFabrics;
    boost::mutex ImportOrchestrator::s_inFlightLock;

    /// \brief marks a fabric as having a submission in flight for its lifetime
    class FabricSubmissionGuard
    {
    public:
        explicit FabricSubmissionGuard(SanObjectId fabricId)
            : m_fabricId(fabricId)
        {
            boost::mutex::scoped_lock guard(ImportOrchestrator::s_inFlightLock);
            m_acquired = ImportOrchestrator::s_inFlightFabrics.insert(fabricId).second;
        }

        ~FabricSubmissionGuard()
        {
            if (m_acquired)
            {
                boost::mutex::scoped_lock guard(ImportOrchestrator::s_inFlightLock);
                ImportOrchestrator::s_inFlightFabrics.erase(m_fabricId);
            }
        }

        bool Acquired() const { return m_acquired; }

    private:
        FabricSubmissionGuard(const FabricSubmissionGuard&);
        FabricSubmissionGuard& operator=(const FabricSubmissionGuard&);

        SanObjectId m_fabricId;
        bool m_acquired;
    };

    namespace
    {
        const std::string ALIAS_KIND("alias");
        const std::string ZONE_KIND("zone");

        bool Aborted(const QuitFunction_t& qf)
        {
            return qf && qf(0);
        }

        void AddUnique(MemberRefs_t& members, const MemberRef& member)
        {
            if (std::find(members.begin(), members.end(), member) == members.end())
            {
                members.push_back(member);
            }
        }

        bool IsWholeCallFailure(SISTATUS status)
        {
            return SIS_OK != status && SIE_PARTIAL_FAILURE != status;
        }
    }

    ImportOrchestrator::ImportOrchestrator(SanPersistenceClientPtr client, const ImportOptions& options)
        : m_client(client),
        m_options(options)
    {
        if (!m_client)
        {
            throw ERROR_EXCEPTION << "a persistence client is required";
        }
    }

    void ImportOrchestrator::SetRoleClassifier(RoleClassifierPtr classifier)
    {
        m_classifier = classifier;
    }

    void ImportOrchestrator::RegisterEventCallback(ImportEventCallback_t callback)
    {
        m_callbacks.push_back(callback);
    }

    bool ImportOrchestrator::IsSubmissionInFlight(SanObjectId fabricId)
    {
        boost::mutex::scoped_lock guard(s_inFlightLock);
        return s_inFlightFabrics.count(fabricId) != 0;
    }

    void ImportOrchestrator::Emit(const ImportEvent& event)
    {
        std::vector<ImportEventCallback_t>::const_iterator it = m_callbacks.begin();
        for (/* empty */; it != m_callbacks.end(); ++it)
        {
            try
            {
                (*it)(event);
            }
            catch (const std::exception& e)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: %s callback failed with exception %s\n",
                    FUNCTION_NAME, ImportEventTypeToString(event.Type), e.what());
            }
        }
    }

    void ImportOrchestrator::SplitDocument(const SourceDocument& document, ExtractedSections& sections) const
    {
        SourceLines_t lines = SplitLines(document.Text);
        if (FORMAT_TECH_SUPPORT_DUMP == document.Format)
        {
            SectionExtractor extractor(m_options.DividerMinLength);
            extractor.Extract(lines, sections);
            return;
        }

        TextSection whole(SECTION_FALLBACK);
        whole.Lines.swap(lines);
        sections.Sections.push_back(whole);
    }

    void ImportOrchestrator::CollectAliases(SanObjectId fabricId,
        const SourceDocument& document,
        const ExtractedSections& sections,
        RoleResolverPtr resolver,
        AliasCandidates_t& aliases) const
    {
        AliasExtractor extractor(m_options.Aliases, fabricId);
        extractor.SetRoleResolver(resolver);

        std::vector<const TextSection*> fragments = sections.AliasSections();
        std::vector<const TextSection*>::const_iterator it = fragments.begin();
        for (/* empty */; it != fragments.end(); ++it)
        {
            extractor.Extract((*it)->Lines, document.Name, (*it)->Vsan, aliases);
        }
    }

    void ImportOrchestrator::CollectZones(SanObjectId fabricId,
        const SourceDocument& document,
        const ExtractedSections& sections,
        const AliasLookup& lookup,
        ZoneCandidates_t& zones) const
    {
        ZoneExtractor extractor(m_options.Zones, fabricId);

        std::vector<const TextSection*> fragments = sections.ZoneSections();
        std::vector<const TextSection*>::const_iterator it = fragments.begin();
        for (/* empty */; it != fragments.end(); ++it)
        {
            extractor.Extract((*it)->Lines, document.Name, (*it)->Vsan, lookup, zones);
        }
    }

    void ImportOrchestrator::ComputeStatistics(ImportBatch& batch) const
    {
        ImportStatistics& stats = batch.Stats;
        stats.TotalAliases = batch.Aliases.size();
        stats.NewAliases = stats.ExistingAliases = stats.SmartDetected = stats.DefaultedRoles = 0;

        AliasReconciliations_t::const_iterator aliasIt = batch.Aliases.begin();
        for (/* empty */; aliasIt != batch.Aliases.end(); ++aliasIt)
        {
            if (aliasIt->ExistsAlready)
                stats.ExistingAliases++;
            else
                stats.NewAliases++;

            const boost::optional<std::string>& note = aliasIt->Candidate.ClassificationNote;
            if (note && boost::algorithm::starts_with(*note, ClassificationNotes::SmartDetected))
                stats.SmartDetected++;
            else if (note && boost::algorithm::icontains(*note, "defaulted to init"))
                stats.DefaultedRoles++;
        }

        stats.TotalZones = batch.Zones.size();
        stats.NewZones = stats.UnresolvedMembers = 0;

        ZoneReconciliations_t::const_iterator zoneIt = batch.Zones.begin();
        for (/* empty */; zoneIt != batch.Zones.end(); ++zoneIt)
        {
            if (!zoneIt->ExistsAlready)
                stats.NewZones++;
            stats.UnresolvedMembers += zoneIt->Candidate.Unresolved.size();
        }
    }

    SISTATUS ImportOrchestrator::Prepare(SanObjectId fabricId,
        const SourceDocuments_t& documents,
        ImportBatch& batch,
        QuitFunction_t qf)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        if (documents.empty())
        {
            DebugPrintf(SI_LOG_ERROR, "%s: no documents to import\n", FUNCTION_NAME);
            return SIE_INVALIDARG;
        }

        if (IsSubmissionInFlight(fabricId))
        {
            DebugPrintf(SI_LOG_ERROR, "%s: a submission for fabric %lld is in flight\n",
                FUNCTION_NAME, static_cast<long long>(fabricId));
            return SIE_BUSY;
        }

        SISTATUS status = SIS_OK;
        try
        {
            ImportBatch prepared;
            prepared.FabricId = fabricId;
            prepared.Documents = documents;

            // phase 1: pool every declared alias
            FormatClassifier formatClassifier(m_options.DumpSizeThreshold);
            std::vector<ExtractedSections> sections(prepared.Documents.size());
            for (size_t i = 0; i < prepared.Documents.size(); i++)
            {
                if (Aborted(qf))
                {
                    DebugPrintf(SI_LOG_INFO, "%s: cancelled while collecting aliases\n", FUNCTION_NAME);
                    return SIE_ABORT;
                }

                SourceDocument& document = prepared.Documents[i];
                document.Format = formatClassifier.Classify(document.Text);
                DebugPrintf(SI_LOG_INFO, "%s: %s classified as %s\n", FUNCTION_NAME,
                    document.Name.c_str(), SourceFormatToString(document.Format));

                if (FORMAT_UNKNOWN == document.Format)
                {
                    prepared.Warnings.push_back(document.Name + ": format not recognized, scanned for alias definitions");
                }

                SplitDocument(document, sections[i]);
                if (sections[i].UsedFallback)
                {
                    prepared.Warnings.push_back(document.Name + ": no configuration section found, scanned the whole text");
                }

                CollectAliases(fabricId, document, sections[i], RoleResolverPtr(), prepared.Pool);
            }

            AliasCandidates_t::const_iterator poolIt = prepared.Pool.begin();
            for (/* empty */; poolIt != prepared.Pool.end(); ++poolIt)
            {
                prepared.PoolWwpns.insert(std::make_pair(poolIt->Name, poolIt->Wwpn));
            }

            if (Aborted(qf))
            {
                DebugPrintf(SI_LOG_INFO, "%s: cancelled after collecting aliases\n", FUNCTION_NAME);
                return SIE_ABORT;
            }

            PersistedAliases_t persisted;
            status = m_client->ListAliases(fabricId, persisted);
            if (SIS_OK != status)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: failed to list aliases of fabric %lld: %s\n", FUNCTION_NAME,
                    static_cast<long long>(fabricId), SiStatusToString(status));
                return status;
            }

            // phase 2: final candidates against the full pool
            RoleResolverPtr resolver;
            if (ROLE_MODE_SMART == m_options.Aliases.Role)
            {
                resolver.reset(new RoleResolver(m_classifier, m_options.ClassifierThreads));
            }

            AliasLookup lookup(persisted, prepared.Pool);
            AliasCandidates_t aliases;
            ZoneCandidates_t zones;
            for (size_t i = 0; i < prepared.Documents.size(); i++)
            {
                if (Aborted(qf))
                {
                    DebugPrintf(SI_LOG_INFO, "%s: cancelled while extracting\n", FUNCTION_NAME);
                    return SIE_ABORT;
                }

                CollectAliases(fabricId, prepared.Documents[i], sections[i], resolver, aliases);
                CollectZones(fabricId, prepared.Documents[i], sections[i], lookup, zones);
            }

            Deduplicator deduplicator(m_options.Aliases.Policy);
            deduplicator.DeduplicateAliases(aliases);
            deduplicator.DeduplicateZones(zones);

            boost::optional<PersistedZones_t> persistedZones;
            PersistedZones_t listedZones;
            SISTATUS zoneStatus = m_client->ListZones(fabricId, listedZones);
            if (SIS_OK == zoneStatus)
            {
                persistedZones = listedZones;
            }
            else if (!zones.empty())
            {
                DebugPrintf(SI_LOG_WARNING, "%s: zone listing returned %s, every zone is treated as new\n",
                    FUNCTION_NAME, SiStatusToString(zoneStatus));
                prepared.Warnings.push_back(std::string("zone snapshot unavailable (") +
                    SiStatusToString(zoneStatus) + "), every zone is treated as new");
            }

            ExistenceReconciler reconciler(persisted, persistedZones);
            reconciler.ReconcileAliases(aliases, prepared.Aliases);
            reconciler.ReconcileZones(zones, prepared.Zones);

            prepared.Stats.DuplicatesRemoved = deduplicator.Stats().DuplicateAliasesRemoved;
            prepared.Stats.ConflictsResolved = deduplicator.Stats().ConflictsResolved;
            prepared.Stats.DuplicateZonesRemoved = deduplicator.Stats().DuplicateZonesRemoved;
            ComputeStatistics(prepared);

            DebugPrintf(SI_LOG_INFO, "%s: %lu aliases (%lu new), %lu zones (%lu new), %lu unresolved members\n",
                FUNCTION_NAME, prepared.Stats.TotalAliases, prepared.Stats.NewAliases,
                prepared.Stats.TotalZones, prepared.Stats.NewZones, prepared.Stats.UnresolvedMembers);

            std::swap(batch, prepared);
        }
        catch (const ErrorException& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: failed with exception %s\n", FUNCTION_NAME, e.what());
            status = SIE_FAIL;
        }
        catch (const std::exception& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: failed with exception %s\n", FUNCTION_NAME, e.what());
            status = SIE_FAIL;
        }

        if (SIS_OK == status)
        {
            Emit(ImportEvent(EVENT_BATCH_PREPARED, fabricId));
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    void ImportOrchestrator::RecordItemErrors(const std::string& kind,
        const SubmissionItemErrors_t& errors,
        bool lockRetry,
        SubmissionReport& report,
        std::set<std::string>& dropped) const
    {
        SubmissionItemErrors_t::const_iterator it = errors.begin();
        for (/* empty */; it != errors.end(); ++it)
        {
            if (it->Duplicate)
            {
                DebugPrintf(SI_LOG_INFO, "%s: %s %s already exists\n", FUNCTION_NAME, kind.c_str(), it->Name.c_str());
                report.SkippedDuplicates.push_back(it->Name);
                dropped.insert(it->Name);
            }
            else if (lockRetry && ContainsAnyMarker(it->Reason, LockContentionMarkers))
            {
                DebugPrintf(SI_LOG_DEBUG, "%s: %s %s hit lock contention, will retry\n", FUNCTION_NAME,
                    kind.c_str(), it->Name.c_str());
            }
            else
            {
                DebugPrintf(SI_LOG_ERROR, "%s: %s %s was rejected: %s\n", FUNCTION_NAME, kind.c_str(),
                    it->Name.c_str(), it->Reason.c_str());
                report.Failures.push_back(SubmissionFailure(kind, it->Name, it->Reason));
                dropped.insert(it->Name);
            }
        }
    }

    SISTATUS ImportOrchestrator::SubmitAliases(ImportBatch& batch,
        SubmissionReport& report,
        std::vector<std::string>& expected)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::vector<size_t> pending;
        for (size_t i = 0; i < batch.Aliases.size(); i++)
        {
            if (!batch.Aliases[i].Selected)
                continue;

            if (batch.Aliases[i].ExistsAlready)
                report.SkippedDuplicates.push_back(batch.Aliases[i].Candidate.Name);
            else
                pending.push_back(i);
        }

        if (pending.empty())
        {
            DebugPrintf(SI_LOG_INFO, "%s: no new aliases selected\n", FUNCTION_NAME);
            return SIS_OK;
        }

        const size_t failuresBefore = report.Failures.size();
        SISTATUS status = SIS_OK;
        for (uint32_t attempt = 1; /* empty */; attempt++)
        {
            AliasDtos_t dtos;
            std::vector<size_t>::const_iterator it = pending.begin();
            for (/* empty */; it != pending.end(); ++it)
            {
                dtos.push_back(AliasDto(batch.Aliases[*it].Candidate));
            }

            SubmissionResult result;
            status = m_client->SubmitAliases(dtos, result);
            report.CreatedAliasIds.insert(report.CreatedAliasIds.end(), result.CreatedIds.begin(), result.CreatedIds.end());

            std::set<std::string> dropped;
            RecordItemErrors(ALIAS_KIND, result.Errors, SIE_RESOURCE_LOCKED == status, report, dropped);

            std::vector<size_t> remaining;
            for (it = pending.begin(); it != pending.end(); ++it)
            {
                AliasReconciliation& alias = batch.Aliases[*it];
                if (!dropped.count(alias.Candidate.Name))
                {
                    remaining.push_back(*it);
                }
                else if (std::find(report.SkippedDuplicates.begin(), report.SkippedDuplicates.end(),
                    alias.Candidate.Name) != report.SkippedDuplicates.end())
                {
                    alias.ExistsAlready = true;
                    alias.Selected = false;
                }
            }
            pending.swap(remaining);

            if (SIE_RESOURCE_LOCKED != status)
            {
                if (IsWholeCallFailure(status))
                {
                    DebugPrintf(SI_LOG_ERROR, "%s: alias submission failed: %s\n", FUNCTION_NAME, SiStatusToString(status));
                    for (it = pending.begin(); it != pending.end(); ++it)
                    {
                        report.Failures.push_back(SubmissionFailure(ALIAS_KIND, batch.Aliases[*it].Candidate.Name,
                            std::string("submission failed: ") + SiStatusToString(status)));
                    }
                    break;
                }

                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    expected.push_back(batch.Aliases[*it].Candidate.Name);
                    batch.Aliases[*it].ExistsAlready = true;
                    batch.Aliases[*it].Selected = false;
                }
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }

            if (pending.empty())
            {
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }

            if (attempt >= m_options.LockRetryPolicy.MaxAttempts)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: aliases still locked after %u attempts\n", FUNCTION_NAME, attempt);
                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    report.Failures.push_back(SubmissionFailure(ALIAS_KIND, batch.Aliases[*it].Candidate.Name,
                        "lock contention persisted after " + boost::lexical_cast<std::string>(attempt) + " attempts"));
                }
                break;
            }

            DebugPrintf(SI_LOG_WARNING, "%s: alias submission hit lock contention, attempt %u of %u\n",
                FUNCTION_NAME, attempt, m_options.LockRetryPolicy.MaxAttempts);
            m_options.LockRetryPolicy.Wait(attempt);

            // rows created before the lock was reported must not be submitted again
            PersistedAliases_t current;
            if (SIS_OK == m_client->ListAliases(batch.FabricId, current))
            {
                ExistenceReconciler reconciler(current, boost::optional<PersistedZones_t>());
                remaining.clear();
                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    AliasReconciliation& alias = batch.Aliases[*it];
                    if (reconciler.AliasExists(alias.Candidate))
                    {
                        report.SkippedDuplicates.push_back(alias.Candidate.Name);
                        alias.ExistsAlready = true;
                        alias.Selected = false;
                    }
                    else
                    {
                        remaining.push_back(*it);
                    }
                }
                pending.swap(remaining);
            }

            if (pending.empty())
            {
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }
        }

        DebugPrintf(SI_LOG_INFO, "%s: %lu aliases created, %s\n", FUNCTION_NAME,
            report.CreatedAliasIds.size(), SiStatusToString(status));
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    bool ImportOrchestrator::RefreshAliases(SanObjectId fabricId,
        const std::vector<std::string>& expected,
        PersistedAliases_t& aliases)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const RetryPolicy& policy = m_options.RefreshPolicy;
        size_t missing = expected.size();

        for (uint32_t attempt = 1; attempt <= policy.MaxAttempts; attempt++)
        {
            PersistedAliases_t listed;
            SISTATUS status = m_client->ListAliases(fabricId, listed);
            if (SIS_OK == status)
            {
                aliases.swap(listed);

                std::set<std::string> names;
                PersistedAliases_t::const_iterator aliasIt = aliases.begin();
                for (/* empty */; aliasIt != aliases.end(); ++aliasIt)
                {
                    names.insert(boost::algorithm::to_lower_copy(aliasIt->Name));
                }

                missing = 0;
                std::vector<std::string>::const_iterator it = expected.begin();
                for (/* empty */; it != expected.end(); ++it)
                {
                    if (!names.count(boost::algorithm::to_lower_copy(*it)))
                        missing++;
                }

                if (!missing)
                {
                    DebugPrintf(SI_LOG_INFO, "%s: %lu aliases visible after %u attempts\n", FUNCTION_NAME,
                        expected.size(), attempt);
                    DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
                    return true;
                }
            }
            else
            {
                DebugPrintf(SI_LOG_WARNING, "%s: alias listing returned %s\n", FUNCTION_NAME, SiStatusToString(status));
            }

            if (attempt < policy.MaxAttempts)
            {
                policy.Wait(attempt);
            }
        }

        DebugPrintf(SI_LOG_WARNING, "%s: %lu of %lu submitted aliases not visible after %u attempts\n",
            FUNCTION_NAME, missing, expected.size(), policy.MaxAttempts);
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return false;
    }

    void ImportOrchestrator::ResolveBatchMembers(ImportBatch& batch,
        const PersistedAliases_t& aliases,
        SubmissionReport& report)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        AliasLookup lookup(aliases, AliasCandidates_t());

        ZoneReconciliations_t::iterator zoneIt = batch.Zones.begin();
        for (/* empty */; zoneIt != batch.Zones.end(); ++zoneIt)
        {
            if (!zoneIt->Selected || zoneIt->ExistsAlready)
                continue;

            ZoneCandidate& zone = zoneIt->Candidate;
            MemberRefs_t members;
            MemberRefs_t::const_iterator it = zone.Members.begin();
            for (/* empty */; it != zone.Members.end(); ++it)
            {
                const InBatchMember* inBatch = boost::get<InBatchMember>(&*it);
                if (!inBatch)
                {
                    AddUnique(members, *it);
                    continue;
                }

                boost::optional<std::string> wwpn;
                std::map<std::string, std::string>::const_iterator found = batch.PoolWwpns.find(inBatch->AliasName);
                if (found != batch.PoolWwpns.end())
                {
                    wwpn = found->second;
                }

                boost::optional<MemberRef> resolved = lookup.Resolve(inBatch->AliasName, wwpn);
                if (resolved)
                {
                    AddUnique(members, *resolved);
                }
                else
                {
                    DebugPrintf(SI_LOG_WARNING, "%s: zone %s member %s is still not persisted\n", FUNCTION_NAME,
                        zone.Name.c_str(), inBatch->AliasName.c_str());
                    zone.Unresolved.push_back(UnresolvedMember(UnresolvedKind::BatchAlias, inBatch->AliasName, zone.OriginLine));
                }
            }
            zone.Members.swap(members);

            UnresolvedMembers_t::const_iterator unresolvedIt = zone.Unresolved.begin();
            for (/* empty */; unresolvedIt != zone.Unresolved.end(); ++unresolvedIt)
            {
                report.UnresolvedAfterRefresh.push_back(UnmatchedMember(zone.Name, zone.SourceName, *unresolvedIt));
            }
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }

    SISTATUS ImportOrchestrator::SubmitZones(ImportBatch& batch, SubmissionReport& report)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::vector<size_t> pending;
        for (size_t i = 0; i < batch.Zones.size(); i++)
        {
            if (!batch.Zones[i].Selected)
                continue;

            if (batch.Zones[i].ExistsAlready)
                report.SkippedDuplicates.push_back(batch.Zones[i].Candidate.Name);
            else
                pending.push_back(i);
        }

        if (pending.empty())
        {
            DebugPrintf(SI_LOG_INFO, "%s: no new zones selected\n", FUNCTION_NAME);
            return SIS_OK;
        }

        const size_t failuresBefore = report.Failures.size();
        SISTATUS status = SIS_OK;
        for (uint32_t attempt = 1; /* empty */; attempt++)
        {
            ZoneDtos_t dtos;
            std::vector<size_t>::const_iterator it = pending.begin();
            for (/* empty */; it != pending.end(); ++it)
            {
                const ZoneCandidate& zone = batch.Zones[*it].Candidate;
                std::vector<SanObjectId> ids;
                MemberRefs_t::const_iterator memberIt = zone.Members.begin();
                for (/* empty */; memberIt != zone.Members.end(); ++memberIt)
                {
                    if (const PersistedMember* persisted = boost::get<PersistedMember>(&*memberIt))
                    {
                        ids.push_back(persisted->AliasId);
                    }
                }
                dtos.push_back(ZoneDto(zone, ids));
            }

            SubmissionResult result;
            status = m_client->SubmitZones(dtos, result);
            report.CreatedZoneIds.insert(report.CreatedZoneIds.end(), result.CreatedIds.begin(), result.CreatedIds.end());

            std::set<std::string> dropped;
            RecordItemErrors(ZONE_KIND, result.Errors, SIE_RESOURCE_LOCKED == status, report, dropped);

            std::vector<size_t> remaining;
            for (it = pending.begin(); it != pending.end(); ++it)
            {
                ZoneReconciliation& zone = batch.Zones[*it];
                if (!dropped.count(zone.Candidate.Name))
                {
                    remaining.push_back(*it);
                }
                else if (std::find(report.SkippedDuplicates.begin(), report.SkippedDuplicates.end(),
                    zone.Candidate.Name) != report.SkippedDuplicates.end())
                {
                    zone.ExistsAlready = true;
                    zone.Selected = false;
                }
            }
            pending.swap(remaining);

            if (SIE_RESOURCE_LOCKED != status)
            {
                if (IsWholeCallFailure(status))
                {
                    DebugPrintf(SI_LOG_ERROR, "%s: zone submission failed: %s\n", FUNCTION_NAME, SiStatusToString(status));
                    for (it = pending.begin(); it != pending.end(); ++it)
                    {
                        report.Failures.push_back(SubmissionFailure(ZONE_KIND, batch.Zones[*it].Candidate.Name,
                            std::string("submission failed: ") + SiStatusToString(status)));
                    }
                    break;
                }

                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    batch.Zones[*it].ExistsAlready = true;
                    batch.Zones[*it].Selected = false;
                }
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }

            if (pending.empty())
            {
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }

            if (attempt >= m_options.LockRetryPolicy.MaxAttempts)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: zones still locked after %u attempts\n", FUNCTION_NAME, attempt);
                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    report.Failures.push_back(SubmissionFailure(ZONE_KIND, batch.Zones[*it].Candidate.Name,
                        "lock contention persisted after " + boost::lexical_cast<std::string>(attempt) + " attempts"));
                }
                break;
            }

            DebugPrintf(SI_LOG_WARNING, "%s: zone submission hit lock contention, attempt %u of %u\n",
                FUNCTION_NAME, attempt, m_options.LockRetryPolicy.MaxAttempts);
            m_options.LockRetryPolicy.Wait(attempt);

            PersistedZones_t current;
            if (SIS_OK == m_client->ListZones(batch.FabricId, current))
            {
                ExistenceReconciler reconciler(PersistedAliases_t(), current);
                remaining.clear();
                for (it = pending.begin(); it != pending.end(); ++it)
                {
                    ZoneReconciliation& zone = batch.Zones[*it];
                    if (reconciler.ZoneExists(zone.Candidate))
                    {
                        report.SkippedDuplicates.push_back(zone.Candidate.Name);
                        zone.ExistsAlready = true;
                        zone.Selected = false;
                    }
                    else
                    {
                        remaining.push_back(*it);
                    }
                }
                pending.swap(remaining);
            }

            if (pending.empty())
            {
                status = (report.Failures.size() > failuresBefore) ? SIE_PARTIAL_FAILURE : SIS_OK;
                break;
            }
        }

        DebugPrintf(SI_LOG_INFO, "%s: %lu zones created, %s\n", FUNCTION_NAME,
            report.CreatedZoneIds.size(), SiStatusToString(status));
        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS ImportOrchestrator::Submit(ImportBatch& batch, SubmissionReport& report)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        report = SubmissionReport();

        FabricSubmissionGuard guard(batch.FabricId);
        if (!guard.Acquired())
        {
            DebugPrintf(SI_LOG_ERROR, "%s: a submission for fabric %lld is already in flight\n",
                FUNCTION_NAME, static_cast<long long>(batch.FabricId));
            report.Status = SIE_BUSY;
            return SIE_BUSY;
        }

        try
        {
            std::vector<std::string> expected;
            SISTATUS aliasStatus = SubmitAliases(batch, report, expected);
            SISTATUS zoneStatus = SIS_OK;

            if (IsWholeCallFailure(aliasStatus))
            {
                ZoneReconciliations_t::const_iterator zoneIt = batch.Zones.begin();
                for (/* empty */; zoneIt != batch.Zones.end(); ++zoneIt)
                {
                    if (zoneIt->Selected && !zoneIt->ExistsAlready)
                    {
                        report.Failures.push_back(SubmissionFailure(ZONE_KIND, zoneIt->Candidate.Name,
                            std::string("not submitted, alias submission failed: ") + SiStatusToString(aliasStatus)));
                    }
                }
            }
            else
            {
                PersistedAliases_t refreshed;
                report.RefreshConfirmed = RefreshAliases(batch.FabricId, expected, refreshed);
                ResolveBatchMembers(batch, refreshed, report);
                zoneStatus = SubmitZones(batch, report);
            }

            if (SIE_RESOURCE_LOCKED == aliasStatus || SIE_RESOURCE_LOCKED == zoneStatus)
                report.Status = SIE_RESOURCE_LOCKED;
            else if (IsWholeCallFailure(aliasStatus) || IsWholeCallFailure(zoneStatus))
                report.Status = SIE_FAIL;
            else if (!report.Failures.empty())
                report.Status = SIE_PARTIAL_FAILURE;
            else
                report.Status = SIS_OK;
        }
        catch (const ErrorException& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: failed with exception %s\n", FUNCTION_NAME, e.what());
            report.Status = SIE_FAIL;
        }
        catch (const std::exception& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: failed with exception %s\n", FUNCTION_NAME, e.what());
            report.Status = SIE_FAIL;
        }

        DebugPrintf(SI_LOG_INFO, "%s: fabric %lld submission finished with %s\n", FUNCTION_NAME,
            static_cast<long long>(batch.FabricId), SiStatusToString(report.Status));

        Emit(ImportEvent(EVENT_SUBMISSION_COMPLETED, batch.FabricId));

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return report.Status;
    }

    SISTATUS ImportOrchestrator::SetAliasSelected(ImportBatch& batch, size_t index, bool selected)
    {
        if (index >= batch.Aliases.size())
        {
            DebugPrintf(SI_LOG_ERROR, "%s: alias index %lu out of range\n", FUNCTION_NAME, index);
            return SIE_INVALIDARG;
        }

        if (batch.Aliases[index].Selected != selected)
        {
            batch.Aliases[index].Selected = selected;
            Emit(ImportEvent(EVENT_ALIAS_SELECTION_CHANGED, batch.FabricId, index, selected));
        }
        return SIS_OK;
    }

    SISTATUS ImportOrchestrator::SetZoneSelected(ImportBatch& batch, size_t index, bool selected)
    {
        if (index >= batch.Zones.size())
        {
            DebugPrintf(SI_LOG_ERROR, "%s: zone index %lu out of range\n", FUNCTION_NAME, index);
            return SIE_INVALIDARG;
        }

        if (batch.Zones[index].Selected != selected)
        {
            batch.Zones[index].Selected = selected;
            Emit(ImportEvent(EVENT_ZONE_SELECTION_CHANGED, batch.FabricId, index, selected));
        }
        return SIS_OK;
    }

    void ImportOrchestrator::SelectAllNew(ImportBatch& batch)
    {
        for (size_t i = 0; i < batch.Aliases.size(); i++)
        {
            SetAliasSelected(batch, i, !batch.Aliases[i].ExistsAlready);
        }
        for (size_t i = 0; i < batch.Zones.size(); i++)
        {
            SetZoneSelected(batch, i, !batch.Zones[i].ExistsAlready);
        }
    }

    void ImportOrchestrator::ClearBatch(ImportBatch& batch)
    {
        SanObjectId fabricId = batch.FabricId;
        batch.Clear();
        Emit(ImportEvent(EVENT_BATCH_CLEARED, fabricId));
    }
}
