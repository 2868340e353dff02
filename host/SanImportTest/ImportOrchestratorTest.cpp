#include <stdexcept>

#include <gtest/gtest.h>
#include <boost/algorithm/string/predicate.hpp>

#include "ImportOrchestrator.h"
#include "errorexception.h"
#include "FakeSanBackend.h"
#include "FakeRoleClassifier.h"

using namespace SanImportLib;
using namespace SanImportTest;

namespace
{
    const SanObjectId FABRIC = 1;

    const char ALIAS_TEXT[] =
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "device-alias name HOST2 pwwn 10:00:00:00:c9:2e:31:6b\n";

    const char ZONE_TEXT[] =
        "zone name Z1 vsan 10\n"
        "  member device-alias HOST1\n"
        "  member pwwn 50:05:07:63:0a:08:57:e4\n";

    SourceDocument Document(const std::string& name, const std::string& text)
    {
        SourceDocument document;
        document.Name = name;
        document.Text = text;
        return document;
    }

    bool HasWarning(const ImportBatch& batch, const std::string& text)
    {
        std::vector<std::string>::const_iterator it = batch.Warnings.begin();
        for (/* empty */; it != batch.Warnings.end(); ++it)
        {
            if (boost::algorithm::contains(*it, text))
                return true;
        }
        return false;
    }

    class ImportOrchestratorTest : public ::testing::Test
    {
    protected:
        ImportOrchestratorTest()
            : m_backend(new FakeSanBackend())
        {
            m_backend->NextId = 42;
            m_stor1 = m_backend->AddPersistedAlias("STOR1", "50:05:07:63:0a:08:57:e4", FABRIC);
            m_backend->NextId = 200;

            std::vector<uint32_t>* refreshDelays = &m_refreshDelays;
            std::vector<uint32_t>* lockDelays = &m_lockDelays;
            m_options.RefreshPolicy.SetSleeper([refreshDelays](uint32_t delayMs) { refreshDelays->push_back(delayMs); });
            m_options.LockRetryPolicy.SetSleeper([lockDelays](uint32_t delayMs) { lockDelays->push_back(delayMs); });

            m_documents.push_back(Document("aliases.txt", ALIAS_TEXT));
            m_documents.push_back(Document("zones.txt", ZONE_TEXT));
        }

        ImportOrchestratorPtr MakeOrchestrator()
        {
            return ImportOrchestratorPtr(new ImportOrchestrator(m_backend, m_options));
        }

        FakeSanBackendPtr m_backend;
        SanObjectId m_stor1;
        ImportOptions m_options;
        SourceDocuments_t m_documents;
        std::vector<uint32_t> m_refreshDelays;
        std::vector<uint32_t> m_lockDelays;
    };
}

TEST_F(ImportOrchestratorTest, RequiresAPersistenceClient)
{
    EXPECT_THROW(ImportOrchestratorPtr(new ImportOrchestrator(SanPersistenceClientPtr(), m_options)), ErrorException);
}

TEST_F(ImportOrchestratorTest, PrepareResolvesMembersAcrossDocuments)
{
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch));

    EXPECT_EQ(FABRIC, batch.FabricId);
    ASSERT_EQ(2u, batch.Documents.size());
    EXPECT_EQ(FORMAT_ALIAS_EXPORT, batch.Documents[0].Format);
    EXPECT_EQ(FORMAT_ZONE_EXPORT, batch.Documents[1].Format);

    ASSERT_EQ(2u, batch.Aliases.size());
    EXPECT_EQ("HOST1", batch.Aliases[0].Candidate.Name);
    EXPECT_FALSE(batch.Aliases[0].ExistsAlready);
    EXPECT_TRUE(batch.Aliases[0].Selected);

    ASSERT_EQ(1u, batch.Zones.size());
    const ZoneCandidate& zone = batch.Zones[0].Candidate;
    EXPECT_EQ("Z1", zone.Name);
    ASSERT_EQ(2u, zone.Members.size());
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == zone.Members[0]);
    EXPECT_TRUE(MemberRef(PersistedMember(m_stor1)) == zone.Members[1]);
    EXPECT_TRUE(batch.Warnings.empty());
}

TEST_F(ImportOrchestratorTest, ZoneDocumentMayComeFirst)
{
    std::swap(m_documents[0], m_documents[1]);

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch));

    ASSERT_EQ(1u, batch.Zones.size());
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == batch.Zones[0].Candidate.Members[0]);
    EXPECT_TRUE(batch.Zones[0].Candidate.Unresolved.empty());
}

TEST_F(ImportOrchestratorTest, SubmitRewritesBatchMembersAfterRefresh)
{
    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));
    EXPECT_EQ(SIS_OK, report.Status);
    EXPECT_TRUE(report.RefreshConfirmed);

    SanObjectId host1 = m_backend->AliasId("HOST1");
    ASSERT_NE(0, host1);
    ASSERT_EQ(2u, report.CreatedAliasIds.size());
    EXPECT_EQ(host1, report.CreatedAliasIds[0]);
    ASSERT_EQ(1u, report.CreatedZoneIds.size());
    EXPECT_TRUE(report.Failures.empty());
    EXPECT_TRUE(report.UnresolvedAfterRefresh.empty());

    ASSERT_EQ(1u, m_backend->SubmittedZones.size());
    ASSERT_EQ(1u, m_backend->SubmittedZones[0].size());
    const std::vector<SanObjectId>& members = m_backend->SubmittedZones[0][0].Members;
    ASSERT_EQ(2u, members.size());
    EXPECT_EQ(host1, members[0]);
    EXPECT_EQ(m_stor1, members[1]);

    const ZoneCandidate& zone = batch.Zones[0].Candidate;
    ASSERT_EQ(2u, zone.Members.size());
    EXPECT_TRUE(MemberRef(PersistedMember(host1)) == zone.Members[0]);
    EXPECT_TRUE(MemberRef(PersistedMember(m_stor1)) == zone.Members[1]);

    EXPECT_TRUE(batch.Aliases[0].ExistsAlready);
    EXPECT_FALSE(batch.Aliases[0].Selected);
    EXPECT_TRUE(batch.Zones[0].ExistsAlready);
    EXPECT_FALSE(batch.Zones[0].Selected);
    EXPECT_TRUE(m_refreshDelays.empty());
    EXPECT_FALSE(ImportOrchestrator::IsSubmissionInFlight(FABRIC));
}

TEST_F(ImportOrchestratorTest, RefreshWaitsForNewAliasesToShowUp)
{
    m_backend->RefreshLag = 2;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));
    EXPECT_TRUE(report.RefreshConfirmed);
    EXPECT_EQ(4u, m_backend->ListAliasesCalls);

    ASSERT_EQ(2u, m_refreshDelays.size());
    EXPECT_EQ(1000u, m_refreshDelays[0]);
    EXPECT_EQ(2000u, m_refreshDelays[1]);

    EXPECT_EQ(m_backend->AliasId("HOST1"), m_backend->SubmittedZones[0][0].Members[0]);
}

TEST_F(ImportOrchestratorTest, ExhaustedRefreshLeavesMembersUnresolved)
{
    m_backend->RefreshLag = 10;
    m_options.RefreshPolicy.MaxAttempts = 3;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    orchestrator->Submit(batch, report);

    EXPECT_FALSE(report.RefreshConfirmed);
    EXPECT_EQ(2u, m_refreshDelays.size());

    ASSERT_EQ(1u, report.UnresolvedAfterRefresh.size());
    EXPECT_EQ("Z1", report.UnresolvedAfterRefresh[0].ZoneName);
    EXPECT_EQ(UnresolvedKind::BatchAlias, report.UnresolvedAfterRefresh[0].Kind);
    EXPECT_EQ("HOST1", report.UnresolvedAfterRefresh[0].RawToken);

    ASSERT_EQ(1u, m_backend->SubmittedZones.size());
    const std::vector<SanObjectId>& members = m_backend->SubmittedZones[0][0].Members;
    ASSERT_EQ(1u, members.size());
    EXPECT_EQ(m_stor1, members[0]);
}

TEST_F(ImportOrchestratorTest, LockedSubmissionIsRetried)
{
    m_backend->LockedAliasSubmissions = 1;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    EXPECT_EQ(2u, m_backend->SubmittedAliases.size());
    EXPECT_EQ(2u, report.CreatedAliasIds.size());
    ASSERT_EQ(1u, m_lockDelays.size());
    EXPECT_EQ(500u, m_lockDelays[0]);
}

TEST_F(ImportOrchestratorTest, RowsCreatedBeforeTheLockAreNotResubmitted)
{
    m_backend->LockedAliasSubmissions = 1;
    m_backend->CreateBeforeLock = true;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    EXPECT_EQ(1u, m_backend->SubmittedAliases.size());
    EXPECT_EQ(3u, m_backend->AliasCount());
    EXPECT_TRUE(report.CreatedAliasIds.empty());
    ASSERT_EQ(2u, report.SkippedDuplicates.size());
    EXPECT_EQ("HOST1", report.SkippedDuplicates[0]);
    EXPECT_EQ("HOST2", report.SkippedDuplicates[1]);
    EXPECT_TRUE(batch.Aliases[0].ExistsAlready);

    ASSERT_EQ(1u, m_backend->SubmittedZones.size());
    EXPECT_EQ(m_backend->AliasId("HOST1"), m_backend->SubmittedZones[0][0].Members[0]);
}

TEST_F(ImportOrchestratorTest, PersistentLockFailsTheSubmission)
{
    m_backend->LockedAliasSubmissions = 10;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIE_RESOURCE_LOCKED, orchestrator->Submit(batch, report));

    EXPECT_EQ(3u, m_backend->SubmittedAliases.size());
    ASSERT_EQ(2u, m_lockDelays.size());
    EXPECT_EQ(500u, m_lockDelays[0]);
    EXPECT_EQ(1000u, m_lockDelays[1]);

    ASSERT_EQ(3u, report.Failures.size());
    EXPECT_EQ("alias", report.Failures[0].Kind);
    EXPECT_EQ("lock contention persisted after 3 attempts", report.Failures[0].Reason);
    EXPECT_EQ("zone", report.Failures[2].Kind);
    EXPECT_EQ("Z1", report.Failures[2].Name);
    EXPECT_TRUE(m_backend->SubmittedZones.empty());
    EXPECT_TRUE(batch.Aliases[0].Selected);
}

TEST_F(ImportOrchestratorTest, ItemFailureIsPartial)
{
    m_backend->AliasErrors["HOST2"] = "invalid wwpn";

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIE_PARTIAL_FAILURE, orchestrator->Submit(batch, report));

    ASSERT_EQ(1u, report.Failures.size());
    EXPECT_EQ("alias", report.Failures[0].Kind);
    EXPECT_EQ("HOST2", report.Failures[0].Name);
    EXPECT_EQ("invalid wwpn", report.Failures[0].Reason);
    EXPECT_TRUE(report.RefreshConfirmed);
    EXPECT_EQ(1u, report.CreatedAliasIds.size());
    EXPECT_EQ(1u, report.CreatedZoneIds.size());

    EXPECT_FALSE(batch.Aliases[1].ExistsAlready);
    EXPECT_TRUE(batch.Aliases[1].Selected);
}

TEST_F(ImportOrchestratorTest, DuplicateItemIsSkipped)
{
    m_backend->AliasErrors["HOST2"] = "alias with this name already exists";

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    ASSERT_EQ(1u, report.SkippedDuplicates.size());
    EXPECT_EQ("HOST2", report.SkippedDuplicates[0]);
    EXPECT_TRUE(report.Failures.empty());
    EXPECT_TRUE(batch.Aliases[1].ExistsAlready);
    EXPECT_FALSE(batch.Aliases[1].Selected);
}

TEST_F(ImportOrchestratorTest, FailedAliasSubmissionSkipsZones)
{
    m_backend->AliasSubmitStatus = SIE_HTTP_RESPONSE_FAILED;

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    SubmissionReport report;
    EXPECT_EQ(SIE_FAIL, orchestrator->Submit(batch, report));

    ASSERT_EQ(3u, report.Failures.size());
    EXPECT_EQ("submission failed: SIE_HTTP_RESPONSE_FAILED", report.Failures[0].Reason);
    EXPECT_EQ("not submitted, alias submission failed: SIE_HTTP_RESPONSE_FAILED", report.Failures[2].Reason);
    EXPECT_TRUE(m_backend->SubmittedZones.empty());
    EXPECT_FALSE(report.RefreshConfirmed);
}

TEST_F(ImportOrchestratorTest, DeselectedItemsAreNotSubmitted)
{
    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));
    ASSERT_EQ(SIS_OK, orchestrator->SetAliasSelected(batch, 1, false));
    ASSERT_EQ(SIS_OK, orchestrator->SetZoneSelected(batch, 0, false));

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    ASSERT_EQ(1u, m_backend->SubmittedAliases.size());
    ASSERT_EQ(1u, m_backend->SubmittedAliases[0].size());
    EXPECT_EQ("HOST1", m_backend->SubmittedAliases[0][0].Name);
    EXPECT_TRUE(m_backend->SubmittedZones.empty());
}

TEST_F(ImportOrchestratorTest, ExistingRecordsAreFlagged)
{
    m_backend->AddPersistedAlias("host1", "10:00:00:00:c9:2e:31:99", FABRIC);
    m_backend->AddPersistedZone("z1", FABRIC);

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch));

    EXPECT_TRUE(batch.Aliases[0].ExistsAlready);
    EXPECT_FALSE(batch.Aliases[0].Selected);
    EXPECT_FALSE(batch.Aliases[1].ExistsAlready);
    EXPECT_TRUE(batch.Zones[0].ExistsAlready);
    EXPECT_FALSE(batch.Zones[0].Selected);
    EXPECT_EQ(1u, batch.Stats.ExistingAliases);
    EXPECT_EQ(0u, batch.Stats.NewZones);
}

TEST_F(ImportOrchestratorTest, ZoneListingFailureTreatsZonesAsNew)
{
    m_backend->AddPersistedZone("Z1", FABRIC);
    m_backend->ListZonesStatus = SIE_HTTP_RESPONSE_FAILED;

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch));

    EXPECT_FALSE(batch.Zones[0].ExistsAlready);
    EXPECT_TRUE(HasWarning(batch, "zone snapshot unavailable"));
}

TEST_F(ImportOrchestratorTest, AliasListingFailureFailsPrepare)
{
    m_backend->ListAliasesStatus = SIE_HTTP_RESPONSE_FAILED;

    ImportBatch batch;
    batch.FabricId = 7;
    EXPECT_EQ(SIE_HTTP_RESPONSE_FAILED, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch));
    EXPECT_EQ(7, batch.FabricId);
    EXPECT_TRUE(batch.Aliases.empty());
}

TEST_F(ImportOrchestratorTest, PrepareWithoutDocuments)
{
    ImportBatch batch;
    EXPECT_EQ(SIE_INVALIDARG, MakeOrchestrator()->Prepare(FABRIC, SourceDocuments_t(), batch));
    EXPECT_EQ(0u, m_backend->ListAliasesCalls);
}

TEST_F(ImportOrchestratorTest, UnrecognizedDocumentIsScannedWithAWarning)
{
    SourceDocuments_t documents;
    documents.push_back(Document("notes.txt", "nothing to see here\n"));

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, MakeOrchestrator()->Prepare(FABRIC, documents, batch));
    EXPECT_EQ(FORMAT_UNKNOWN, batch.Documents[0].Format);
    EXPECT_TRUE(batch.Aliases.empty());
    EXPECT_TRUE(HasWarning(batch, "notes.txt: format not recognized"));
}

TEST_F(ImportOrchestratorTest, CancelBeforeListing)
{
    int polls = 0;
    QuitFunction_t qf = [&polls](int) { return ++polls > 2; };

    ImportBatch batch;
    batch.FabricId = 7;
    EXPECT_EQ(SIE_ABORT, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch, qf));
    EXPECT_EQ(0u, m_backend->ListAliasesCalls);
    EXPECT_EQ(7, batch.FabricId);
    EXPECT_TRUE(batch.Documents.empty());
}

TEST_F(ImportOrchestratorTest, CancelDuringExtraction)
{
    int polls = 0;
    QuitFunction_t qf = [&polls](int) { return ++polls > 3; };

    ImportBatch batch;
    EXPECT_EQ(SIE_ABORT, MakeOrchestrator()->Prepare(FABRIC, m_documents, batch, qf));
    EXPECT_EQ(1u, m_backend->ListAliasesCalls);
    EXPECT_TRUE(batch.Empty());
}

TEST_F(ImportOrchestratorTest, OneSubmissionPerFabric)
{
    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    bool inFlight = false;
    SISTATUS nestedPrepare = SIS_OK;
    SourceDocuments_t documents = m_documents;
    m_backend->OnSubmit = [&]()
    {
        inFlight = ImportOrchestrator::IsSubmissionInFlight(FABRIC);

        ImportBatch other;
        nestedPrepare = orchestrator->Prepare(FABRIC, documents, other);
    };

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    EXPECT_TRUE(inFlight);
    EXPECT_EQ(SIE_BUSY, nestedPrepare);
    EXPECT_FALSE(ImportOrchestrator::IsSubmissionInFlight(FABRIC));
}

TEST_F(ImportOrchestratorTest, SecondSubmissionForTheFabricIsBusy)
{
    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));

    ImportBatch other = batch;
    SISTATUS nestedSubmit = SIS_OK;
    m_backend->OnSubmit = [&]()
    {
        SubmissionReport otherReport;
        nestedSubmit = orchestrator->Submit(other, otherReport);
    };

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));
    EXPECT_EQ(SIE_BUSY, nestedSubmit);
}

TEST_F(ImportOrchestratorTest, SelectionEvents)
{
    std::vector<ImportEvent> events;
    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    orchestrator->RegisterEventCallback([&events](const ImportEvent& event) { events.push_back(event); });
    orchestrator->RegisterEventCallback([](const ImportEvent&) { throw std::runtime_error("listener failed"); });

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, m_documents, batch));
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(EVENT_BATCH_PREPARED, events[0].Type);
    EXPECT_EQ(FABRIC, events[0].FabricId);

    EXPECT_EQ(SIS_OK, orchestrator->SetAliasSelected(batch, 1, false));
    EXPECT_EQ(SIS_OK, orchestrator->SetAliasSelected(batch, 1, false));
    EXPECT_EQ(SIE_INVALIDARG, orchestrator->SetAliasSelected(batch, 2, true));
    EXPECT_EQ(SIE_INVALIDARG, orchestrator->SetZoneSelected(batch, 5, true));
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EVENT_ALIAS_SELECTION_CHANGED, events[1].Type);
    EXPECT_EQ(1u, events[1].Index);
    EXPECT_FALSE(events[1].Selected);

    orchestrator->SelectAllNew(batch);
    EXPECT_TRUE(batch.Aliases[1].Selected);
    ASSERT_EQ(3u, events.size());
    EXPECT_TRUE(events[2].Selected);

    orchestrator->ClearBatch(batch);
    EXPECT_TRUE(batch.Empty());
    ASSERT_EQ(4u, events.size());
    EXPECT_EQ(EVENT_BATCH_CLEARED, events[3].Type);
    EXPECT_EQ(FABRIC, events[3].FabricId);

    SubmissionReport report;
    orchestrator->Submit(batch, report);
    ASSERT_EQ(5u, events.size());
    EXPECT_EQ(EVENT_SUBMISSION_COMPLETED, events[4].Type);
}

TEST_F(ImportOrchestratorTest, Statistics)
{
    FakeRoleClassifierPtr classifier(new FakeRoleClassifier());
    classifier->Roles["10:00:00:00:c9:2e:31:6a"] = ROLE_TARGET;
    m_options.Aliases.Role = ROLE_MODE_SMART;

    SourceDocuments_t documents;
    documents.push_back(Document("switch.txt",
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "device-alias name HOST2 pwwn 10:00:00:00:c9:2e:31:6b\n"
        "device-alias name STOR1 pwwn 50:05:07:63:0a:08:57:e4\n"
        "fcalias name HOST1_FC vsan 10 ; member pwwn 10:00:00:00:c9:2e:31:6a\n"
        "zone name Z9 vsan 10\n"
        "  member device-alias HOST2\n"
        "  member pwwn 21:00:00:24:ff:00:00:01\n"));

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    orchestrator->SetRoleClassifier(classifier);

    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, documents, batch));

    const ImportStatistics& stats = batch.Stats;
    EXPECT_EQ(3u, stats.TotalAliases);
    EXPECT_EQ(2u, stats.NewAliases);
    EXPECT_EQ(1u, stats.ExistingAliases);
    EXPECT_EQ(1u, stats.DuplicatesRemoved);
    EXPECT_EQ(1u, stats.ConflictsResolved);
    EXPECT_EQ(1u, stats.SmartDetected);
    EXPECT_EQ(2u, stats.DefaultedRoles);
    EXPECT_EQ(1u, stats.TotalZones);
    EXPECT_EQ(1u, stats.NewZones);
    EXPECT_EQ(1u, stats.UnresolvedMembers);
    EXPECT_EQ(3u, classifier->Lookups);

    EXPECT_EQ(ROLE_TARGET, batch.Aliases[0].Candidate.Role);
    EXPECT_EQ(SYNTAX_DEVICE_ALIAS, batch.Aliases[0].Candidate.Syntax);

    UnmatchedMembers_t unmatched = batch.UnmatchedMembers();
    ASSERT_EQ(1u, unmatched.size());
    EXPECT_EQ("Z9", unmatched[0].ZoneName);
    EXPECT_EQ("switch.txt", unmatched[0].SourceName);
    EXPECT_EQ(UnresolvedKind::Pwwn, unmatched[0].Kind);
}

TEST_F(ImportOrchestratorTest, TechSupportDumpWithEverySectionKind)
{
    SourceDocuments_t documents;
    documents.push_back(Document("show-tech.txt",
        "`show version`\n"
        "Cisco Nexus Operating System (NX-OS) Software\n"
        "`show device-alias database`\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "\n"
        "Total number of entries = 1\n"
        "`show fcalias vsan 1-4093`\n"
        "fcalias name ARRAY2 vsan 10\n"
        "  pwwn 50:05:07:63:0a:08:57:e5\n"
        "\n"
        "`show zone vsan 10`\n"
        "zone name Z7 vsan 10\n"
        "  fcalias name ARRAY2 vsan 10\n"
        "    pwwn 50:05:07:63:0a:08:57:e5\n"
        "  pwwn 10:00:00:00:c9:2e:31:6a [HOST1]\n"
        "  pwwn 50:05:07:63:0a:08:57:e4 [STOR1]\n"
        "`show interface brief`\n"
        "fc1/1     10     auto   on      up\n"));

    ImportOrchestratorPtr orchestrator = MakeOrchestrator();
    ImportBatch batch;
    ASSERT_EQ(SIS_OK, orchestrator->Prepare(FABRIC, documents, batch));

    ASSERT_EQ(1u, batch.Documents.size());
    EXPECT_EQ(FORMAT_TECH_SUPPORT_DUMP, batch.Documents[0].Format);

    ASSERT_EQ(2u, batch.Aliases.size());
    EXPECT_EQ("HOST1", batch.Aliases[0].Candidate.Name);
    EXPECT_EQ(SYNTAX_DEVICE_ALIAS, batch.Aliases[0].Candidate.Syntax);
    EXPECT_EQ("ARRAY2", batch.Aliases[1].Candidate.Name);
    EXPECT_EQ("50:05:07:63:0a:08:57:e5", batch.Aliases[1].Candidate.Wwpn);
    EXPECT_EQ(SYNTAX_FCALIAS, batch.Aliases[1].Candidate.Syntax);
    EXPECT_EQ(1u, batch.Stats.DuplicatesRemoved);
    EXPECT_EQ(0u, batch.Stats.ConflictsResolved);

    ASSERT_EQ(1u, batch.Zones.size());
    const ZoneCandidate& zone = batch.Zones[0].Candidate;
    EXPECT_EQ("Z7", zone.Name);
    ASSERT_EQ(3u, zone.Members.size());
    EXPECT_TRUE(MemberRef(InBatchMember("ARRAY2")) == zone.Members[0]);
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == zone.Members[1]);
    EXPECT_TRUE(MemberRef(PersistedMember(m_stor1)) == zone.Members[2]);
    EXPECT_TRUE(zone.Unresolved.empty());

    SubmissionReport report;
    EXPECT_EQ(SIS_OK, orchestrator->Submit(batch, report));

    ASSERT_EQ(1u, m_backend->SubmittedAliases.size());
    EXPECT_EQ(2u, m_backend->SubmittedAliases[0].size());

    ASSERT_EQ(1u, m_backend->SubmittedZones.size());
    const std::vector<SanObjectId>& members = m_backend->SubmittedZones[0][0].Members;
    ASSERT_EQ(3u, members.size());
    EXPECT_EQ(m_backend->AliasId("ARRAY2"), members[0]);
    EXPECT_EQ(m_backend->AliasId("HOST1"), members[1]);
    EXPECT_EQ(m_stor1, members[2]);
}
