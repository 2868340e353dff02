#include <gtest/gtest.h>

#include "ZoneExtractor.h"
#include "SanImportUtils.h"
#include "SanImportConstants.h"

using namespace SanImportLib;

namespace
{
    AliasCandidate BatchAlias(const std::string& name, const std::string& wwpn)
    {
        AliasCandidate candidate;
        candidate.Name = name;
        candidate.Wwpn = wwpn;
        return candidate;
    }

    class ZoneExtractorTest : public ::testing::Test
    {
    protected:
        ZoneExtractorTest()
        {
            m_persisted.push_back(PersistedAlias(42, "STOR1", "50:05:07:63:0a:08:57:e4", 1));
            m_batch.push_back(BatchAlias("HOST1", "10:00:00:00:c9:2e:31:6a"));
        }

        ZoneCandidates_t Extract(const std::string& text,
            const ZoneDefaults& defaults = ZoneDefaults(),
            const boost::optional<int>& vsan = boost::optional<int>())
        {
            AliasLookup lookup(m_persisted, m_batch);
            ZoneCandidates_t zones;
            ZoneExtractor(defaults, 1).Extract(SplitLines(text), "zones.txt", vsan, lookup, zones);
            return zones;
        }

        PersistedAliases_t m_persisted;
        AliasCandidates_t m_batch;
    };
}

TEST_F(ZoneExtractorTest, ResolvesBatchAndPersistedMembers)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        " member device-alias HOST1\n"
        " member pwwn 50:05:07:63:0a:08:57:e4\n");

    ASSERT_EQ(1u, zones.size());
    const ZoneCandidate& zone = zones[0];
    EXPECT_EQ("Z1", zone.Name);
    EXPECT_EQ(1, zone.FabricId);
    ASSERT_TRUE(zone.Vsan);
    EXPECT_EQ(10, *zone.Vsan);
    EXPECT_EQ(ZONE_TYPE_STANDARD, zone.Type);

    ASSERT_EQ(2u, zone.Members.size());
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == zone.Members[0]);
    EXPECT_TRUE(MemberRef(PersistedMember(42)) == zone.Members[1]);
    EXPECT_TRUE(zone.Unresolved.empty());
}

TEST_F(ZoneExtractorTest, PersistedAliasWinsOverBatchAlias)
{
    m_batch.push_back(BatchAlias("STOR1", "50:05:07:63:0a:08:57:e4"));

    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        " member fcalias STOR1\n");

    ASSERT_EQ(1u, zones.size());
    ASSERT_EQ(1u, zones[0].Members.size());
    EXPECT_TRUE(MemberRef(PersistedMember(42)) == zones[0].Members[0]);
}

TEST_F(ZoneExtractorTest, UnmatchedTokensAreKeptAsUnresolved)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        " member device-alias GHOST\n"
        " member pwwn 21:00:00:24:ff:00:00:01\n"
        " member device-alias HOST1\n");

    ASSERT_EQ(1u, zones.size());
    const ZoneCandidate& zone = zones[0];
    ASSERT_EQ(1u, zone.Members.size());
    ASSERT_EQ(2u, zone.Unresolved.size());
    EXPECT_EQ(UnresolvedKind::DeviceAlias, zone.Unresolved[0].Kind);
    EXPECT_EQ("GHOST", zone.Unresolved[0].RawToken);
    EXPECT_EQ(2u, zone.Unresolved[0].OriginLine);
    EXPECT_EQ(UnresolvedKind::Pwwn, zone.Unresolved[1].Kind);
}

TEST_F(ZoneExtractorTest, FullyResolvedZoneHasNoUnresolvedEntries)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        " member fcalias STOR1\n"
        " member pwwn 50:05:07:63:0a:08:57:e4\n");

    ASSERT_EQ(1u, zones.size());
    EXPECT_EQ(1u, zones[0].Members.size());
    EXPECT_TRUE(zones[0].Unresolved.empty());
}

TEST_F(ZoneExtractorTest, DuplicateMembersAreCollapsed)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        " member device-alias HOST1\n"
        " member pwwn 10:00:00:00:c9:2e:31:6a\n"
        " member device-alias GHOST\n"
        " member device-alias GHOST\n");

    ASSERT_EQ(1u, zones.size());
    EXPECT_EQ(1u, zones[0].Members.size());
    EXPECT_EQ(1u, zones[0].Unresolved.size());
}

TEST_F(ZoneExtractorTest, ZonesetVsanIsInherited)
{
    ZoneCandidates_t zones = Extract(
        "zoneset name ZS1 vsan 30\n"
        "  zone name Z1\n"
        "    member device-alias HOST1\n"
        "  zone name Z2 vsan 40\n"
        "    member fcalias STOR1\n");

    ASSERT_EQ(2u, zones.size());
    EXPECT_EQ(30, *zones[0].Vsan);
    EXPECT_EQ(40, *zones[1].Vsan);
}

TEST_F(ZoneExtractorTest, AmbientVsanFromTheSection)
{
    ZoneCandidates_t zones = Extract("zone name Z1\n member device-alias HOST1\n", ZoneDefaults(), 50);

    ASSERT_EQ(1u, zones.size());
    ASSERT_TRUE(zones[0].Vsan);
    EXPECT_EQ(50, *zones[0].Vsan);
}

TEST_F(ZoneExtractorTest, ShowZoneOutputMembers)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        "  pwwn 10:00:00:00:c9:2e:31:6a [HOST1]\n"
        "  * fcid 0x010203 [pwwn 50:05:07:63:0a:08:57:e4] [STOR1]\n"
        "  * fcid 0x010204 [UNKNOWN_DEV]\n");

    ASSERT_EQ(1u, zones.size());
    const ZoneCandidate& zone = zones[0];
    ASSERT_EQ(2u, zone.Members.size());
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == zone.Members[0]);
    EXPECT_TRUE(MemberRef(PersistedMember(42)) == zone.Members[1]);
    ASSERT_EQ(1u, zone.Unresolved.size());
    EXPECT_EQ(UnresolvedKind::Fcid, zone.Unresolved[0].Kind);
    EXPECT_EQ("UNKNOWN_DEV", zone.Unresolved[0].RawToken);
}

TEST_F(ZoneExtractorTest, StandaloneDeviceAliasWithBracketedPwwn)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z1 vsan 10\n"
        "  device-alias RENAMED [pwwn 50:05:07:63:0a:08:57:e4]\n");

    ASSERT_EQ(1u, zones.size());
    ASSERT_EQ(1u, zones[0].Members.size());
    EXPECT_TRUE(MemberRef(PersistedMember(42)) == zones[0].Members[0]);
}

TEST_F(ZoneExtractorTest, InlineFcaliasExpansionIsOneMember)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z4 vsan 10\n"
        "  fcalias name STOR1 vsan 10\n"
        "    pwwn 50:05:07:63:0a:08:57:e4\n"
        "  pwwn 10:00:00:00:c9:2e:31:6a [HOST1]\n");

    ASSERT_EQ(1u, zones.size());
    ASSERT_EQ(2u, zones[0].Members.size());
    EXPECT_TRUE(MemberRef(PersistedMember(42)) == zones[0].Members[0]);
    EXPECT_TRUE(MemberRef(InBatchMember("HOST1")) == zones[0].Members[1]);
}

TEST_F(ZoneExtractorTest, FcaliasDefinitionEndsTheZone)
{
    ZoneCandidates_t zones = Extract(
        "zone name Z5 vsan 10\n"
        " member device-alias HOST1\n"
        "fcalias name OTHER vsan 10\n"
        " member pwwn 50:05:07:63:0a:08:57:e4\n");

    ASSERT_EQ(1u, zones.size());
    EXPECT_EQ(1u, zones[0].Members.size());
}

TEST_F(ZoneExtractorTest, RoleTaggedMemberMakesAPeerZone)
{
    ZoneCandidates_t zones = Extract(
        "zone name PZ vsan 10\n"
        " member pwwn 50:05:07:63:0a:08:57:e4 target\n"
        "zone name AZ vsan 10\n"
        " attribute peer-zone\n"
        " member device-alias HOST1\n"
        "zone name SZ vsan 10\n"
        " member device-alias HOST1\n");

    ASSERT_EQ(3u, zones.size());
    EXPECT_EQ(ZONE_TYPE_PEER, zones[0].Type);
    EXPECT_EQ(ZONE_TYPE_PEER, zones[1].Type);
    EXPECT_EQ(ZONE_TYPE_STANDARD, zones[2].Type);
}

TEST_F(ZoneExtractorTest, ForcedTypeModeAndDefaults)
{
    ZoneDefaults defaults;
    defaults.TypeMode = ZONE_TYPE_MODE_SMART;
    defaults.Create = true;
    defaults.Exists = true;

    ZoneCandidates_t zones = Extract(
        "zone name PZ vsan 10\n"
        " member pwwn 50:05:07:63:0a:08:57:e4 target\n", defaults);

    ASSERT_EQ(1u, zones.size());
    EXPECT_EQ(ZONE_TYPE_SMART, zones[0].Type);
    EXPECT_TRUE(zones[0].Create);
    EXPECT_TRUE(zones[0].Exists);
}

TEST(AliasLookupTest, ResolutionOrder)
{
    PersistedAliases_t persisted;
    persisted.push_back(PersistedAlias(1, "A", "10:00:00:00:00:00:00:01"));
    persisted.push_back(PersistedAlias(2, "A", "10:00:00:00:00:00:00:02"));

    AliasCandidates_t batch;
    AliasCandidate candidate;
    candidate.Name = "B";
    candidate.Wwpn = "10:00:00:00:00:00:00:03";
    batch.push_back(candidate);

    AliasLookup lookup(persisted, batch);

    EXPECT_TRUE(MemberRef(PersistedMember(1)) == *lookup.Resolve(std::string("A"), boost::optional<std::string>()));
    EXPECT_TRUE(MemberRef(PersistedMember(2)) ==
        *lookup.Resolve(boost::optional<std::string>(), std::string("10:00:00:00:00:00:00:02")));
    EXPECT_TRUE(MemberRef(InBatchMember("B")) ==
        *lookup.Resolve(std::string("X"), std::string("10:00:00:00:00:00:00:03")));
    EXPECT_FALSE(lookup.Resolve(std::string("X"), boost::optional<std::string>()));
}

TEST(AliasLookupTest, NamesMatchWhateverTheirCase)
{
    PersistedAliases_t persisted;
    persisted.push_back(PersistedAlias(5, "host1", "10:00:00:00:00:00:00:01"));

    AliasCandidates_t batch;
    AliasCandidate candidate;
    candidate.Name = "Array_B";
    candidate.Wwpn = "10:00:00:00:00:00:00:03";
    batch.push_back(candidate);

    AliasLookup lookup(persisted, batch);

    boost::optional<MemberRef> persistedMember = lookup.Resolve(std::string("HOST1"), boost::optional<std::string>());
    ASSERT_TRUE(persistedMember);
    EXPECT_TRUE(MemberRef(PersistedMember(5)) == *persistedMember);

    boost::optional<MemberRef> batchMember = lookup.Resolve(std::string("ARRAY_b"), boost::optional<std::string>());
    ASSERT_TRUE(batchMember);
    EXPECT_TRUE(MemberRef(InBatchMember("Array_B")) == *batchMember);
}
