#include <gtest/gtest.h>

#include "SectionExtractor.h"
#include "SanImportUtils.h"

using namespace SanImportLib;

namespace
{
    const char DUMP[] =
        "----- show version\n"
        "Cisco Nexus Operating System (NX-OS) Software\n"
        "----- show device-alias database\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "device-alias name STOR1 pwwn 50:05:07:63:0a:08:57:e4\n"
        "\n"
        "Total number of entries = 2\n"
        "----- show zoneset vsan 10\n"
        "zoneset name ZS1 vsan 10\n"
        "  zone name Z1 vsan 10\n"
        "    pwwn 10:00:00:00:c9:2e:31:6a [HOST1]\n"
        "----- show interface brief\n"
        "fc1/1     10     auto   on      up\n";
}

TEST(SectionExtractorTest, SplitsDeviceAliasAndZoneSections)
{
    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(DUMP), sections);

    ASSERT_EQ(2u, sections.Sections.size());
    EXPECT_FALSE(sections.UsedFallback);

    const TextSection& aliases = sections.Sections[0];
    EXPECT_EQ(SECTION_DEVICE_ALIAS, aliases.Kind);
    ASSERT_EQ(3u, aliases.Lines.size());
    EXPECT_EQ(4u, aliases.Lines[0].Number);
    EXPECT_FALSE(aliases.Vsan);

    const TextSection& zones = sections.Sections[1];
    EXPECT_EQ(SECTION_ZONE, zones.Kind);
    ASSERT_TRUE(zones.Vsan);
    EXPECT_EQ(10, *zones.Vsan);
    EXPECT_EQ(3u, zones.Lines.size());
}

TEST(SectionExtractorTest, ZoneSectionsFeedBothExtractors)
{
    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(DUMP), sections);

    EXPECT_EQ(2u, sections.AliasSections().size());
    ASSERT_EQ(1u, sections.ZoneSections().size());
    EXPECT_EQ(SECTION_ZONE, sections.ZoneSections()[0]->Kind);
}

TEST(SectionExtractorTest, ThreeBlankLinesCloseTheDeviceAliasSection)
{
    const char text[] =
        "`show device-alias database`\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "\n"
        "\n"
        "\n"
        "device-alias name LATE pwwn 10:00:00:00:c9:2e:31:6b\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    ASSERT_EQ(1u, sections.Sections.size());
    ASSERT_EQ(1u, sections.Sections[0].Lines.size());
    EXPECT_EQ(2u, sections.Sections[0].Lines[0].Number);
}

TEST(SectionExtractorTest, DividerClosesTheSection)
{
    const char text[] =
        "----- show zone\n"
        "zone name Z1 vsan 10\n"
        "  member device-alias HOST1\n"
        "----------------------------------------\n"
        "zone name NOT_IN_SECTION vsan 10\n";

    ExtractedSections sections;
    SectionExtractor(40).Extract(SplitLines(text), sections);

    ASSERT_EQ(1u, sections.Sections.size());
    EXPECT_EQ(2u, sections.Sections[0].Lines.size());
}

TEST(SectionExtractorTest, ZoneDatabaseMarkerOpensAZoneSection)
{
    const char text[] =
        "some diagnostic output\n"
        "!Full Zone Database Section for vsan 20\n"
        "zone name Z2 vsan 20\n"
        "  member pwwn 10:00:00:00:c9:2e:31:6a\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    ASSERT_EQ(1u, sections.Sections.size());
    EXPECT_EQ(SECTION_ZONE, sections.Sections[0].Kind);
    ASSERT_TRUE(sections.Sections[0].Vsan);
    EXPECT_EQ(20, *sections.Sections[0].Vsan);
}

TEST(SectionExtractorTest, RepeatedDeviceAliasBannerIsIgnored)
{
    const char text[] =
        "----- show device-alias database\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "----- show device-alias database\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    ASSERT_EQ(1u, sections.Sections.size());
    EXPECT_EQ(1u, sections.Sections[0].Lines.size());
}

TEST(SectionExtractorTest, FallsBackToMatchingLinesWithoutSections)
{
    const char text[] =
        "----- show version\n"
        "device-alias name ORPHAN pwwn 10:00:00:00:c9:2e:31:6b\n"
        "uptime 10 days\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    EXPECT_TRUE(sections.UsedFallback);
    ASSERT_EQ(1u, sections.Sections.size());
    EXPECT_EQ(SECTION_FALLBACK, sections.Sections[0].Kind);
    EXPECT_EQ(2u, sections.Sections[0].Lines[0].Number);
}

TEST(SectionExtractorTest, NoSyntaxAnywhereGivesNoSections)
{
    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines("----- show version\nuptime 10 days\n"), sections);

    EXPECT_TRUE(sections.Sections.empty());
    EXPECT_FALSE(sections.UsedFallback);
}

TEST(SectionExtractorTest, FcaliasSectionFeedsOnlyTheAliasExtractor)
{
    const char text[] =
        "`show device-alias database`\n"
        "device-alias name HOST1 pwwn 10:00:00:00:c9:2e:31:6a\n"
        "`show fcalias vsan 1-4093`\n"
        "fcalias name STOR1 vsan 10\n"
        "  pwwn 50:05:07:63:0a:08:57:e4\n"
        "`show zone vsan 10`\n"
        "zone name Z1 vsan 10\n"
        "  pwwn 10:00:00:00:c9:2e:31:6a [HOST1]\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    ASSERT_EQ(3u, sections.Sections.size());
    EXPECT_FALSE(sections.UsedFallback);
    EXPECT_EQ(SECTION_DEVICE_ALIAS, sections.Sections[0].Kind);

    const TextSection& fcaliases = sections.Sections[1];
    EXPECT_EQ(SECTION_FCALIAS, fcaliases.Kind);
    ASSERT_EQ(2u, fcaliases.Lines.size());
    EXPECT_EQ(4u, fcaliases.Lines[0].Number);
    EXPECT_FALSE(fcaliases.Vsan);

    EXPECT_EQ(SECTION_ZONE, sections.Sections[2].Kind);

    EXPECT_EQ(3u, sections.AliasSections().size());
    ASSERT_EQ(1u, sections.ZoneSections().size());
    EXPECT_EQ(SECTION_ZONE, sections.ZoneSections()[0]->Kind);
}

TEST(SectionExtractorTest, FcaliasBannerNamingOneVsan)
{
    const char text[] =
        "switch1# show fcalias vsan 20\n"
        "fcalias name STOR1 vsan 20\n"
        "  pwwn 50:05:07:63:0a:08:57:e4\n";

    ExtractedSections sections;
    SectionExtractor().Extract(SplitLines(text), sections);

    ASSERT_EQ(1u, sections.Sections.size());
    EXPECT_EQ(SECTION_FCALIAS, sections.Sections[0].Kind);
    ASSERT_TRUE(sections.Sections[0].Vsan);
    EXPECT_EQ(20, *sections.Sections[0].Vsan);
}
