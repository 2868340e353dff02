#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

#include "WwpnPrefixClassifier.h"

using namespace SanImportLib;

namespace
{
    class TempFile
    {
    public:
        TempFile(const std::string& extension, const std::string& contents)
            : m_path(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("siprefix-%%%%-%%%%" + extension))
        {
            std::ofstream file(m_path.string().c_str());
            file << contents;
        }

        ~TempFile()
        {
            boost::system::error_code ec;
            boost::filesystem::remove(m_path, ec);
        }

        std::string Path() const { return m_path.string(); }

    private:
        boost::filesystem::path m_path;
    };
}

TEST(WwpnPrefixClassifierTest, AddRuleValidatesPrefixAndType)
{
    WwpnPrefixClassifier classifier;

    EXPECT_TRUE(classifier.AddRule("C050", "init", "Cisco"));
    EXPECT_TRUE(classifier.AddRule("5005", "target"));
    EXPECT_FALSE(classifier.AddRule("50050", "target"));
    EXPECT_FALSE(classifier.AddRule("zz05", "target"));
    EXPECT_FALSE(classifier.AddRule("2100", "pending"));
    EXPECT_EQ(2u, classifier.RuleCount());
}

TEST(WwpnPrefixClassifierTest, ClassifyByFirstFourDigits)
{
    WwpnPrefixClassifier classifier;
    classifier.AddRule("c050", "init");
    classifier.AddRule("5005", "both");

    AliasRole role = ROLE_PENDING_CLASSIFICATION;
    EXPECT_EQ(SIS_OK, classifier.Classify("C0:50:76:01:02:03:04:05", role));
    EXPECT_EQ(ROLE_INITIATOR, role);

    EXPECT_EQ(SIS_OK, classifier.Classify("500507630a0317e4", role));
    EXPECT_EQ(ROLE_BOTH, role);

    EXPECT_EQ(SIS_FALSE, classifier.Classify("21:00:00:24:ff:01:02:03", role));
    EXPECT_EQ(SIE_INVALIDARG, classifier.Classify("21:00", role));
}

TEST(WwpnPrefixClassifierTest, LoadFromJson)
{
    WwpnPrefixClassifier bare;
    EXPECT_EQ(SIS_OK, bare.LoadFromJson(
        "[{\"prefix\": \"c050\", \"wwpn_type\": \"init\", \"vendor\": \"Cisco\"},"
        " {\"prefix\": \"5005\", \"wwpn_type\": \"target\"}]"));
    EXPECT_EQ(2u, bare.RuleCount());

    WwpnPrefixClassifier paged;
    EXPECT_EQ(SIS_OK, paged.LoadFromJson(
        "{\"count\": 2, \"results\": [{\"prefix\": \"2100\", \"wwpn_type\": \"init\"},"
        " {\"prefix\": \"bad\", \"wwpn_type\": \"init\"}]}"));
    EXPECT_EQ(1u, paged.RuleCount());

    WwpnPrefixClassifier invalid;
    EXPECT_EQ(SIE_INVALID_FORMAT, invalid.LoadFromJson("[{"));
}

TEST(WwpnPrefixClassifierTest, LoadFromIniFile)
{
    TempFile file(".ini",
        "[prefixes]\n"
        "c050=init,Cisco\n"
        "5005=target\n"
        "2100=both , QLogic\n");

    WwpnPrefixClassifier classifier;
    ASSERT_EQ(SIS_OK, classifier.LoadFromFile(file.Path()));
    EXPECT_EQ(3u, classifier.RuleCount());

    AliasRole role = ROLE_PENDING_CLASSIFICATION;
    EXPECT_EQ(SIS_OK, classifier.Classify("21:00:00:24:ff:01:02:03", role));
    EXPECT_EQ(ROLE_BOTH, role);
}

TEST(WwpnPrefixClassifierTest, LoadFromJsonFile)
{
    TempFile file(".json", "[{\"prefix\": \"5005\", \"wwpn_type\": \"target\"}]");

    WwpnPrefixClassifier classifier;
    ASSERT_EQ(SIS_OK, classifier.LoadFromFile(file.Path()));
    EXPECT_EQ(1u, classifier.RuleCount());
}

TEST(WwpnPrefixClassifierTest, MissingFile)
{
    WwpnPrefixClassifier classifier;
    EXPECT_EQ(SIE_FILE_NOT_FOUND, classifier.LoadFromFile("/nonexistent/prefixes.ini"));
}
