#include "ConfigParser.hpp"

#include "TempDirectory.hpp"

#include <gtest/gtest.h>

namespace {

class ConfigParserTest : public ::testing::Test {
protected:
    std::string writeConfig(const std::string& json) const {
        return m_work.writeFile("explode.json", json).string();
    }

    TempDirectory m_work;
    ConfigParser m_parser;
};

TEST_F(ConfigParserTest, LoadsAllKnownKeys) {
    const auto path = writeConfig(R"({"destination": "/srv/inbox", "verbose": true, "dry_run": true, "force": true})");

    ASSERT_TRUE(m_parser.load(path));

    const auto& defaults = m_parser.getDefaults();
    EXPECT_TRUE(m_parser.hasDestination());
    EXPECT_EQ(defaults.destination, "/srv/inbox");
    EXPECT_TRUE(defaults.verbose);
    EXPECT_TRUE(defaults.dryRun);
    EXPECT_TRUE(defaults.force);
}

TEST_F(ConfigParserTest, EmptyObjectKeepsDefaults) {
    ASSERT_TRUE(m_parser.load(writeConfig("{}")));

    const auto& defaults = m_parser.getDefaults();
    EXPECT_FALSE(m_parser.hasDestination());
    EXPECT_FALSE(defaults.verbose);
    EXPECT_FALSE(defaults.dryRun);
    EXPECT_FALSE(defaults.force);
}

TEST_F(ConfigParserTest, UnknownKeysAreIgnored) {
    ASSERT_TRUE(m_parser.load(writeConfig(R"({"verbose": true, "colour": "auto"})")));
    EXPECT_TRUE(m_parser.getDefaults().verbose);
}

TEST_F(ConfigParserTest, RejectsNonBooleanFlag) {
    EXPECT_FALSE(m_parser.load(writeConfig(R"({"force": "yes"})")));
    EXPECT_FALSE(m_parser.getDefaults().force);
}

TEST_F(ConfigParserTest, RejectsEmptyDestination) {
    EXPECT_FALSE(m_parser.load(writeConfig(R"({"destination": ""})")));
}

TEST_F(ConfigParserTest, RejectsNonStringDestination) {
    EXPECT_FALSE(m_parser.load(writeConfig(R"({"destination": 42})")));
}

TEST_F(ConfigParserTest, RejectsMalformedJson) {
    EXPECT_FALSE(m_parser.load(writeConfig(R"({"verbose": tru)")));
}

TEST_F(ConfigParserTest, RejectsNonObjectDocument) {
    EXPECT_FALSE(m_parser.load(writeConfig("[true, false]")));
}

TEST_F(ConfigParserTest, MissingFileFails) {
    EXPECT_FALSE(m_parser.load((m_work.path() / "absent.json").string()));
}

TEST_F(ConfigParserTest, FailedLoadKeepsPreviousDefaults) {
    ASSERT_TRUE(m_parser.load(writeConfig(R"({"destination": "/srv/inbox", "verbose": true})")));
    EXPECT_FALSE(m_parser.load(writeConfig(R"({"verbose": 1})")));

    EXPECT_EQ(m_parser.getDefaults().destination, "/srv/inbox");
    EXPECT_TRUE(m_parser.getDefaults().verbose);
}

} // namespace
