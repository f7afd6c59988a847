// PYTHCLIENT - Configuration File Parser Tests
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include <gtest/gtest.h>

#include "pythclient/util/config.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace pythclient {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/pythclient_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Config File Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0);
}

TEST_F(ConfigTest, ParseCommentsAndBlankLines) {
    std::string content = R"(
# comment
; also a comment

snapshot=mainnet.json
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1);
    EXPECT_EQ(config_.GetString(ConfigKeys::SNAPSHOT, ""), "mainnet.json");
}

TEST_F(ConfigTest, TrimsKeysAndValues) {
    auto result = config_.ParseString("  loglevel  =  debug  \n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseQuotedValues) {
    std::string content = R"(
a="value with spaces"
b='single quoted'
c="with \"escaped\" quotes"
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("a", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("b", ""), "single quoted");
    EXPECT_EQ(config_.GetString("c", ""), "with \"escaped\" quotes");
}

TEST_F(ConfigTest, BareAndNegatedFlags) {
    ASSERT_TRUE(config_.ParseString("color\nnoprices\n").success);
    EXPECT_TRUE(config_.GetBool("color", false));
    EXPECT_FALSE(config_.GetBool("prices", true));
}

TEST_F(ConfigTest, Sections) {
    std::string content = R"(
format=text
[devnet]
format=json
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("format", ""), "text");
    EXPECT_EQ(config_.GetString("format", "", "devnet"), "json");
    EXPECT_FALSE(config_.HasKey("format", "testnet"));
}

TEST_F(ConfigTest, UnterminatedSectionIsError) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    EXPECT_FALSE(config_.ParseString("bad key=1").success);
    EXPECT_FALSE(config_.ParseString("=1").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH, 'x');
    EXPECT_FALSE(config_.ParseString(content).success);
}

TEST_F(ConfigTest, EntriesRememberTheirSource) {
    ASSERT_TRUE(config_.ParseString("\nmapping=abc\n", "oracle.conf").success);
    auto entry = config_.GetEntry("mapping");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, "oracle.conf");
    EXPECT_EQ(entry->lineNumber, 2);
    EXPECT_FALSE(entry->isDefault);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.GetInt("a", 0), 42);
    EXPECT_EQ(config_.GetInt("b", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 5), 5);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, SetAndSetDefault) {
    config_.SetDefault("format", "text");
    EXPECT_EQ(config_.GetString("format", ""), "text");
    EXPECT_TRUE(config_.GetEntry("format")->isDefault);

    config_.Set("format", "json");
    config_.SetDefault("format", "text");
    EXPECT_EQ(config_.GetString("format", ""), "json");

    config_.Clear();
    EXPECT_EQ(config_.Size(), 0);
}

// ============================================================================
// Files and Command Line
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("snapshot=/data/snap.json\nloglevel=info\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString(ConfigKeys::SNAPSHOT, ""), "/data/snap.json");
    EXPECT_EQ(config_.GetEntry(ConfigKeys::LOGLEVEL)->source, path);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/pythclient.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConfigTest, ParseCommandLineForms) {
    const char* argv[] = {"pyth-dump", "-snapshot=snap.json", "--mapping", "KEY",
                          "-nocolor", "-help", "extra"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("snapshot", ""), "snap.json");
    EXPECT_EQ(config_.GetString("mapping", ""), "KEY");
    EXPECT_FALSE(config_.GetBool("color", true));
    EXPECT_EQ(config_.GetString("help", ""), "extra");
}

TEST_F(ConfigTest, FlagFollowedByOptionIsBoolean) {
    const char* argv[] = {"pyth-dump", "-help", "-prices=0", "positional"};
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);

    EXPECT_TRUE(config_.GetBool("help", false));
    EXPECT_FALSE(config_.GetBool("prices", true));
    ASSERT_EQ(config_.Positional().size(), 1);
    EXPECT_EQ(config_.Positional()[0], "positional");
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    std::string path = CreateTempFile("loglevel=info\nformat=text\n");
    ASSERT_TRUE(config_.ParseFile(path).success);

    const char* argv[] = {"pyth-dump", "-loglevel=debug"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);

    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "debug");
    EXPECT_EQ(config_.GetString(ConfigKeys::FORMAT, ""), "text");
    EXPECT_EQ(config_.GetEntry(ConfigKeys::LOGLEVEL)->source, "<command-line>");
}

TEST_F(ConfigTest, InvalidCommandLineOption) {
    const char* argv[] = {"pyth-dump", "-bad!key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

} // namespace test
} // namespace util
} // namespace pythclient
