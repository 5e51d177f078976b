#include <gtest/gtest.h>

#include "operations/greper.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

#include <sstream>

using namespace Storify;
using namespace Storify::Operations;

class GreperTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        Testing::QuietLogs();
        store_.PutString("notes.txt", "first\nsecond\nthird\n");
    }

    std::string GrepOutput(const std::string& path, const std::string& pattern, GrepOptions options)
    {
        Greper greper(store_, 4);
        std::ostringstream out;
        auto res = greper.GrepPath(path, pattern, options, out);
        EXPECT_TRUE(res.has_value());
        return out.str();
    }

    Storage::MemoryObjectStore store_;
};

TEST_F(GreperTest, PrintsMatchingLines)
{
    EXPECT_EQ(GrepOutput("notes.txt", "ir", {}), "first\nthird\n");
}

TEST_F(GreperTest, LineNumbers)
{
    GrepOptions options;
    options.line_number = true;
    EXPECT_EQ(GrepOutput("notes.txt", "second", options), "2:second\n");
}

TEST_F(GreperTest, ReturnsMatchCount)
{
    Greper greper(store_);
    std::ostringstream out;
    auto count = greper.Grep("notes.txt", "d", {}, out);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
}

TEST_F(GreperTest, NoMatchIsNotAnError)
{
    Greper greper(store_);
    std::ostringstream out;
    auto count = greper.Grep("notes.txt", "absent", {}, out);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(GreperTest, CaseSensitiveByDefault)
{
    store_.PutString("mixed", "Error one\nerror two\nERROR three\n");
    EXPECT_EQ(GrepOutput("mixed", "error", {}), "error two\n");
}

TEST_F(GreperTest, IgnoreCaseAscii)
{
    store_.PutString("mixed", "Error one\nerror two\nERROR three\nfine\n");
    GrepOptions options;
    options.ignore_case = true;
    EXPECT_EQ(GrepOutput("mixed", "ErRoR", options), "Error one\nerror two\nERROR three\n");
}

TEST_F(GreperTest, IgnoreCaseNonAscii)
{
    store_.PutString("utf8", "\xC3\x84pfel\nBirnen\n\xCE\xA3\xCE\x9F\xCE\xA6\xCE\x99\xCE\x91\n");
    GrepOptions options;
    options.ignore_case = true;
    // "äpfel" against "Äpfel"
    EXPECT_EQ(GrepOutput("utf8", "\xC3\xA4pfel", options), "\xC3\x84pfel\n");
    // "σοφ" against "ΣΟΦΙΑ"
    EXPECT_EQ(
        GrepOutput("utf8", "\xCF\x83\xCE\xBF\xCF\x86", options),
        "\xCE\xA3\xCE\x9F\xCE\xA6\xCE\x99\xCE\x91\n"
    );
}

TEST_F(GreperTest, CarriageReturnsAreStripped)
{
    store_.PutString("dos", "alpha\r\nbeta\r\n");
    EXPECT_EQ(GrepOutput("dos", "beta", {}), "beta\n");
}

TEST_F(GreperTest, FinalLineWithoutNewline)
{
    store_.PutString("tail", "one\nmatch-here");
    EXPECT_EQ(GrepOutput("tail", "match", {}), "match-here\n");
}

TEST_F(GreperTest, EmptyPatternMatchesEveryLine)
{
    EXPECT_EQ(GrepOutput("notes.txt", "", {}), "first\nsecond\nthird\n");
}

TEST_F(GreperTest, DirectoryWithoutRecursionIsRejected)
{
    store_.PutString("logs/a.log", "x\n");
    Greper greper(store_);
    std::ostringstream out;

    auto res = greper.GrepPath("logs", "x", {}, out);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsErrc(res.error(), Storage::StorageErrc::IsADirectory));
}

TEST_F(GreperTest, RecursivePrefixesFilenames)
{
    store_.PutString("logs/a.log", "boot ok\nfailure at 3\n");
    store_.PutString("logs/nested/b.log", "no failure\nall good\n");
    store_.PutString("other/c.log", "failure elsewhere\n");

    GrepOptions options;
    options.recursive   = true;
    options.line_number = true;
    EXPECT_EQ(
        GrepOutput("logs", "failure", options),
        "logs/a.log:2:failure at 3\nlogs/nested/b.log:1:no failure\n"
    );
}

TEST_F(GreperTest, RecursiveOnSingleObjectGrepsIt)
{
    GrepOptions options;
    options.recursive = true;
    EXPECT_EQ(GrepOutput("notes.txt", "third", options), "third\n");
}

TEST_F(GreperTest, MissingObject)
{
    Greper greper(store_);
    std::ostringstream out;
    auto res = greper.GrepPath("nope", "x", {}, out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(Storage::Classify(res.error()), Storage::ErrorKind::NotFound);
}

TEST(LineMatchesTest, AsciiFastPathAndFallbackAgree)
{
    EXPECT_TRUE(LineMatches("Hello World", "world", true));
    EXPECT_FALSE(LineMatches("Hello World", "world", false));
    EXPECT_FALSE(LineMatches("short", "much longer needle", true));
}

TEST(LineMatchesTest, Utf8ToLowerMapsCommonScripts)
{
    // Ä Ø Ł Ÿ
    EXPECT_EQ(
        Utf8ToLower("\xC3\x84\xC3\x98\xC5\x81\xC5\xB8"), "\xC3\xA4\xC3\xB8\xC5\x82\xC3\xBF"
    );
    // Ж Ё
    EXPECT_EQ(Utf8ToLower("\xD0\x96\xD0\x81"), "\xD0\xB6\xD1\x91");
    // ẞ -> ß, İ -> i
    EXPECT_EQ(Utf8ToLower("\xE1\xBA\x9E\xC4\xB0"), "\xC3\x9Fi");
    // × and already lower-case letters are unchanged
    EXPECT_EQ(Utf8ToLower("\xC3\x97\xC3\xA4\xC5\x82"), "\xC3\x97\xC3\xA4\xC5\x82");
}

TEST(LineMatchesTest, Utf8ToLowerReplacesInvalidBytes)
{
    EXPECT_EQ(Utf8ToLower("ABC"), "abc");
    EXPECT_EQ(Utf8ToLower("\xFF"), "\xEF\xBF\xBD");
}
