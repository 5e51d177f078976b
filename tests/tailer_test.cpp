#include <gtest/gtest.h>

#include "operations/tailer.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

#include <sstream>

using namespace Storify;
using namespace Storify::Operations;
using Storify::Testing::NumberedLines;

class TailerTest : public ::testing::Test
{
    protected:
    void SetUp() override { Testing::QuietLogs(); }

    std::string TailOf(
        Storage::MemoryObjectStore& store, const std::string& content, ReadMode mode,
        std::size_t window = 8 * 1024
    )
    {
        store.PutString("obj", content);
        Tailer tailer(store, window);
        std::ostringstream out;
        auto res = tailer.Tail("obj", mode, out);
        EXPECT_TRUE(res.has_value());
        return out.str();
    }

    Storage::MemoryObjectStore store_;
};

TEST_F(TailerTest, LastTenLinesOfLongerObject)
{
    EXPECT_EQ(TailOf(store_, NumberedLines(1, 25), ReadMode::Lines(10)), NumberedLines(16, 25));
}

TEST_F(TailerTest, LastTwoLinesWithTrailingNewline)
{
    EXPECT_EQ(TailOf(store_, "A\nB\nC\nD\nE\n", ReadMode::Lines(2)), "D\nE\n");
}

TEST_F(TailerTest, LastLinesWithoutTrailingNewline)
{
    EXPECT_EQ(TailOf(store_, "A\nB\nC", ReadMode::Lines(2)), "B\nC");
}

TEST_F(TailerTest, MoreLinesThanObjectHolds)
{
    EXPECT_EQ(TailOf(store_, "A\nB\n", ReadMode::Lines(10)), "A\nB\n");
}

TEST_F(TailerTest, SingleLineWithoutNewline)
{
    EXPECT_EQ(TailOf(store_, "lonely", ReadMode::Lines(1)), "lonely");
}

TEST_F(TailerTest, EmptyLinesCount)
{
    EXPECT_EQ(TailOf(store_, "A\n\n\nB\n", ReadMode::Lines(3)), "\n\nB\n");
}

TEST_F(TailerTest, SmallWindowCrossesManyBoundaries)
{
    EXPECT_EQ(
        TailOf(store_, NumberedLines(1, 200), ReadMode::Lines(7), 5), NumberedLines(194, 200)
    );
}

TEST_F(TailerTest, ReadsOnlyTheTailOfLargeObject)
{
    const std::string content = NumberedLines(1, 100000);
    TailOf(store_, content, ReadMode::Lines(3), 1024);
    // Last byte probe, one backward window, one final range read.
    EXPECT_EQ(store_.ReadCount(), 3u);
}

TEST_F(TailerTest, ZeroLinesReadsNothing)
{
    EXPECT_EQ(TailOf(store_, NumberedLines(1, 5), ReadMode::Lines(0)), "");
    EXPECT_EQ(store_.ReadCount(), 0u);
}

TEST_F(TailerTest, ByteModeReturnsSuffix)
{
    EXPECT_EQ(TailOf(store_, "0123456789", ReadMode::Bytes(3)), "789");
}

TEST_F(TailerTest, ByteModeLargerThanObject)
{
    EXPECT_EQ(TailOf(store_, "abc", ReadMode::Bytes(10)), "abc");
}

TEST_F(TailerTest, ZeroBytes)
{
    EXPECT_EQ(TailOf(store_, "abc", ReadMode::Bytes(0)), "");
}

TEST_F(TailerTest, EmptyObject)
{
    EXPECT_EQ(TailOf(store_, "", ReadMode::Lines(5)), "");
    EXPECT_EQ(TailOf(store_, "", ReadMode::Bytes(5)), "");
}

TEST_F(TailerTest, UnknownSizeFallsBackToForwardScan)
{
    Storage::MemoryObjectStore store({.report_size = false});
    EXPECT_EQ(TailOf(store, NumberedLines(1, 40), ReadMode::Lines(4), 16), NumberedLines(37, 40));
}

TEST_F(TailerTest, UnknownSizeByteMode)
{
    Storage::MemoryObjectStore store({.report_size = false, .range_error_past_eof = true});
    EXPECT_EQ(TailOf(store, "0123456789abcdef", ReadMode::Bytes(5), 4), "bcdef");
}

TEST_F(TailerTest, MissingObject)
{
    Tailer tailer(store_);
    std::ostringstream out;
    auto res = tailer.Tail("missing", ReadMode::Lines(1), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(Storage::Classify(res.error()), Storage::ErrorKind::NotFound);
}

TEST_F(TailerTest, ManyPathsWithHeaders)
{
    store_.PutString("a", "a1\na2\n");
    store_.PutString("b", "b1\nb2\n");
    Tailer tailer(store_);
    std::ostringstream out;
    std::ostringstream err;

    auto report = tailer.TailMany({"a", "b"}, 1, std::nullopt, {}, out, err);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(out.str(), "==> a <==\na2\n\n==> b <==\nb2\n");
}

TEST_F(TailerTest, ManyPathsReportFailuresOnStderr)
{
    store_.PutString("a", "a1\n");
    Tailer tailer(store_);
    std::ostringstream out;
    std::ostringstream err;

    auto report = tailer.TailMany({"a", "gone"}, std::nullopt, 2, {}, out, err);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->succeeded, 1u);
    EXPECT_EQ(report->failed, 1u);
    EXPECT_EQ(err.str(), "storify: tail 'gone': Path not found\n");
}
