#include <gtest/gtest.h>

#include "scanner/chunked_scanner.hpp"
#include "scanner/line_reader.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

using namespace Storify;
using namespace Storify::Scanner;
using Storify::Testing::NumberedLines;
using Storify::Testing::ToString;

class ChunkedScannerTest : public ::testing::Test
{
    protected:
    void SetUp() override { Testing::QuietLogs(); }

    std::vector<Window> Drain(ChunkedScanner& scanner)
    {
        std::vector<Window> windows;
        while (true) {
            auto next = scanner.Next();
            EXPECT_TRUE(next.has_value());
            if (!next || !next->has_value()) {
                break;
            }
            windows.push_back(std::move(next->value()));
        }
        return windows;
    }

    std::vector<Line> ReadAllLines(Storage::IObjectStore& store, const std::string& path,
                                   std::size_t window, std::uint64_t size)
    {
        LineReader reader(ChunkedScanner(store, path, window, Direction::Forward, size));
        std::vector<Line> lines;
        while (true) {
            auto line = reader.NextLine();
            EXPECT_TRUE(line.has_value());
            if (!line || !line->has_value()) {
                break;
            }
            lines.push_back(std::move(line->value()));
        }
        return lines;
    }

    Storage::MemoryObjectStore store_;
};

TEST_F(ChunkedScannerTest, ForwardWindowsCoverObjectInOrder)
{
    store_.PutString("obj", "0123456789");
    ChunkedScanner scanner(store_, "obj", 4, Direction::Forward, 10);

    auto windows = Drain(scanner);
    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(windows[0].offset, 0u);
    EXPECT_EQ(ToString(windows[0].bytes), "0123");
    EXPECT_EQ(windows[1].offset, 4u);
    EXPECT_EQ(ToString(windows[2].bytes), "89");
    EXPECT_TRUE(scanner.Exhausted());
}

TEST_F(ChunkedScannerTest, ForwardWithUnknownSizeStopsOnShortRead)
{
    store_.PutString("obj", "0123456789");
    ChunkedScanner scanner(store_, "obj", 4, Direction::Forward, 0);

    auto windows = Drain(scanner);
    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(ToString(windows[2].bytes), "89");
    // The short third window ends the scan; no read past EOF is issued.
    EXPECT_EQ(store_.ReadCount(), 3u);
}

TEST_F(ChunkedScannerTest, ForwardWithUnknownSizeTreatsRangeErrorAsEof)
{
    Storage::MemoryObjectStore strict({.report_size = false, .range_error_past_eof = true});
    strict.PutString("obj", "01234567");
    ChunkedScanner scanner(strict, "obj", 4, Direction::Forward, 0);

    auto windows = Drain(scanner);
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(ToString(windows[1].bytes), "4567");
}

TEST_F(ChunkedScannerTest, ForwardPropagatesMissingObject)
{
    ChunkedScanner scanner(store_, "missing", 4, Direction::Forward, 0);
    auto next = scanner.Next();
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(Storage::Classify(next.error()), Storage::ErrorKind::NotFound);
}

TEST_F(ChunkedScannerTest, BackwardWindowsWalkFromTheEnd)
{
    store_.PutString("obj", "0123456789");
    ChunkedScanner scanner(store_, "obj", 4, Direction::Backward, 10);

    auto windows = Drain(scanner);
    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(windows[0].offset, 6u);
    EXPECT_EQ(ToString(windows[0].bytes), "6789");
    EXPECT_EQ(ToString(windows[1].bytes), "2345");
    EXPECT_EQ(windows[2].offset, 0u);
    EXPECT_EQ(ToString(windows[2].bytes), "01");
}

TEST_F(ChunkedScannerTest, BackwardOnEmptyObjectYieldsNothing)
{
    store_.PutString("obj", "");
    ChunkedScanner scanner(store_, "obj", 4, Direction::Backward, 0);
    EXPECT_TRUE(Drain(scanner).empty());
    EXPECT_EQ(store_.ReadCount(), 0u);
}

TEST_F(ChunkedScannerTest, CollectTrailingNewlinesAcrossWindows)
{
    store_.PutString("obj", "A\nB\nC\nD\nE\n");
    auto offsets = CollectTrailingNewlines(store_, "obj", 10, 3, 3);
    ASSERT_TRUE(offsets.has_value());
    EXPECT_EQ(*offsets, (std::vector<std::uint64_t>{5, 7, 9}));
}

TEST_F(ChunkedScannerTest, CollectTrailingNewlinesReturnsWhatExists)
{
    store_.PutString("obj", "one\ntwo");
    auto offsets = CollectTrailingNewlines(store_, "obj", 7, 5, 2);
    ASSERT_TRUE(offsets.has_value());
    EXPECT_EQ(*offsets, (std::vector<std::uint64_t>{3}));
}

TEST_F(ChunkedScannerTest, CollectTrailingNewlinesStopsEarly)
{
    const std::string content = NumberedLines(1, 1000);
    store_.PutString("obj", content);
    auto offsets = CollectTrailingNewlines(store_, "obj", content.size(), 2, 64);
    ASSERT_TRUE(offsets.has_value());
    EXPECT_EQ(offsets->size(), 2u);
    EXPECT_EQ(store_.ReadCount(), 1u);
}

TEST_F(ChunkedScannerTest, LineReaderStitchesLinesAcrossWindows)
{
    store_.PutString("obj", "alpha\nbeta\ngamma\n");
    auto lines = ReadAllLines(store_, "obj", 3, 17);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].raw, "alpha\n");
    EXPECT_EQ(lines[1].raw, "beta\n");
    EXPECT_EQ(lines[2].Content(), "gamma");
    EXPECT_TRUE(lines[2].terminated);
}

TEST_F(ChunkedScannerTest, LineReaderEmitsFinalUnterminatedLine)
{
    store_.PutString("obj", "first\nlast");
    auto lines = ReadAllLines(store_, "obj", 4, 10);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].raw, "last");
    EXPECT_FALSE(lines[1].terminated);
}

TEST_F(ChunkedScannerTest, LineReaderStripsCarriageReturnFromContent)
{
    store_.PutString("obj", "dos\r\nunix\n");
    auto lines = ReadAllLines(store_, "obj", 2, 0);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].raw, "dos\r\n");
    EXPECT_EQ(lines[0].Content(), "dos");
    EXPECT_EQ(lines[1].Content(), "unix");
}

TEST_F(ChunkedScannerTest, LineReaderKeepsEmptyLines)
{
    store_.PutString("obj", "\n\nx\n");
    auto lines = ReadAllLines(store_, "obj", 1, 4);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].Content(), "");
    EXPECT_EQ(lines[1].Content(), "");
    EXPECT_EQ(lines[2].Content(), "x");
}

TEST_F(ChunkedScannerTest, LineReaderOnEmptyObject)
{
    store_.PutString("obj", "");
    EXPECT_TRUE(ReadAllLines(store_, "obj", 8, 0).empty());
}
