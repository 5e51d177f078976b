#include <gtest/gtest.h>

#include "operations/cater.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

#include <sstream>

using namespace Storify;
using namespace Storify::Operations;

class CaterTest : public ::testing::Test
{
    protected:
    void SetUp() override { Testing::QuietLogs(); }

    Storage::MemoryObjectStore store_;
    std::ostringstream out_;
};

TEST_F(CaterTest, StreamsWholeObjectInWindows)
{
    const std::string content = Testing::NumberedLines(1, 300);
    store_.PutString("obj", content);
    Cater cater(store_, 256);

    auto written = cater.Cat("obj", {}, out_);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, content.size());
    EXPECT_EQ(out_.str(), content);
    EXPECT_GT(store_.ReadCount(), 1u);
}

TEST_F(CaterTest, BinaryContentIsPreserved)
{
    const std::string content("a\0b\xff\r\n", 6);
    store_.PutString("bin", content);
    Cater cater(store_);

    ASSERT_TRUE(cater.Cat("bin", {}, out_).has_value());
    EXPECT_EQ(out_.str(), content);
}

TEST_F(CaterTest, EmptyObject)
{
    store_.PutString("empty", "");
    Cater cater(store_);

    auto written = cater.Cat("empty", {}, out_);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 0u);
}

TEST_F(CaterTest, SizeLimitRefusesBeforeReading)
{
    store_.PutString("big", std::string(3 * 1024 * 1024, 'x'));
    Cater cater(store_);

    CatOptions options;
    options.size_limit_mb = 2;
    auto res = cater.Cat("big", options, out_);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsErrc(res.error(), Storage::StorageErrc::SizeLimitExceeded));
    EXPECT_EQ(store_.ReadCount(), 0u);
    EXPECT_TRUE(out_.str().empty());

    options.force = true;
    ASSERT_TRUE(cater.Cat("big", options, out_).has_value());
    EXPECT_EQ(out_.str().size(), 3u * 1024u * 1024u);
}

TEST_F(CaterTest, SizeLimitAppliesWithoutReportedSize)
{
    Storage::MemoryObjectStore store({.report_size = false});
    store.PutString("big", std::string(3 * 1024 * 1024, 'x'));
    Cater cater(store, 512 * 1024);

    CatOptions options;
    options.size_limit_mb = 2;
    auto res = cater.Cat("big", options, out_);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsErrc(res.error(), Storage::StorageErrc::SizeLimitExceeded));
    EXPECT_LE(out_.str().size(), 2u * 1024u * 1024u);

    out_.str("");
    options.force = true;
    auto written  = cater.Cat("big", options, out_);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 3u * 1024u * 1024u);
}

TEST_F(CaterTest, DirectoryAndMissing)
{
    store_.PutString("dir/x", "1");
    Cater cater(store_);

    auto dir = cater.Cat("dir", {}, out_);
    ASSERT_FALSE(dir.has_value());
    EXPECT_TRUE(Storage::IsErrc(dir.error(), Storage::StorageErrc::IsADirectory));

    auto missing = cater.Cat("nope", {}, out_);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(Storage::Classify(missing.error()), Storage::ErrorKind::NotFound);
}
