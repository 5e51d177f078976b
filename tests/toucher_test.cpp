#include <gtest/gtest.h>

#include "operations/toucher.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

using namespace Storify;
using namespace Storify::Operations;

class ToucherTest : public ::testing::Test
{
    protected:
    void SetUp() override { Testing::QuietLogs(); }

    Storage::MemoryObjectStore store_;
};

TEST_F(ToucherTest, CreatesEmptyObject)
{
    Toucher toucher(store_);
    auto outcome = toucher.Touch("new", {});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Created);
    EXPECT_EQ(store_.GetString("new"), "");
}

TEST_F(ToucherTest, ExistingObjectIsLeftAlone)
{
    store_.PutString("obj", "keep me");
    Toucher toucher(store_);

    auto outcome = toucher.Touch("obj", {});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Untouched);
    EXPECT_EQ(store_.GetString("obj"), "keep me");
    EXPECT_EQ(store_.WriteCount(), 0u);
}

TEST_F(ToucherTest, TruncateEmptiesExistingObject)
{
    store_.PutString("obj", "drop me");
    Toucher toucher(store_);

    TouchOptions options;
    options.truncate = true;
    auto outcome     = toucher.Touch("obj", options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Truncated);
    EXPECT_EQ(store_.GetString("obj"), "");
}

TEST_F(ToucherTest, NoCreateSkipsMissing)
{
    Toucher toucher(store_);
    TouchOptions options;
    options.no_create = true;

    auto outcome = toucher.Touch("new", options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Skipped);
    EXPECT_FALSE(store_.Contains("new"));
}

TEST_F(ToucherTest, ParentsCreatesDirectories)
{
    Storage::MemoryObjectStore store({.require_parent_for_write = true});
    Toucher toucher(store);

    ASSERT_FALSE(toucher.Touch("a/b/c", {}).has_value());

    TouchOptions options;
    options.parents = true;
    auto outcome    = toucher.Touch("a/b/c", options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Created);
}

TEST_F(ToucherTest, ParentCreationFailureIsNotFatal)
{
    Testing::InterferingObjectStore store(store_);
    store.FailCreateParent(make_error_code(Storage::StorageErrc::PermissionDenied));
    Toucher toucher(store);

    TouchOptions options;
    options.parents = true;
    auto outcome    = toucher.Touch("a/b/c", options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, TouchOutcome::Created);
    EXPECT_TRUE(store_.Contains("a/b/c"));
}

TEST_F(ToucherTest, WriteErrorWinsOverParentError)
{
    Storage::MemoryObjectStore strict({.require_parent_for_write = true});
    Testing::InterferingObjectStore store(strict);
    store.FailCreateParent(make_error_code(Storage::StorageErrc::PermissionDenied));
    Toucher toucher(store);

    TouchOptions options;
    options.parents = true;
    auto res        = toucher.Touch("a/b/c", options);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(Storage::IsErrc(res.error(), Storage::StorageErrc::NotFound));
}

TEST_F(ToucherTest, RejectsDirectoriesAndTrailingSlash)
{
    store_.PutString("dir/x", "1");
    Toucher toucher(store_);

    auto dir = toucher.Touch("dir", {});
    ASSERT_FALSE(dir.has_value());
    EXPECT_TRUE(Storage::IsErrc(dir.error(), Storage::StorageErrc::IsADirectory));

    auto slash = toucher.Touch("dir/", {});
    ASSERT_FALSE(slash.has_value());
    EXPECT_TRUE(Storage::IsErrc(slash.error(), Storage::StorageErrc::InvalidArgument));
}
