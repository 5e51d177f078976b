#include <gtest/gtest.h>

#include "cli/cli_app.hpp"
#include "storage/memory_object_store.hpp"
#include "test_utils.hpp"

#include <cstdlib>
#include <initializer_list>
#include <sstream>

using namespace Storify;

class CliAppTest : public ::testing::Test
{
    protected:
    void SetUp() override { Testing::QuietLogs(); }

    // Runs storify against the temp directory using the fs provider.
    int Run(std::initializer_list<std::string> args, const std::string& input = "")
    {
        std::vector<std::string> storage{"storify", "--provider", "fs", "--root",
                                         dir_.Path().string(), "--log-level", "off"};
        storage.insert(storage.end(), args.begin(), args.end());
        return RunWith(Storage::StoreFactory(), storage, input);
    }

    int RunWith(
        Storage::StoreFactory factory, const std::vector<std::string>& args,
        const std::string& input
    )
    {
        std::vector<const char*> argv;
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        out_.str("");
        err_.str("");
        std::istringstream in(input);

        Cli::CliApp app(std::move(factory));
        return app.Run(static_cast<int>(argv.size()), argv.data(), {in, out_, err_});
    }

    Testing::TempDir dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliAppTest, HeadDefaultsToTenLines)
{
    dir_.WriteFile("log.txt", Testing::NumberedLines(1, 25));
    EXPECT_EQ(Run({"head", "log.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), Testing::NumberedLines(1, 10));
}

TEST_F(CliAppTest, TailWithLineCount)
{
    dir_.WriteFile("log.txt", "A\nB\nC\nD\nE\n");
    EXPECT_EQ(Run({"tail", "-n", "2", "log.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "D\nE\n");
}

TEST_F(CliAppTest, TailBytes)
{
    dir_.WriteFile("log.txt", "0123456789");
    EXPECT_EQ(Run({"tail", "-c", "4", "log.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "6789");
}

TEST_F(CliAppTest, HeadRejectsLinesWithBytes)
{
    dir_.WriteFile("log.txt", "x\n");
    EXPECT_EQ(Run({"head", "-n", "1", "-c", "1", "log.txt"}), EXIT_FAILURE);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("cannot specify both --lines and --bytes"), std::string::npos);
}

TEST_F(CliAppTest, MultiplePathsSucceedUnlessAllFail)
{
    dir_.WriteFile("a", "a1\n");
    EXPECT_EQ(Run({"head", "a", "missing"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "==> a <==\na1\n\n==> missing <==\n");
    EXPECT_EQ(err_.str(), "storify: head 'missing': Path not found\n");

    EXPECT_EQ(Run({"tail", "gone", "missing"}), EXIT_FAILURE);
}

TEST_F(CliAppTest, GrepWithLineNumbers)
{
    dir_.WriteFile("notes.txt", "first\nsecond\nthird\n");
    EXPECT_EQ(Run({"grep", "-n", "second", "notes.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "2:second\n");
}

TEST_F(CliAppTest, GrepDirectoryNeedsRecursion)
{
    dir_.WriteFile("logs/a.log", "error here\n");
    dir_.WriteFile("logs/b.log", "fine\n");

    EXPECT_EQ(Run({"grep", "error", "logs"}), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("use -R to grep recursively"), std::string::npos);

    EXPECT_EQ(Run({"grep", "-R", "error", "logs"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "logs/a.log:error here\n");
}

TEST_F(CliAppTest, GrepWithoutMatchesStillSucceeds)
{
    dir_.WriteFile("notes.txt", "nothing\n");
    EXPECT_EQ(Run({"grep", "absent", "notes.txt"}), EXIT_SUCCESS);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliAppTest, AppendFromLocalFileAndStdin)
{
    dir_.WriteFile("log.txt", "start\n");
    auto src = dir_.WriteFile("local/extra.txt", "from file\n");

    EXPECT_EQ(Run({"append", "log.txt", "--src", src.string()}), EXIT_SUCCESS);
    EXPECT_EQ(Run({"append", "log.txt", "--stdin"}, "from stdin\n"), EXIT_SUCCESS);
    EXPECT_EQ(dir_.ReadFile("log.txt"), "start\nfrom file\nfrom stdin\n");
}

TEST_F(CliAppTest, AppendNeedsASource)
{
    EXPECT_EQ(Run({"append", "log.txt"}), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("one of --src or --stdin is required"), std::string::npos);
}

TEST_F(CliAppTest, AppendHonoursNoCreateAndParents)
{
    EXPECT_EQ(Run({"append", "new.txt", "--stdin", "--no-create"}, "x"), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("Path not found"), std::string::npos);

    EXPECT_EQ(Run({"append", "deep/dir/new.txt", "--stdin"}, "x"), EXIT_FAILURE);
    EXPECT_EQ(Run({"append", "deep/dir/new.txt", "--stdin", "--parents"}, "x"), EXIT_SUCCESS);
    EXPECT_EQ(dir_.ReadFile("deep/dir/new.txt"), "x");
}

TEST_F(CliAppTest, AppendSizePrecondition)
{
    dir_.WriteFile("log.txt", "12345");
    EXPECT_EQ(Run({"append", "log.txt", "--stdin", "--if-size", "3"}, "6"), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("Precondition failed"), std::string::npos);
    EXPECT_EQ(Run({"append", "log.txt", "--stdin", "--if-size", "5"}, "6"), EXIT_SUCCESS);
    EXPECT_EQ(dir_.ReadFile("log.txt"), "123456");
}

TEST_F(CliAppTest, TruncateReportsOutcome)
{
    dir_.WriteFile("data.bin", "0123456789");
    EXPECT_EQ(Run({"truncate", "data.bin", "-s", "4"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Truncated: data.bin -> 4\n");
    EXPECT_EQ(dir_.ReadFile("data.bin"), "0123");

    EXPECT_EQ(Run({"truncate", "fresh.bin", "--size", "2"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Created: fresh.bin (size 2)\n");

    EXPECT_EQ(Run({"truncate", "other.bin", "--no-create"}), EXIT_SUCCESS);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(std::filesystem::exists(dir_.Path() / "other.bin"));
}

TEST_F(CliAppTest, CatAndStat)
{
    dir_.WriteFile("doc.txt", "contents\n");
    EXPECT_EQ(Run({"cat", "doc.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "contents\n");

    EXPECT_EQ(Run({"stat", "doc.txt"}), EXIT_SUCCESS);
    EXPECT_NE(out_.str().find("type=file\nsize=9\n"), std::string::npos);

    EXPECT_EQ(Run({"stat", "--json", "doc.txt"}), EXIT_SUCCESS);
    EXPECT_NE(out_.str().find("\"size\":9"), std::string::npos);
}

TEST_F(CliAppTest, TouchCreatesAndTruncates)
{
    EXPECT_EQ(Run({"touch", "empty.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Created: empty.txt\n");

    dir_.WriteFile("full.txt", "data");
    EXPECT_EQ(Run({"touch", "full.txt"}), EXIT_SUCCESS);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(Run({"touch", "-t", "full.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Truncated: full.txt\n");
    EXPECT_EQ(dir_.ReadFile("full.txt"), "");
}

TEST_F(CliAppTest, MissingSubcommandIsAUsageError)
{
    EXPECT_NE(Run({}), EXIT_SUCCESS);
}

TEST_F(CliAppTest, UnknownProviderIsRejectedByParser)
{
    std::vector<std::string> args{"storify", "--provider", "ftp", "cat", "x"};
    EXPECT_NE(RunWith(Storage::StoreFactory(), args, ""), EXIT_SUCCESS);
}

TEST_F(CliAppTest, IncompleteProviderConfigurationIsReported)
{
    std::vector<std::string> args{"storify", "--provider", "hdfs", "--log-level", "off", "cat",
                                  "x"};
    // hdfs needs a name node, which only a config file can supply.
    EXPECT_EQ(RunWith(Storage::StoreFactory(), args, ""), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("config"), std::string::npos);
}

TEST_F(CliAppTest, BucketProviderWithoutBackendFailsToOpen)
{
    Testing::TempDir config_dir;
    auto config = config_dir.WriteFile(
        "storify.json", R"({"storage": {"provider": "s3", "bucket": "logs"}})"
    );
    std::vector<std::string> args{"storify", "--config", config.string(), "cat", "x"};
    EXPECT_EQ(RunWith(Storage::StoreFactory(), args, ""), EXIT_FAILURE);
    EXPECT_NE(err_.str().find("storify: open"), std::string::npos);
    EXPECT_NE(err_.str().find("Operation not supported"), std::string::npos);
}

TEST_F(CliAppTest, InjectedStoreIsUsed)
{
    Storage::MemoryObjectStore shared;
    shared.PutString("remote/log", "l1\nl2\nl3\n");

    Storage::StoreFactory factory;
    factory.Register(
        Config::ProviderType::Memory,
        [&shared](const Config::StorageDefinition&)
            -> Storage::StorageResult<std::unique_ptr<Storage::IObjectStore>> {
            return std::make_unique<Testing::InterferingObjectStore>(shared);
        }
    );

    std::vector<std::string> args{"storify", "--provider", "memory", "--log-level", "off",
                                  "tail", "-n", "1", "remote/log"};
    EXPECT_EQ(RunWith(std::move(factory), args, ""), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "l3\n");
}
