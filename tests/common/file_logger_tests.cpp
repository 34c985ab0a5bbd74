#include <gtest/gtest.h>
#include "logging/file_logger.hpp"
#include "util/process.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

class FileLoggerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto dir = proc::MakeTempDir(fs::temp_directory_path(), "resync-log-");
        ASSERT_TRUE(dir.has_value()) << dir.error().message();
        dir_ = *dir;
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string Slurp(const fs::path &p)
    {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

} // namespace

TEST_F(FileLoggerTests, Smoke_WritesLinesInOrder)
{
    const auto path = dir_ / "run.log";
    {
        logging::FileLogger logger(path.string());
        ASSERT_TRUE(logger.OpenOk());
        logger.Start();
        for (int i = 0; i < 200; ++i) {
            EXPECT_TRUE(logger.Push("line " + std::to_string(i) + "\n"));
        }
        logger.Join();
        EXPECT_EQ(logger.Dropped(), 0u);
    }
    std::istringstream content(Slurp(path));
    std::string line;
    int n = 0;
    while (std::getline(content, line)) {
        EXPECT_EQ(line, "line " + std::to_string(n));
        ++n;
    }
    EXPECT_EQ(n, 200);
}

TEST_F(FileLoggerTests, Append_KeepsExistingContent)
{
    const auto path = dir_ / "run.log";
    {
        std::ofstream out(path);
        out << "previous run\n";
    }
    {
        logging::FileLogger logger(path.string());
        logger.Start();
        logger.Push("next run\n");
    }
    EXPECT_EQ(Slurp(path), "previous run\nnext run\n");
}

TEST_F(FileLoggerTests, LongLine_IsTruncatedWithNewline)
{
    const auto path = dir_ / "run.log";
    {
        logging::FileLogger logger(path.string());
        logger.Start();
        logger.Push(std::string(2 * logging::kLogLineCapacity, 'x') + "\n");
    }
    auto content = Slurp(path);
    ASSERT_EQ(content.size(), logging::kLogLineCapacity);
    EXPECT_EQ(content.back(), '\n');
    EXPECT_EQ(content.front(), 'x');
}

TEST_F(FileLoggerTests, FullQueue_DropsInsteadOfBlocking)
{
    const auto path = dir_ / "run.log";
    logging::FileLogger logger(path.string());
    // not started: nothing drains the queue
    std::size_t accepted = 0;
    for (std::size_t i = 0; i < logging::kLogQueueCapacity + 10; ++i) {
        if (logger.Push("x\n")) {
            ++accepted;
        }
    }
    EXPECT_LE(accepted, logging::kLogQueueCapacity);
    EXPECT_GE(logger.Dropped(), 10u);
}

TEST_F(FileLoggerTests, OpenFailure_IsReported)
{
    logging::FileLogger logger((dir_ / "missing" / "run.log").string());
    EXPECT_FALSE(logger.OpenOk());
}
