#include <gtest/gtest.h>
#include "resources/office_driver.hpp"
#include "resources/resource_sync_worker.hpp"
#include "support/log_capture.hpp"
#include "util/process.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stop_token>
#include <string>
#include <system_error>

using namespace resources;
using resync_test::LogCapture;

namespace {

// Stands in for soffice: copies the document named last into --outdir and
// marks the copy as refreshed.
const char *kConverterScript = R"SH(#!/bin/sh
outdir=""
doc=""
while [ $# -gt 0 ]; do
  case "$1" in
    --outdir) outdir="$2"; shift ;;
    *) doc="$1" ;;
  esac
  shift
done
[ -n "$outdir" ] || exit 3
cp "$doc" "$outdir/" || exit 4
echo "refreshed" >> "$outdir/$(basename "$doc")"
)SH";

class OfficeDriverTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto dir = proc::MakeTempDir(fs::temp_directory_path(), "resync-office-");
        ASSERT_TRUE(dir.has_value()) << dir.error().message();
        dir_ = *dir;
        converter_ = dir_ / "fake-soffice";
        std::ofstream(converter_) << kConverterScript;
        fs::permissions(converter_, fs::perms::owner_all);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path Document(const std::string &name, const std::string &content)
    {
        auto p = dir_ / name;
        std::ofstream(p) << content;
        return p;
    }

    static std::string Slurp(const fs::path &p)
    {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    OfficeOptions Options(const std::string &binary)
    {
        return OfficeOptions{.binary = binary, .scratch_root = dir_};
    }

    fs::path dir_;
    fs::path converter_;
};

} // namespace

TEST_F(OfficeDriverTests, Smoke_RefreshSaveClose)
{
    const auto doc = Document("sales.xlsx", "v1\n");
    OfficeDriver driver(Options(converter_.string()));
    auto app = driver.Construct(true);
    auto res = app->Open(doc.string());
    res->Refresh();
    res->Save();
    res->Close();
    app->Teardown();

    EXPECT_EQ(Slurp(doc), "v1\nrefreshed\n");
}

TEST_F(OfficeDriverTests, Application_ProfileLivesUntilTeardown)
{
    OfficeApplication app(Options("soffice"), true);
    const auto profile = app.Profile();
    EXPECT_TRUE(fs::is_directory(profile));
    EXPECT_EQ(profile.parent_path(), dir_);

    auto argv = app.CommandLine({"--convert-to", "xlsx"});
    EXPECT_EQ(argv.front(), "soffice");
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--headless"), argv.end());
    EXPECT_NE(std::find(argv.begin(), argv.end(), "-env:UserInstallation=file://" + profile.string()),
              argv.end());
    EXPECT_EQ(argv.back(), "xlsx");

    app.Teardown();
    EXPECT_FALSE(fs::exists(profile));
    EXPECT_THROW(app.Open("whatever.xlsx"), std::runtime_error);
}

TEST_F(OfficeDriverTests, Application_ProfileRecalculatesAndUpdatesLinksOnLoad)
{
    OfficeApplication app(Options("soffice"), true);
    const auto settings = app.SettingsFile();
    EXPECT_EQ(settings, app.Profile() / "user" / "registrymodifications.xcu");
    ASSERT_TRUE(fs::is_regular_file(settings));

    const auto xcu = Slurp(settings);
    const std::string load = "<item oor:path=\"/org.openoffice.Office.Calc/Formula/Load\">";
    EXPECT_NE(xcu.find(load + "<prop oor:name=\"OOXMLRecalcMode\" oor:op=\"fuse\"><value>0</value>"),
              std::string::npos);
    EXPECT_NE(xcu.find(load + "<prop oor:name=\"ODFRecalcMode\" oor:op=\"fuse\"><value>0</value>"),
              std::string::npos);
    EXPECT_NE(xcu.find("<item oor:path=\"/org.openoffice.Office.Calc/Content/Update\">"
                       "<prop oor:name=\"Link\" oor:op=\"fuse\"><value>0</value>"),
              std::string::npos);

    // the converter runs against this profile
    auto argv = app.CommandLine({});
    EXPECT_NE(std::find(argv.begin(), argv.end(), "-env:UserInstallation=file://" + app.Profile().string()),
              argv.end());
    app.Teardown();
    EXPECT_FALSE(fs::exists(settings));
}

TEST_F(OfficeDriverTests, Application_MissingScratchRootThrows)
{
    OfficeOptions options{.binary = "soffice", .scratch_root = dir_ / "absent" / "deeper"};
    EXPECT_THROW(OfficeApplication(options, true), std::system_error);
}

TEST_F(OfficeDriverTests, Application_VisibleOmitsHeadless)
{
    OfficeApplication app(Options("soffice"), false);
    auto argv = app.CommandLine({});
    EXPECT_EQ(std::find(argv.begin(), argv.end(), "--headless"), argv.end());
    EXPECT_EQ(std::find(argv.begin(), argv.end(), "--invisible"), argv.end());
}

TEST_F(OfficeDriverTests, Open_RejectsMissingOrExtensionless)
{
    OfficeDriver driver(Options(converter_.string()));
    auto app = driver.Construct(true);
    EXPECT_THROW(app->Open((dir_ / "missing.xlsx").string()), std::runtime_error);
    const auto bare = Document("README", "x");
    EXPECT_THROW(app->Open(bare.string()), std::runtime_error);
    app->Teardown();
}

TEST_F(OfficeDriverTests, Refresh_FailingConverterThrows)
{
    const auto doc = Document("a.ods", "v1\n");
    OfficeDriver driver(Options("false"));
    auto app = driver.Construct(true);
    auto res = app->Open(doc.string());
    EXPECT_THROW(res->Refresh(), std::runtime_error);
    EXPECT_THROW(res->Save(), std::runtime_error);
    res->Close();
    app->Teardown();
    EXPECT_EQ(Slurp(doc), "v1\n");
}

TEST_F(OfficeDriverTests, Worker_SyncsRealFilesThroughDriver)
{
    LogCapture logs;
    const auto a = Document("a.xlsx", "a\n");
    const auto b = Document("b.xlsx", "b\n");
    OfficeDriver driver(Options(converter_.string()));
    SyncOptions options;
    options.retry_delay = std::chrono::milliseconds(0);
    options.refresh_interval = std::chrono::milliseconds(0);

    ResourceSyncWorker worker({a.string(), (dir_ / "gone.xlsx").string(), b.string()}, driver,
                              options);
    std::stop_source never;
    auto report = worker.Run(never.get_token());

    EXPECT_EQ(report.Count(Outcome::synced), 2u);
    EXPECT_EQ(report.Count(Outcome::skipped_missing), 1u);
    EXPECT_EQ(Slurp(a), "a\nrefreshed\n");
    EXPECT_EQ(Slurp(b), "b\nrefreshed\n");
    // only the converter script and the documents remain
    for (const auto &entry : fs::directory_iterator(dir_)) {
        EXPECT_EQ(entry.path().filename().string().rfind("resync-profile-", 0), std::string::npos)
            << entry.path();
    }
}
