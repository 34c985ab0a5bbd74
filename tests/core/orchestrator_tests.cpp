#include <gtest/gtest.h>
#include "core/orchestrator.hpp"
#include "support/coroutine.hpp"
#include "support/fake_application.hpp"
#include "support/log_capture.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace core;
using resync_test::FakeApplicationDriver;
using resync_test::LogCapture;
using resync_test::RunInCoroutine;
using std::chrono::milliseconds;

namespace {

OrchestratorOptions Options(JoinMode join, milliseconds refresh)
{
    OrchestratorOptions o;
    o.sync.max_retries = 2;
    o.sync.retry_delay = milliseconds(0);
    o.sync.refresh_interval = refresh;
    o.poll_interval = milliseconds(10);
    o.join = join;
    return o;
}

resources::ExistsFn Everything()
{
    return [](const std::string &) { return true; };
}

} // namespace

class OrchestratorJoinTests : public ::testing::TestWithParam<JoinMode>
{
};

TEST_P(OrchestratorJoinTests, RunAll_WaitsForWorkerAndWorkflows)
{
    LogCapture logs;
    net::io_context ioc;
    FakeApplicationDriver driver;
    Orchestrator orchestrator(ioc, driver, Options(GetParam(), milliseconds(30)), Everything());

    std::atomic<bool> workflowRan{false};
    std::vector<SessionWorkflow> workflows;
    workflows.emplace_back([&](net::yield_context yield) {
        retry::WaitAsync(ioc, yield, milliseconds(5));
        workflowRan = true;
    });

    resources::SyncReport report;
    RunInCoroutine(ioc, [&](net::yield_context yield) {
        report = orchestrator.RunAll({"a", "b", "c"}, std::move(workflows), yield);
    });

    EXPECT_TRUE(workflowRan.load());
    EXPECT_EQ(report.Count(resources::Outcome::synced), 3u);
    EXPECT_EQ(driver.State().teardowns, 1);
    EXPECT_EQ(logs.Count(logging::Level::info, "all tasks completed"), 1u);
    if (GetParam() == JoinMode::poll) {
        EXPECT_GE(logs.Count("waiting for resource sync to finish"), 1u);
    } else {
        EXPECT_EQ(logs.Count("waiting for resource sync to finish"), 0u);
    }
}

INSTANTIATE_TEST_SUITE_P(JoinModes, OrchestratorJoinTests,
                         ::testing::Values(JoinMode::poll, JoinMode::signal));

TEST(OrchestratorTests, Workflows_RunConcurrentlyWithWorker)
{
    LogCapture logs;
    net::io_context ioc;
    FakeApplicationDriver driver;
    Orchestrator orchestrator(ioc, driver, Options(JoinMode::signal, milliseconds(100)),
                              Everything());

    // the workflow finishes while the first resource is still in its refresh wait
    int savesSeenByWorkflow = -1;
    std::vector<SessionWorkflow> workflows;
    workflows.emplace_back([&](net::yield_context yield) {
        retry::WaitAsync(ioc, yield, milliseconds(20));
        savesSeenByWorkflow = driver.State().Total(driver.State().saves);
    });

    RunInCoroutine(ioc, [&](net::yield_context yield) {
        orchestrator.RunAll({"a", "b"}, std::move(workflows), yield);
    });
    EXPECT_EQ(savesSeenByWorkflow, 0);
    EXPECT_EQ(driver.State().Total(driver.State().saves), 2);
}

TEST(OrchestratorTests, Workflows_AllRunAndFirstFailureIsRethrown)
{
    LogCapture logs;
    net::io_context ioc;
    FakeApplicationDriver driver;
    Orchestrator orchestrator(ioc, driver, Options(JoinMode::poll, milliseconds(0)), Everything());

    int completed = 0;
    std::vector<SessionWorkflow> workflows;
    workflows.emplace_back([&](net::yield_context yield) {
        retry::WaitAsync(ioc, yield, milliseconds(5));
        throw std::runtime_error("portal unreachable");
    });
    workflows.emplace_back([&](net::yield_context yield) {
        retry::WaitAsync(ioc, yield, milliseconds(20));
        ++completed;
    });

    EXPECT_THROW(RunInCoroutine(ioc,
                                [&](net::yield_context yield) {
                                    orchestrator.RunAll({"a"}, std::move(workflows), yield);
                                }),
                 std::runtime_error);
    EXPECT_EQ(completed, 1);
    // the worker still ran to completion before the failure surfaced
    EXPECT_EQ(driver.State().Total(driver.State().saves), 1);
    EXPECT_EQ(driver.State().teardowns, 1);
    EXPECT_EQ(logs.Count(logging::Level::error, "session workflow failed: portal unreachable"),
              1u);
}

TEST(OrchestratorTests, Stop_BeforeRunAllSkipsAllResources)
{
    LogCapture logs;
    net::io_context ioc;
    FakeApplicationDriver driver;
    Orchestrator orchestrator(ioc, driver, Options(JoinMode::signal, milliseconds(0)),
                              Everything());
    orchestrator.RequestStop();

    resources::SyncReport report;
    RunInCoroutine(ioc, [&](net::yield_context yield) {
        report = orchestrator.RunAll({"a", "b"}, {}, yield);
    });
    EXPECT_TRUE(report.stopped);
    EXPECT_EQ(driver.State().Total(driver.State().opens), 0);
    EXPECT_EQ(report.Count(resources::Outcome::not_started), 2u);
}

TEST(OrchestratorTests, Stop_IsIdempotent)
{
    LogCapture logs;
    net::io_context ioc;
    FakeApplicationDriver driver;
    Orchestrator orchestrator(ioc, driver, Options(JoinMode::poll, milliseconds(0)), Everything());
    RunInCoroutine(ioc, [&](net::yield_context yield) { orchestrator.RunAll({"a"}, {}, yield); });

    orchestrator.Stop();
    orchestrator.Stop();
    EXPECT_LE(logs.Count("resource sync thread stopped"), 1u);
    EXPECT_EQ(driver.State().Total(driver.State().opens), 1);
}
