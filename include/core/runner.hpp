#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "bridge/blocking_bridge.hpp"
#include "config/options.hpp"
#include "core/orchestrator.hpp"
#include "core/reactor.hpp"
#include "logging/file_logger.hpp"
#include "logging/log.hpp"
#include "net/url.hpp"
#include "resources/office_driver.hpp"
#include "session/report_session.hpp"
#include "session/report_workflow.hpp"
#include "session/webdriver_session.hpp"
#include "util/time.hpp"

// Runner composition/threading overview:
// - Reactor: runs io_context on 1 thread, hosts RunAll and the report session
//   coroutines
// - BlockingBridge: fixed thread pool for WebDriver calls, results are posted
//   back to the reactor
// - ResourceSyncWorker: dedicated jthread started by the Orchestrator, owns
//   the office application
// - FileLogger: dedicated jthread; drains the log queue with writev
// - Main thread: waits for RunAll to finish, then stops the reactor and joins
//   components
namespace core {

inline constexpr const char *kRunnerComponent = "runner";

// 0 everything done, 2 some resource was abandoned or the report workflow
// failed. Fatal errors are reported as 1 by Run().
inline int ExitCode(const resources::SyncReport &report, bool reportOk) {
  if (report.Count(resources::Outcome::abandoned) > 0 || !reportOk) {
    return 2;
  }
  return 0;
}

inline OrchestratorOptions MakeOrchestratorOptions(const config::Options &opt) {
  OrchestratorOptions oo;
  oo.sync.max_retries = opt.max_retries;
  oo.sync.retry_delay = std::chrono::milliseconds(opt.retry_delay_ms);
  oo.sync.refresh_interval = std::chrono::milliseconds(opt.refresh_interval_ms);
  oo.sync.hidden = !opt.visible;
  oo.poll_interval = std::chrono::milliseconds(opt.poll_interval_ms);
  oo.join = opt.join == "signal" ? JoinMode::signal : JoinMode::poll;
  return oo;
}

inline int RunComponents(const config::Options &opt) {
  namespace net = boost::asio;

  Reactor reactor;
  auto &ioc = reactor.GetIoContext();
  bridge::BlockingBridge bridge(ioc, static_cast<std::size_t>(opt.pool_size));
  resources::OfficeDriver office(resources::OfficeOptions{
      .binary = opt.office_binary,
      .scratch_root = resources::fs::temp_directory_path()});
  Orchestrator orchestrator(ioc, office, MakeOrchestratorOptions(opt));

  std::unique_ptr<session::WebDriverSessionFactory> factory;
  std::unique_ptr<session::ReportSession> report;
  std::vector<SessionWorkflow> workflows;
  bool reportOk = true; // written on the reactor thread before `done` is set
  if (!opt.reporter_url.empty()) {
    auto endpoint = URL::ParseHttpUrl(opt.webdriver_url);
    if (!endpoint) {
      RESYNC_LOG_ERROR(kRunnerComponent,
                       "invalid WebDriver URL: " << opt.webdriver_url);
      return 1;
    }
    factory = std::make_unique<session::WebDriverSessionFactory>(
        *endpoint, opt.headless);
    report = std::make_unique<session::ReportSession>(
        ioc, bridge, *factory, opt.reporter_url, opt.reporter_id);
    const std::string today = timeutil::Today();
    session::ReportPlan plan{
        .report_template = {opt.template_range, opt.template_name},
        .from_date = today,
        .to_date = today,
        .settle = std::chrono::milliseconds(opt.settle_ms)};
    workflows.emplace_back([&report, &reportOk, plan](net::yield_context y) {
      reportOk = session::RunReportWorkflow(*report, plan, y);
    });
  }

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&orchestrator](const boost::system::error_code &ec,
                                     int signo) {
    if (ec) {
      return;
    }
    RESYNC_LOG_WARN(kRunnerComponent,
                    "signal " << signo
                              << " received, stopping after current resource");
    orchestrator.RequestStop();
  });

  RESYNC_LOG_INFO(kRunnerComponent,
                  "starting: " << opt.files.size() << " resource(s), "
                               << workflows.size() << " session workflow(s), "
                               << "bridge pool " << bridge.PoolSize());

  std::promise<int> done;
  auto result = done.get_future();
  net::spawn(ioc, [&](net::yield_context yield) {
    int code = 1;
    std::string error;
    try {
      auto summary = orchestrator.RunAll(opt.files, std::move(workflows), yield);
      code = ExitCode(summary, reportOk);
      RESYNC_LOG_INFO(kRunnerComponent,
                      "finished: "
                          << summary.Count(resources::Outcome::synced)
                          << " synced, "
                          << summary.Count(resources::Outcome::skipped_missing)
                          << " missing, "
                          << summary.Count(resources::Outcome::abandoned)
                          << " abandoned"
                          << (summary.stopped ? " (stopped early)" : ""));
    } catch (const std::exception &e) {
      error = e.what();
    }
    if (!error.empty()) {
      RESYNC_LOG_ERROR(kRunnerComponent, "run failed: " << error);
    }
    boost::system::error_code ignored;
    signals.cancel(ignored);
    done.set_value(code);
  });

  reactor.Start();
  const int code = result.get();
  reactor.Stop();
  reactor.Join();
  return code;
}

inline int Run(const config::Options &opt) {
  if (auto level = logging::ParseLevel(opt.log_level)) {
    logging::SetThreshold(*level);
  }

  std::unique_ptr<logging::FileLogger> fileLog;
  if (!opt.log_file.empty()) {
    fileLog = std::make_unique<logging::FileLogger>(opt.log_file);
    if (fileLog->OpenOk()) {
      fileLog->Start();
      logging::SetFileSink(
          [sink = fileLog.get()](std::string_view line) { sink->Push(line); });
    } else {
      RESYNC_LOG_WARN(kRunnerComponent,
                      "cannot open log file " << opt.log_file
                                              << ", logging to console only");
      fileLog.reset();
    }
  }

  const int code = RunComponents(opt);

  logging::SetFileSink(nullptr);
  if (fileLog) {
    fileLog->Join();
    if (fileLog->Dropped() > 0) {
      std::cerr << "[runner] " << fileLog->Dropped()
                << " log line(s) dropped from " << opt.log_file << "\n";
    }
  }
  return code;
}

} // namespace core
