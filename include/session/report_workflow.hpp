#pragma once

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <string>

#include "logging/log.hpp"
#include "retry/errors.hpp"
#include "session/report_session.hpp"

namespace session {

struct ReportPlan {
  ReportTemplate report_template;
  std::string from_date;
  std::string to_date;
  int first_panel = 0;
  int second_tab = 2;
  int second_panel = 1;
  std::chrono::milliseconds settle{5000};
};

// Login, open the template, request the report on the first panel, switch
// tab and request it on the second panel. Failures are logged here; the
// remote session is closed on every path. Returns true when every step
// succeeded.
inline bool RunReportWorkflow(ReportSession &s, const ReportPlan &plan,
                              net::yield_context yield) {
  bool ok = false;
  std::string failure;
  try {
    s.Start(yield);
    s.Login(yield);
    s.CallTemplate(plan.report_template, yield);
    s.FilterByDate(plan.from_date, plan.to_date, plan.first_panel, yield);
    s.Settle(plan.settle, yield);
    s.SelectTab(plan.second_tab, yield);
    s.FilterByDate(plan.from_date, plan.to_date, plan.second_panel, yield);
    s.Settle(plan.settle, yield);
    ok = true;
  } catch (const retry::OperationExhausted &e) {
    failure = "gave up on " + e.Operation() + ": " + e.what();
  } catch (const std::exception &e) {
    failure = e.what();
  }
  if (!ok) {
    RESYNC_LOG_ERROR(ReportSession::kComponent,
                     "report workflow aborted: " << failure);
  }
  s.Close(yield);
  return ok;
}

} // namespace session
