#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "bridge/blocking_bridge.hpp"
#include "logging/log.hpp"
#include "retry/async_retry.hpp"
#include "retry/errors.hpp"
#include "retry/policy.hpp"
#include "session/remote_session.hpp"

namespace session {

namespace net = boost::asio;

enum class SessionState {
  not_started,
  logged_in,
  template_selected,
  date_filtered,
  closed,
  failed
};

inline const char *StateName(SessionState s) {
  switch (s) {
  case SessionState::not_started:
    return "not_started";
  case SessionState::logged_in:
    return "logged_in";
  case SessionState::template_selected:
    return "template_selected";
  case SessionState::date_filtered:
    return "date_filtered";
  case SessionState::closed:
    return "closed";
  case SessionState::failed:
    return "failed";
  }
  return "unknown";
}

class InvalidTransition : public std::logic_error {
public:
  InvalidTransition(const std::string &operation, SessionState state)
      : std::logic_error(operation + " is not valid in state " +
                         StateName(state)) {}
};

// CSS selectors of the reporting portal's controls. Per-panel and per-tab
// controls are the prefix followed by the panel or tab number.
struct PortalLayout {
  std::string operator_id_input = "#logon-operator-id";
  std::string logon_button = "#logon-btn";
  std::string template_title = "#template-title-span";
  std::string range_select = "#download-open-range-select";
  std::string template_select = "#template-download-select";
  std::string template_create_button = "#template-creation-btn";
  std::string from_date_prefix = "#panel-td-input-from-date-";
  std::string to_date_prefix = "#panel-td-input-to-date-";
  std::string create_report_prefix = "#panel-td-create-report-";
  std::string tab_prefix = "#normal-title";
};

struct ReportTemplate {
  std::string range; // visible label of the download range option
  std::string name;  // option value of the template select
};

struct SessionTiming {
  int max_attempts = 3;
  std::chrono::milliseconds retry_delay{2000};
  std::chrono::milliseconds element_timeout{10000};
  std::chrono::milliseconds element_poll{1000};
  std::chrono::milliseconds step_settle{2000};
  std::chrono::milliseconds tab_settle{1000};
};

// ReportSession
// Drives one reporting portal session through
//   not_started -> logged_in -> template_selected -> date_filtered
// Threading model:
// - All methods run as coroutines on the reactor thread
// - Every remote driver call is a blocking call executed on the bridge pool
// - Each step is retried as a whole on SessionError; a step that fails for
//   good leaves the session in `failed`, where only Close() is accepted
class ReportSession {
public:
  static constexpr const char *kComponent = "report_session";

  ReportSession(net::io_context &ioc, bridge::BlockingBridge &bridge,
                ISessionFactory &factory, std::string url,
                std::string operatorId, PortalLayout layout = {},
                SessionTiming timing = {})
      : ioc_(ioc), bridge_(bridge), factory_(factory), url_(std::move(url)),
        operator_id_(std::move(operatorId)), layout_(std::move(layout)),
        timing_(timing) {}

  ReportSession(const ReportSession &) = delete;
  ReportSession &operator=(const ReportSession &) = delete;

  SessionState State() const { return state_; }
  bool HasDriver() const { return driver_ != nullptr; }

  // Creates the remote session (browser).
  void Start(net::yield_context yield) {
    Require("start", {SessionState::not_started});
    if (driver_) {
      throw InvalidTransition("start (already started)", state_);
    }
    Step("start", yield, [this](net::yield_context y) {
      driver_ = bridge_.Run([this] { return factory_.Create(); }, y);
      RESYNC_LOG_INFO(kComponent, "remote session created");
    });
  }

  void Login(net::yield_context yield) {
    Require("login", {SessionState::not_started});
    RequireDriver("login");
    Step("login", yield, [this](net::yield_context y) {
      bridge_.Run([this] { driver_->Navigate(url_); }, y);
      RESYNC_LOG_INFO(kComponent, "opened " << url_);
      auto input = Locate(layout_.operator_id_input, y);
      bridge_.Run([&] { driver_->SendKeys(input, operator_id_); }, y);
      auto button = Locate(layout_.logon_button, y);
      bridge_.Run([&] { driver_->Click(button); }, y);
      RESYNC_LOG_INFO(kComponent, "logon submitted");
      retry::WaitAsync(ioc_, y, timing_.step_settle);
    });
    state_ = SessionState::logged_in;
  }

  void CallTemplate(const ReportTemplate &tpl, net::yield_context yield) {
    Require("call template",
            {SessionState::logged_in, SessionState::template_selected});
    Step("call template", yield, [this, &tpl](net::yield_context y) {
      auto title = Locate(layout_.template_title, y);
      bridge_.Run([&] { driver_->Click(title); }, y);
      auto range = Locate(layout_.range_select, y);
      bridge_.Run([&] { driver_->SelectOptionByText(range, tpl.range); }, y);
      RESYNC_LOG_INFO(kComponent, "download range set to '" << tpl.range
                                                             << "'");
      auto name = Locate(layout_.template_select, y);
      bridge_.Run([&] { driver_->SelectOption(name, tpl.name); }, y);
      RESYNC_LOG_INFO(kComponent, "template set to '" << tpl.name << "'");
      auto create = Locate(layout_.template_create_button, y);
      bridge_.Run([&] { driver_->Click(create); }, y);
      retry::WaitAsync(ioc_, y, timing_.step_settle);
    });
    state_ = SessionState::template_selected;
  }

  // Dates are typed as given (YYYY/MM/DD on the portal).
  void FilterByDate(const std::string &from, const std::string &to, int panel,
                    net::yield_context yield) {
    Require("filter by date",
            {SessionState::template_selected, SessionState::date_filtered});
    Step("filter by date", yield, [&, this](net::yield_context y) {
      const std::string p = std::to_string(panel);
      TypeInto(layout_.from_date_prefix + p, from, y);
      RESYNC_LOG_INFO(kComponent, "panel " << p << " start date " << from);
      TypeInto(layout_.to_date_prefix + p, to, y);
      RESYNC_LOG_INFO(kComponent, "panel " << p << " end date " << to);
      auto create = Locate(layout_.create_report_prefix + p, y);
      bridge_.Run([&] { driver_->Click(create); }, y);
      RESYNC_LOG_INFO(kComponent, "report requested on panel " << p);
      retry::WaitAsync(ioc_, y, timing_.step_settle);
    });
    state_ = SessionState::date_filtered;
  }

  void SelectTab(int tab, net::yield_context yield) {
    Require("select tab", {SessionState::date_filtered});
    Step("select tab", yield, [&, this](net::yield_context y) {
      const std::string selector = layout_.tab_prefix + std::to_string(tab);
      auto el = Locate(selector, y);
      bridge_.Run([&] { driver_->Click(el); }, y);
      RESYNC_LOG_INFO(kComponent, "selected tab " << selector);
      retry::WaitAsync(ioc_, y, timing_.tab_settle);
    });
  }

  // Lets the remote UI catch up; suspends the coroutine only.
  void Settle(std::chrono::milliseconds delay, net::yield_context yield) {
    retry::WaitAsync(ioc_, yield, delay);
  }

  // Valid in every state; disposes the remote session once. A dispose
  // failure is logged, the session ends up closed regardless.
  void Close(net::yield_context yield) {
    if (state_ == SessionState::closed) {
      return;
    }
    if (driver_) {
      DisposeDriver(yield);
    }
    state_ = SessionState::closed;
  }

private:
  void Require(const char *operation,
               std::initializer_list<SessionState> allowed) const {
    for (auto s : allowed) {
      if (state_ == s) {
        return;
      }
    }
    throw InvalidTransition(operation, state_);
  }

  void RequireDriver(const char *operation) const {
    if (!driver_) {
      throw InvalidTransition(std::string(operation) + " before start",
                              state_);
    }
  }

  template <typename Op>
  void Step(const char *name, net::yield_context yield, Op op) {
    auto wrapped = retry::WithRetry<retry::RetryOn<SessionError>>(
        ioc_,
        retry::RetryOptions{.name = name,
                            .max_attempts = timing_.max_attempts,
                            .delay = timing_.retry_delay},
        std::move(op));
    try {
      wrapped(yield);
    } catch (...) {
      state_ = SessionState::failed;
      RESYNC_LOG_ERROR(kComponent, name << " failed, session unusable");
      throw;
    }
  }

  ElementHandle Locate(const std::string &selector, net::yield_context yield) {
    return bridge_.Run(
        [&] {
          return driver_->LocateElement(selector, timing_.element_timeout,
                                        timing_.element_poll);
        },
        yield);
  }

  // Select-all, delete, then type.
  void TypeInto(const std::string &selector, const std::string &text,
                net::yield_context yield) {
    auto el = Locate(selector, yield);
    bridge_.Run([&] { driver_->SendKeys(el, std::string(kKeyControl) + "a"); },
                yield);
    bridge_.Run([&] { driver_->SendKeys(el, kKeyDelete); }, yield);
    bridge_.Run([&] { driver_->SendKeys(el, text); }, yield);
  }

  void DisposeDriver(net::yield_context yield) {
    std::string error;
    try {
      bridge_.Run([this] { driver_->Dispose(); }, yield);
      RESYNC_LOG_INFO(kComponent, "remote session closed");
    } catch (const std::exception &e) {
      error = e.what();
    }
    if (!error.empty()) {
      RESYNC_LOG_ERROR(kComponent, "closing remote session failed: " << error);
    }
    driver_.reset();
  }

  net::io_context &ioc_;
  bridge::BlockingBridge &bridge_;
  ISessionFactory &factory_;
  std::string url_;
  std::string operator_id_;
  PortalLayout layout_;
  SessionTiming timing_;
  std::unique_ptr<IRemoteSession> driver_;
  SessionState state_ = SessionState::not_started;
};

} // namespace session
