#pragma once

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "logging/log.hpp"
#include "net/url.hpp"

namespace config {

struct Options {
  // resource sync
  std::vector<std::string> files;
  int max_retries = 5;
  int retry_delay_ms = 2000;
  int refresh_interval_ms = 5000;
  bool visible = false;
  std::string office_binary = "soffice";

  // report session
  std::string webdriver_url = "http://127.0.0.1:9515";
  bool headless = false;
  std::string reporter_url; // $REPORTER_URL
  std::string reporter_id;  // $REPORTER_ID
  std::string template_range;
  std::string template_name;
  int settle_ms = 5000;

  // orchestration
  int pool_size = 5;
  int poll_interval_ms = 1000;
  std::string join = "poll";

  std::string log_file = "resync.log"; // empty disables the file log
  std::string log_level = "debug";

  bool help = false;
  std::vector<std::string> unknown;
};

using EnvLookup = std::function<const char *(const char *)>;

inline const char *ProcessEnv(const char *name) { return std::getenv(name); }

// Environment first, then flags; a flag overrides the environment.
inline Options ParseArgs(int argc, char **argv,
                         const EnvLookup &env = ProcessEnv) {
  Options opt;
  if (const char *v = env("REPORTER_URL")) {
    opt.reporter_url = v;
  }
  if (const char *v = env("REPORTER_ID")) {
    opt.reporter_id = v;
  }
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const bool hasValue = i + 1 < argc;
    if ((a == "-f" || a == "--file") && hasValue)
      opt.files.emplace_back(argv[++i]);
    else if ((a == "-r" || a == "--max-retries") && hasValue)
      opt.max_retries = std::max(1, std::atoi(argv[++i]));
    else if (a == "--retry-delay-ms" && hasValue)
      opt.retry_delay_ms = std::max(0, std::atoi(argv[++i]));
    else if (a == "--refresh-interval-ms" && hasValue)
      opt.refresh_interval_ms = std::max(0, std::atoi(argv[++i]));
    else if (a == "--visible")
      opt.visible = true;
    else if (a == "--office-binary" && hasValue)
      opt.office_binary = argv[++i];
    else if ((a == "-w" || a == "--webdriver") && hasValue)
      opt.webdriver_url = argv[++i];
    else if (a == "--headless")
      opt.headless = true;
    else if ((a == "-u" || a == "--reporter-url") && hasValue)
      opt.reporter_url = argv[++i];
    else if ((a == "-i" || a == "--reporter-id") && hasValue)
      opt.reporter_id = argv[++i];
    else if (a == "--template-range" && hasValue)
      opt.template_range = argv[++i];
    else if (a == "--template-name" && hasValue)
      opt.template_name = argv[++i];
    else if (a == "--settle-ms" && hasValue)
      opt.settle_ms = std::max(0, std::atoi(argv[++i]));
    else if ((a == "-p" || a == "--pool-size") && hasValue)
      opt.pool_size = std::max(1, std::atoi(argv[++i]));
    else if (a == "--poll-interval-ms" && hasValue)
      opt.poll_interval_ms = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-j" || a == "--join") && hasValue)
      opt.join = argv[++i];
    else if ((a == "-l" || a == "--log-file") && hasValue)
      opt.log_file = argv[++i];
    else if (a == "--log-level" && hasValue)
      opt.log_level = argv[++i];
    else if (a == "-h" || a == "--help")
      opt.help = true;
    else if (!a.empty() && a[0] != '-')
      opt.files.push_back(a);
    else
      opt.unknown.push_back(a);
  }
  return opt;
}

// Returns a description of the first problem, nullopt when usable.
inline std::optional<std::string> Validate(const Options &opt) {
  if (!opt.unknown.empty()) {
    return "unknown or incomplete option: " + opt.unknown.front();
  }
  if (opt.files.empty() && opt.reporter_url.empty()) {
    return "nothing to do: give resource files and/or a reporter URL";
  }
  if (opt.join != "poll" && opt.join != "signal") {
    return "join mode must be 'poll' or 'signal', got '" + opt.join + "'";
  }
  if (!logging::ParseLevel(opt.log_level)) {
    return "unknown log level '" + opt.log_level + "'";
  }
  if (!opt.reporter_url.empty()) {
    if (opt.reporter_id.empty()) {
      return "reporter URL given without an operator id (--reporter-id or "
             "$REPORTER_ID)";
    }
    if (opt.template_range.empty() || opt.template_name.empty()) {
      return "reporter URL given without --template-range/--template-name";
    }
    if (!URL::ParseHttpUrl(opt.webdriver_url)) {
      return "invalid WebDriver URL (expected http[s]://host[:port][/path]): " +
             opt.webdriver_url;
    }
  }
  return std::nullopt;
}

inline std::string Usage(const char *prog) {
  std::ostringstream oss;
  oss << "usage: " << prog << " [options] [file...]\n"
      << "  -f, --file PATH            resource to refresh (repeatable)\n"
      << "  -r, --max-retries N        attempts per resource (5)\n"
      << "      --retry-delay-ms MS    wait between attempts (2000)\n"
      << "      --refresh-interval-ms MS  wait after refresh (5000)\n"
      << "      --visible              do not hide the office application\n"
      << "      --office-binary PATH   office executable (soffice)\n"
      << "  -w, --webdriver URL        WebDriver endpoint "
         "(http://127.0.0.1:9515)\n"
      << "      --headless             run the browser headless\n"
      << "  -u, --reporter-url URL     reporting portal ($REPORTER_URL)\n"
      << "  -i, --reporter-id ID       portal operator id ($REPORTER_ID)\n"
      << "      --template-range TEXT  download range option label\n"
      << "      --template-name VALUE  report template option value\n"
      << "      --settle-ms MS         wait after each report request (5000)\n"
      << "  -p, --pool-size N          blocking call threads (5)\n"
      << "      --poll-interval-ms MS  sync liveness poll interval (1000)\n"
      << "  -j, --join poll|signal     how to wait for the sync thread (poll)\n"
      << "  -l, --log-file PATH        log file, empty to disable (resync.log)\n"
      << "      --log-level LEVEL      debug|info|warning|error (debug)\n";
  return oss.str();
}

} // namespace config
