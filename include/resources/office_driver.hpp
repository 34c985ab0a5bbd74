#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "resources/app_driver.hpp"
#include "util/process.hpp"

namespace resources {

namespace fs = std::filesystem;

// Calc settings seeded into every private profile. A fresh profile would
// keep cached formula results and never update external links on load, so
// the converted copy would not be refreshed. 0 means "always" for the recalc
// modes and for the link update mode.
inline constexpr const char *kProfileSettings =
    R"XCU(<?xml version="1.0" encoding="UTF-8"?>
<oor:items xmlns:oor="http://openoffice.org/2001/registry" xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance">
<item oor:path="/org.openoffice.Office.Calc/Formula/Load"><prop oor:name="OOXMLRecalcMode" oor:op="fuse"><value>0</value></prop></item>
<item oor:path="/org.openoffice.Office.Calc/Formula/Load"><prop oor:name="ODFRecalcMode" oor:op="fuse"><value>0</value></prop></item>
<item oor:path="/org.openoffice.Office.Calc/Content/Update"><prop oor:name="Link" oor:op="fuse"><value>0</value></prop></item>
</oor:items>
)XCU";

struct OfficeOptions {
  std::string binary = "soffice";
  fs::path scratch_root = fs::temp_directory_path();
};

// LibreOffice in headless mode as the external spreadsheet application.
// - ApplicationHandle: a private user profile directory, so concurrent or
//   crashed instances never share state. It is seeded with kProfileSettings
//   so loading recalculates formulas and updates links; teardown deletes it
// - ResourceHandle: a scratch directory under the profile. Refresh loads the
//   document and writes a recalculated copy there (--convert-to into the
//   same format), Save copies it over the original, Close removes the scratch
//   directory
// Every soffice invocation blocks until the child exits.
class OfficeApplication : public IApplication {
public:
  OfficeApplication(OfficeOptions options, bool hidden)
      : options_(std::move(options)), hidden_(hidden) {
    auto dir = proc::MakeTempDir(options_.scratch_root, "resync-profile-");
    if (!dir) {
      throw std::system_error(dir.error(), "create office profile directory");
    }
    profile_ = *dir;
    SeedSettings();
  }

  ~OfficeApplication() override {
    if (!torn_down_) {
      std::error_code ec;
      fs::remove_all(profile_, ec);
    }
  }

  std::unique_ptr<IResource> Open(const std::string &path) override;

  void Teardown() override {
    torn_down_ = true;
    fs::remove_all(profile_); // throws filesystem_error
  }

  bool TornDown() const { return torn_down_; }
  const fs::path &Profile() const { return profile_; }
  fs::path SettingsFile() const {
    return profile_ / "user" / "registrymodifications.xcu";
  }

  std::vector<std::string> CommandLine(std::vector<std::string> args) const {
    std::vector<std::string> argv{options_.binary};
    if (hidden_) {
      argv.emplace_back("--headless");
      argv.emplace_back("--invisible");
    }
    argv.emplace_back("--norestore");
    argv.emplace_back("--nologo");
    argv.emplace_back("-env:UserInstallation=file://" + profile_.string());
    for (auto &a : args) {
      argv.push_back(std::move(a));
    }
    return argv;
  }

private:
  void SeedSettings() {
    const auto file = SettingsFile();
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (!ec) {
      std::ofstream out(file, std::ios::trunc);
      out << kProfileSettings;
      out.close();
      if (out) {
        return;
      }
    }
    fs::remove_all(profile_, ec);
    throw std::runtime_error("seed office profile settings in " +
                             profile_.string());
  }

  OfficeOptions options_;
  bool hidden_;
  fs::path profile_;
  bool torn_down_ = false;
};

class OfficeDocument : public IResource {
public:
  OfficeDocument(const OfficeApplication &app, fs::path path, fs::path scratch)
      : app_(app), path_(std::move(path)), scratch_(std::move(scratch)) {}

  void Refresh() override {
    if (app_.TornDown()) {
      throw std::runtime_error("office application is gone");
    }
    const std::string format = path_.extension().string().substr(1);
    auto argv = app_.CommandLine(
        {"--convert-to", format, "--outdir", scratch_.string(), path_.string()});
    auto rc = proc::RunProcess(argv);
    if (!rc) {
      throw std::system_error(rc.error(), "spawn " + argv.front());
    }
    if (*rc != 0) {
      throw std::runtime_error(argv.front() + " exited with status " +
                               std::to_string(*rc) + " for " + path_.string());
    }
  }

  void Save() override {
    const fs::path refreshed = scratch_ / path_.filename();
    if (!fs::exists(refreshed)) {
      throw std::runtime_error("no refreshed copy of " + path_.string());
    }
    fs::copy_file(refreshed, path_, fs::copy_options::overwrite_existing);
  }

  void Close() override { fs::remove_all(scratch_); }

private:
  const OfficeApplication &app_;
  fs::path path_;
  fs::path scratch_;
};

inline std::unique_ptr<IResource> OfficeApplication::Open(const std::string &path) {
  if (torn_down_) {
    throw std::runtime_error("office application is gone");
  }
  const fs::path p(path);
  if (!fs::is_regular_file(p)) {
    throw std::runtime_error("not a regular file: " + path);
  }
  if (p.extension().string().size() < 2) {
    throw std::runtime_error("no file format extension: " + path);
  }
  auto scratch = proc::MakeTempDir(profile_, "doc-");
  if (!scratch) {
    throw std::system_error(scratch.error(), "create scratch directory");
  }
  return std::make_unique<OfficeDocument>(*this, p, *scratch);
}

class OfficeDriver : public IApplicationDriver {
public:
  explicit OfficeDriver(OfficeOptions options = {})
      : options_(std::move(options)) {}

  std::unique_ptr<IApplication> Construct(bool hidden) override {
    return std::make_unique<OfficeApplication>(options_, hidden);
  }

private:
  OfficeOptions options_;
};

} // namespace resources
