#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

#include "resources/app_driver.hpp"

namespace resync_test {

// Scriptable in-memory application driver. Counters are keyed by resource
// path and guarded by one mutex, so the worker may run on its own thread.
struct FakeApplicationState
{
    std::mutex mutex;

    // scripting
    std::set<std::string> always_fail_refresh;
    std::map<std::string, int> fail_first_refreshes;
    int construct_failures = 0;
    bool teardown_throws = false;
    std::function<void(const std::string &)> on_saved;

    // observations
    std::map<std::string, int> opens;
    std::map<std::string, int> refreshes;
    std::map<std::string, int> saves;
    std::map<std::string, int> closes;
    int constructs = 0;
    int teardowns = 0;
    int live_apps = 0;
    int max_live_apps = 0;
    bool last_hidden = false;

    int Get(const std::map<std::string, int> &m, const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = m.find(key);
        return it == m.end() ? 0 : it->second;
    }

    int Total(const std::map<std::string, int> &m)
    {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto &[key, count] : m) {
            n += count;
        }
        return n;
    }
};

class FakeResource : public resources::IResource
{
public:
    FakeResource(std::shared_ptr<FakeApplicationState> state, std::string path)
        : state_(std::move(state)), path_(std::move(path))
    {
    }

    void Refresh() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        int &n = state_->refreshes[path_];
        ++n;
        if (state_->always_fail_refresh.count(path_) > 0) {
            throw std::runtime_error("refresh failed for " + path_);
        }
        auto it = state_->fail_first_refreshes.find(path_);
        if (it != state_->fail_first_refreshes.end() && n <= it->second) {
            throw std::runtime_error("transient refresh failure for " + path_);
        }
    }

    void Save() override
    {
        std::function<void(const std::string &)> hook;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->saves[path_];
            hook = state_->on_saved;
        }
        if (hook) {
            hook(path_);
        }
    }

    void Close() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->closes[path_];
    }

private:
    std::shared_ptr<FakeApplicationState> state_;
    std::string path_;
};

class FakeApplication : public resources::IApplication
{
public:
    explicit FakeApplication(std::shared_ptr<FakeApplicationState> state)
        : state_(std::move(state))
    {
    }

    std::unique_ptr<resources::IResource> Open(const std::string &path) override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->opens[path];
        }
        return std::make_unique<FakeResource>(state_, path);
    }

    void Teardown() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->teardowns;
        --state_->live_apps;
        if (state_->teardown_throws) {
            throw std::runtime_error("application refused to quit");
        }
    }

private:
    std::shared_ptr<FakeApplicationState> state_;
};

class FakeApplicationDriver : public resources::IApplicationDriver
{
public:
    FakeApplicationDriver() : state_(std::make_shared<FakeApplicationState>()) {}

    std::unique_ptr<resources::IApplication> Construct(bool hidden) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->constructs;
        state_->last_hidden = hidden;
        if (state_->construct_failures > 0) {
            --state_->construct_failures;
            throw std::runtime_error("application failed to start");
        }
        ++state_->live_apps;
        state_->max_live_apps = std::max(state_->max_live_apps, state_->live_apps);
        return std::make_unique<FakeApplication>(state_);
    }

    FakeApplicationState &State() { return *state_; }

private:
    std::shared_ptr<FakeApplicationState> state_;
};

} // namespace resync_test
