#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

// Capability set of the external application the resource sync worker
// drives. All calls block and may throw; the worker treats every throw as a
// retryable failure of the current attempt.
namespace resources {

// ResourceHandle: one opened resource. Only valid while the application that
// opened it is alive.
class IResource {
public:
  virtual ~IResource() = default;
  virtual void Refresh() = 0;
  virtual void Save() = 0;
  virtual void Close() = 0;
};

// ApplicationHandle: the external application process hosting resources.
class IApplication {
public:
  virtual ~IApplication() = default;
  virtual std::unique_ptr<IResource> Open(const std::string &path) = 0;
  // Ends the application; every resource it opened becomes invalid.
  virtual void Teardown() = 0;
};

class IApplicationDriver {
public:
  virtual ~IApplicationDriver() = default;
  virtual std::unique_ptr<IApplication> Construct(bool hidden) = 0;
};

using ExistsFn = std::function<bool(const std::string &)>;

inline bool FileExists(const std::string &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

} // namespace resources
