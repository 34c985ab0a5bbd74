#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

// Capability set of the remote session driver. Every call blocks; run them
// through the blocking bridge when on the reactor thread.
namespace session {

// Any failure reported by the remote session driver.
class SessionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ElementNotFound : public SessionError {
public:
  explicit ElementNotFound(const std::string &selector)
      : SessionError("element not found: " + selector), selector_(selector) {}

  const std::string &Selector() const { return selector_; }

private:
  std::string selector_;
};

// WebDriver key codes (UTF-8 encoded private-use code points)
inline constexpr const char *kKeyControl = "\xEE\x80\x89"; // U+E009
inline constexpr const char *kKeyDelete = "\xEE\x80\x97";  // U+E017

struct ElementHandle {
  std::string id;
};

class IRemoteSession {
public:
  virtual ~IRemoteSession() = default;

  virtual void Navigate(const std::string &url) = 0;
  // Single probe; nullopt when nothing matches right now.
  virtual std::optional<ElementHandle>
  FindElement(const std::string &selector) = 0;
  virtual void SendKeys(const ElementHandle &element,
                        const std::string &text) = 0;
  virtual void Click(const ElementHandle &element) = 0;
  // Picks the option of a select element by its value attribute.
  virtual void SelectOption(const ElementHandle &element,
                            const std::string &value) = 0;
  // Picks the option whose whitespace-normalized label equals `text`.
  virtual void SelectOptionByText(const ElementHandle &element,
                                  const std::string &text) = 0;
  virtual void Dispose() = 0;

  // Probes every `poll` until the element appears or `timeout` elapses, then
  // throws ElementNotFound. Always probes at least once.
  ElementHandle LocateElement(const std::string &selector,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds poll =
                                  std::chrono::milliseconds(1000)) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    for (;;) {
      if (auto el = FindElement(selector)) {
        return *el;
      }
      const auto now = clock::now();
      if (now >= deadline) {
        break;
      }
      std::this_thread::sleep_for(std::min<clock::duration>(poll, deadline - now));
    }
    throw ElementNotFound(selector);
  }
};

class ISessionFactory {
public:
  virtual ~ISessionFactory() = default;
  virtual std::unique_ptr<IRemoteSession> Create() = 0;
};

} // namespace session
