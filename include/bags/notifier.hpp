#pragma once
#include <string>
#include "domain.hpp"

namespace bags {

// Fire-and-forget delivery of alert notifications. Failures are logged, never reported back.
class Notifier {
public:
  virtual ~Notifier() = default;
  virtual void send(NotificationMethod method, const std::string& topic,
                    const std::string& title, const std::string& body) = 0;
};

/**
 * Desktop popups through notify-send, remote pushes through ntfy.sh.
 * Each delivery runs on its own detached thread.
 */
class SystemNotifier : public Notifier {
public:
  static constexpr int kDesktopTimeoutMs = 5000;
  static constexpr const char* kNtfyHost = "ntfy.sh";

  void send(NotificationMethod method, const std::string& topic,
            const std::string& title, const std::string& body) override;

  static std::string desktopCommand(const std::string& title, const std::string& body);
  // Single-quotes a string for /bin/sh
  static std::string shellQuote(const std::string& value);

private:
  static void sendDesktop(const std::string& title, const std::string& body);
  static void sendNtfy(const std::string& topic, const std::string& title, const std::string& body);
};

} // namespace bags
