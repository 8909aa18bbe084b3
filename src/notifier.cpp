#include "bags/notifier.hpp"
#include "bags/https_client.hpp"
#include "bags/logger.hpp"
#include <cstdio>
#include <memory>
#include <sys/wait.h>
#include <thread>

namespace bags {

std::string SystemNotifier::shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::string SystemNotifier::desktopCommand(const std::string& title, const std::string& body) {
  return "notify-send -t " + std::to_string(kDesktopTimeoutMs) + " " +
         shellQuote(title) + " " + shellQuote(body) + " 2>&1";
}

void SystemNotifier::send(NotificationMethod method, const std::string& topic,
                          const std::string& title, const std::string& body) {
  if (wantsDesktop(method)) {
    std::thread([title, body]() { sendDesktop(title, body); }).detach();
  }
  if (wantsNtfy(method)) {
    if (topic.empty()) {
      LOG_WARN("ntfy notification skipped: no topic configured");
    } else {
      std::thread([topic, title, body]() { sendNtfy(topic, title, body); }).detach();
    }
  }
}

void SystemNotifier::sendDesktop(const std::string& title, const std::string& body) {
  const std::string command = desktopCommand(title, body);
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
  if (!pipe) {
    LOG_WARN("Desktop notification failed: cannot run notify-send");
    return;
  }

  std::string output;
  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe.get()) != nullptr) {
    output += buffer;
  }

  int status = pclose(pipe.release());
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    LOG_WARN("Desktop notification failed: " + (output.empty() ? std::string("notify-send exited with an error") : output));
  }
}

void SystemNotifier::sendNtfy(const std::string& topic, const std::string& title, const std::string& body) {
  try {
    auto response = http::post(kNtfyHost, "/" + http::urlEncode(topic), body, {{"Title", title}});
    if (!response.ok()) {
      LOG_WARN("ntfy notification failed: HTTP " + std::to_string(response.status));
    }
  } catch (const std::exception& e) {
    LOG_WARN(std::string("ntfy notification failed: ") + e.what());
  }
}

} // namespace bags
