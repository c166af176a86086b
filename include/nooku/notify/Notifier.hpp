#pragma once
// include/nooku/notify/Notifier.hpp
//
// Chat-facing message surface. Delivery failures are logged by the caller
// and never interrupt the rotation engine.

#include "nooku/notify/NotificationLog.hpp"
#include "nooku/runtime/Clock.hpp"

#include <cstdio>
#include <string>

namespace nooku::notify {

class INotifier {
public:
    virtual ~INotifier() = default;

    // Returns false when the message could not be delivered.
    virtual bool Post(const std::string& channel, const std::string& text,
                      NotifySeverity severity = NotifySeverity::Info) = 0;
};

// Prints "#channel: text" to a stream and records every message in a NotificationLog.
class ConsoleNotifier final : public INotifier {
public:
    explicit ConsoleNotifier(NotificationLog& log, std::FILE* out = stdout)
        : m_log(log), m_out(out) {}

    bool Post(const std::string& channel, const std::string& text,
              NotifySeverity severity = NotifySeverity::Info) override;

private:
    NotificationLog& m_log;
    std::FILE* m_out;
};

// "HH:MM:SS WARN #channel: text", local time.
[[nodiscard]] std::string FormatNotification(const NotificationEntry& entry, const runtime::IClock& clock);

// Logs and swallows a failed Post().
void PostOrLog(INotifier& notifier, const std::string& channel, const std::string& text,
               NotifySeverity severity = NotifySeverity::Info);

} // namespace nooku::notify
