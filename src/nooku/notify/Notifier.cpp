#include "nooku/notify/Notifier.hpp"

#include "core/Log.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace nooku::notify {

bool ConsoleNotifier::Post(const std::string& channel, const std::string& text, NotifySeverity severity)
{
    m_log.push(channel, text, severity, std::chrono::system_clock::now());

    if (!m_out)
        return false;
    if (std::fprintf(m_out, "#%s: %s\n", channel.c_str(), text.c_str()) < 0)
        return false;
    return std::fflush(m_out) == 0;
}

std::string FormatNotification(const NotificationEntry& entry, const runtime::IClock& clock)
{
    const std::tm local = clock.ToLocal(entry.when);
    char stamp[16];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d", local.tm_hour, local.tm_min, local.tm_sec);
    return std::string(stamp) + " " + NotifySeverityName(entry.severity) + " #" + entry.channel + ": " + entry.text;
}

void PostOrLog(INotifier& notifier, const std::string& channel, const std::string& text, NotifySeverity severity)
{
    if (!notifier.Post(channel, text, severity))
        LOG_WARN("Error sending message to #%s: %s", channel.c_str(), text.c_str());
}

} // namespace nooku::notify
