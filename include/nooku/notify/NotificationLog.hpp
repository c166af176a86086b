#pragma once
// include/nooku/notify/NotificationLog.hpp

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace nooku::notify {

enum class NotifySeverity : std::uint8_t
{
    Info = 0,
    Warning,
    Error,
};

[[nodiscard]] inline const char* NotifySeverityName(NotifySeverity s) noexcept
{
    switch (s)
    {
    case NotifySeverity::Info: return "INFO";
    case NotifySeverity::Warning: return "WARN";
    case NotifySeverity::Error: return "ERROR";
    }
    return "?";
}

struct NotificationEntry
{
    std::chrono::system_clock::time_point when{};
    NotifySeverity severity = NotifySeverity::Info;
    std::string channel;
    std::string text;
};

// Bounded, thread-safe history of chat-facing messages (drop oldest on overflow).
class NotificationLog
{
public:
    [[nodiscard]] std::size_t maxEntries() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxEntries;
    }

    void setMaxEntries(std::size_t n)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_maxEntries = std::max<std::size_t>(1u, n);
        trimLocked();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log.clear();
    }

    // Copy, so callers never observe a concurrent push.
    [[nodiscard]] std::vector<NotificationEntry> snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_log;
    }

    // The newest `n` entries, oldest first.
    [[nodiscard]] std::vector<NotificationEntry> recent(std::size_t n) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::size_t skip = m_log.size() > n ? m_log.size() - n : 0u;
        return std::vector<NotificationEntry>(m_log.begin() + static_cast<std::ptrdiff_t>(skip), m_log.end());
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_log.size();
    }

    void push(NotificationEntry e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log.emplace_back(std::move(e));
        trimLocked();
    }

    void push(std::string channel, std::string text, NotifySeverity severity,
              std::chrono::system_clock::time_point when)
    {
        NotificationEntry e{};
        e.when = when;
        e.severity = severity;
        e.channel = std::move(channel);
        e.text = std::move(text);
        push(std::move(e));
    }

private:
    void trimLocked()
    {
        if (m_log.size() <= m_maxEntries)
            return;
        const std::size_t drop = m_log.size() - m_maxEntries;
        m_log.erase(m_log.begin(), m_log.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    mutable std::mutex m_mutex;
    std::size_t m_maxEntries = 200;
    std::vector<NotificationEntry> m_log;
};

} // namespace nooku::notify
