#include "nooku/rotation/PrefetchBuffer.hpp"

#include "core/Log.h"

namespace nooku::rotation {

const char* RotationErrorName(RotationError::Code code) noexcept
{
    switch (code)
    {
    case RotationError::Code::CatalogMiss: return "CatalogMiss";
    case RotationError::Code::DecodeFailure: return "DecodeFailure";
    }
    return "?";
}

std::expected<audio::TrackPtr, RotationError> PrefetchBuffer::Decode(const SelectionKey& key)
{
    const std::filesystem::path* resource = m_catalog.Find(key);
    if (!resource)
        return std::unexpected(RotationError{RotationError::Code::CatalogMiss, key,
                                             "no catalog entry for key " + key.ToString()});

    ++m_decodes;
    auto track = m_decoder.Decode(*resource);
    if (!track)
        return std::unexpected(RotationError{RotationError::Code::DecodeFailure, key,
                                             track.error().message});
    return std::move(*track);
}

std::expected<PrefetchEntry, RotationError> PrefetchBuffer::EnsureCurrent(const SelectionKey& key)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current && m_current->key == key)
            return *m_current;

        if (m_lookahead && m_lookahead->key == key)
        {
            m_current = std::move(m_lookahead);
            m_lookahead.reset();
            LOG_TRACE("Prefetch hit for %s", key.ToString().c_str());
            return *m_current;
        }

        if (m_lookahead && m_lookahead->key.hour == key.hour)
        {
            LOG_INFO("Dropping stale look-ahead %s (wanted %s)",
                     m_lookahead->key.ToString().c_str(), key.ToString().c_str());
            m_lookahead.reset();
        }
    }

    LOG_INFO("Prefetch miss for %s, decoding now", key.ToString().c_str());
    auto track = Decode(key);
    if (!track)
        return std::unexpected(std::move(track.error()));

    std::lock_guard<std::mutex> lock(m_mutex);
    m_current = PrefetchEntry{key, std::move(*track)};
    return *m_current;
}

std::expected<void, RotationError> PrefetchBuffer::EnsureLookahead(const SelectionKey& nextKey)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_lookahead)
        {
            if (m_lookahead->key.hour == nextKey.hour)
                return {};

            LOG_INFO("Dropping look-ahead %s for another hour (next is %s)",
                     m_lookahead->key.ToString().c_str(), nextKey.ToString().c_str());
            m_lookahead.reset();
        }
    }

    auto track = Decode(nextKey);
    if (!track)
        return std::unexpected(std::move(track.error()));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_lookahead)
        m_lookahead = PrefetchEntry{nextKey, std::move(*track)};
    return {};
}

std::optional<SelectionKey> PrefetchBuffer::CurrentKey() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current)
        return std::nullopt;
    return m_current->key;
}

std::optional<SelectionKey> PrefetchBuffer::LookaheadKey() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_lookahead)
        return std::nullopt;
    return m_lookahead->key;
}

std::size_t PrefetchBuffer::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return (m_current ? 1u : 0u) + (m_lookahead ? 1u : 0u);
}

void PrefetchBuffer::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current.reset();
    m_lookahead.reset();
}

} // namespace nooku::rotation
