#pragma once
// include/nooku/rotation/PrefetchBuffer.hpp
//
// Single-slot look-ahead decode cache.
//
// Holds at most two entries, front first:
//   [current]    the entry most recently handed out by EnsureCurrent()
//   [lookahead]  the decoded track for the next hour slot
// Decoding always happens with the buffer mutex released.

#include "nooku/audio/Track.hpp"
#include "nooku/rotation/SelectionKey.hpp"
#include "nooku/rotation/SongCatalog.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>

namespace nooku::rotation {

struct RotationError {
    enum class Code {
        CatalogMiss,
        DecodeFailure,
    } code{};
    SelectionKey key;
    std::string message;
};

[[nodiscard]] const char* RotationErrorName(RotationError::Code code) noexcept;

struct PrefetchEntry
{
    SelectionKey key;
    audio::TrackPtr track;
};

class PrefetchBuffer {
public:
    static constexpr std::size_t kCapacity = 2;

    PrefetchBuffer(const SongCatalog& catalog, audio::ITrackDecoder& decoder)
        : m_catalog(catalog), m_decoder(decoder) {}

    PrefetchBuffer(const PrefetchBuffer&)            = delete;
    PrefetchBuffer& operator=(const PrefetchBuffer&) = delete;

    // Current entry for `key`: reuses the current entry, promotes a matching
    // look-ahead, or decodes synchronously. A look-ahead decoded for the same
    // hour under different weather is stale and dropped on a miss.
    // On failure the buffer keeps its previous current entry.
    std::expected<PrefetchEntry, RotationError> EnsureCurrent(const SelectionKey& key);

    // Decodes and stores the look-ahead for `nextKey` unless one for that hour
    // is already held.
    std::expected<void, RotationError> EnsureLookahead(const SelectionKey& nextKey);

    [[nodiscard]] std::optional<SelectionKey> CurrentKey() const;
    [[nodiscard]] std::optional<SelectionKey> LookaheadKey() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::size_t DecodeCount() const noexcept { return m_decodes.load(); }

    void Clear();

private:
    std::expected<audio::TrackPtr, RotationError> Decode(const SelectionKey& key);

    const SongCatalog& m_catalog;
    audio::ITrackDecoder& m_decoder;

    mutable std::mutex m_mutex;
    std::optional<PrefetchEntry> m_current;
    std::optional<PrefetchEntry> m_lookahead;
    std::atomic<std::size_t> m_decodes{0};
};

} // namespace nooku::rotation
