#pragma once
// include/nooku/rotation/SongCatalog.hpp
//
// Immutable key -> resource mapping, built once from a catalog source.
//
// Each entry's file name starts with its three-character legacy key
// ("105 rain at five.mp3"). Entries are ingested in file-name order so the
// duplicate policy has a well-defined meaning; the reserved prefix "REA"
// (README and friends) is never ingested.

#include "nooku/rotation/SelectionKey.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nooku::rotation {

inline constexpr std::string_view kReservedCatalogPrefix = "REA";

enum class DuplicatePolicy : std::uint8_t
{
    LastWins = 0,
    FirstWins,
    Reject,
};

[[nodiscard]] std::optional<DuplicatePolicy> ParseDuplicatePolicy(std::string_view text) noexcept;

struct CatalogEntry
{
    std::string prefix;            // literal 3-char key as found in the source
    std::filesystem::path resource;
};

struct CatalogError {
    enum class Code {
        SourceUnreadable,
        DuplicateKey,
    } code{};
    std::string message;
};

class SongCatalog {
public:
    SongCatalog() = default;

    [[nodiscard]] static std::expected<SongCatalog, CatalogError>
    ScanDirectory(const std::filesystem::path& dir, DuplicatePolicy policy = DuplicatePolicy::LastWins);

    [[nodiscard]] static std::expected<SongCatalog, CatalogError>
    FromEntries(std::span<const CatalogEntry> entries, DuplicatePolicy policy = DuplicatePolicy::LastWins);

    [[nodiscard]] const std::filesystem::path* Find(const SelectionKey& key) const;
    [[nodiscard]] bool Contains(const SelectionKey& key) const { return Find(key) != nullptr; }
    [[nodiscard]] std::size_t Size() const noexcept { return m_songs.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_songs.empty(); }

    // Sorted by legacy string form.
    [[nodiscard]] std::vector<SelectionKey> Keys() const;

private:
    std::unordered_map<SelectionKey, std::filesystem::path, SelectionKeyHash> m_songs;
};

} // namespace nooku::rotation
